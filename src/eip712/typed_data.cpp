#include <warden/common/critical.hpp>
#include <warden/crypto/keccak.hpp>
#include <warden/eip712/typed_data.hpp>

#include <algorithm>
#include <charconv>
#include <set>

namespace warden::eip712 {

namespace {

const auto kDomainTypes = type_definitions_t{
    {"EIP712Domain",
     {field_t{.name = "name", .type = "string"},
      field_t{.name = "version", .type = "string"},
      field_t{.name = "chainId", .type = "uint256"},
      field_t{.name = "verifyingContract", .type = "address"}}}};

// Bit width of a uintN type, or nullopt when `type` is not one.
std::optional<unsigned> uint_width(const std::string& type) {
  if (!type.starts_with("uint")) {
    return std::nullopt;
  }
  auto width = unsigned{256};
  if (type.size() > 4) {
    const auto* begin = type.data() + 4;
    const auto* end = type.data() + type.size();
    auto [ptr, ec] = std::from_chars(begin, end, width);
    if (ec != std::errc{} || ptr != end) {
      return std::nullopt;
    }
  }
  if (width == 0 || width > 256 || width % 8 != 0) {
    return std::nullopt;
  }
  return width;
}

bool collect_dependencies(const type_definitions_t& types,
                          const std::string& type,
                          std::set<std::string>& found) {
  auto it = types.find(type);
  if (it == std::end(types)) {
    return false;
  }
  if (!found.insert(type).second) {
    return true;
  }
  for (const auto& member : it->second) {
    if (types.contains(member.type) &&
        !collect_dependencies(types, member.type, found)) {
      return false;
    }
  }
  return true;
}

void append_struct_signature(std::string& out,
                             const std::string& name,
                             const std::vector<field_t>& fields) {
  out += name;
  out += '(';
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    out += fields[i].type;
    out += ' ';
    out += fields[i].name;
  }
  out += ')';
}

void append_word(warden::schema::bytes_t& out,
                 const warden::schema::hash32_t& word) {
  out.insert(std::end(out), std::begin(word), std::end(word));
}

std::optional<warden::schema::hash32_t> encode_member(
    const type_definitions_t& types,
    const field_t& member,
    const value_t& member_value) {
  const auto& type = member.type;
  if (types.contains(type)) {
    const auto* nested = std::get_if<struct_value_t>(&member_value.data);
    if (nested == nullptr) {
      return std::nullopt;
    }
    return hash_struct(types, type, *nested);
  }
  if (type == "address") {
    const auto* address =
        std::get_if<warden::schema::address_t>(&member_value.data);
    if (address == nullptr) {
      return std::nullopt;
    }
    auto word = warden::schema::make_zero_hash();
    std::copy(std::begin(*address), std::end(*address), std::begin(word) + 12);
    return word;
  }
  if (type == "bool") {
    const auto* flag = std::get_if<bool>(&member_value.data);
    if (flag == nullptr) {
      return std::nullopt;
    }
    return warden::schema::to_word(
        warden::schema::uint256_t{*flag ? 1 : 0});
  }
  if (type == "string") {
    const auto* str = std::get_if<std::string>(&member_value.data);
    if (str == nullptr) {
      return std::nullopt;
    }
    return warden::crypto::keccak256(std::string_view{*str});
  }
  if (type == "bytes") {
    const auto* bytes =
        std::get_if<warden::schema::bytes_t>(&member_value.data);
    if (bytes == nullptr) {
      return std::nullopt;
    }
    return warden::crypto::keccak256(std::span<const uint8_t>{*bytes});
  }
  if (type == "bytes32") {
    const auto* word =
        std::get_if<warden::schema::hash32_t>(&member_value.data);
    if (word == nullptr) {
      return std::nullopt;
    }
    return *word;
  }
  if (auto width = uint_width(type)) {
    const auto* number =
        std::get_if<warden::schema::uint256_t>(&member_value.data);
    if (number == nullptr) {
      return std::nullopt;
    }
    if (*width < 256 && (*number >> *width) != 0) {
      return std::nullopt;
    }
    return warden::schema::to_word(*number);
  }
  return std::nullopt;
}

}  // namespace

std::string encode_type(const type_definitions_t& types,
                        const std::string& primary) {
  auto dependencies = std::set<std::string>{};
  if (!collect_dependencies(types, primary, dependencies)) {
    return {};
  }
  dependencies.erase(primary);

  auto out = std::string{};
  append_struct_signature(out, primary, types.at(primary));
  for (const auto& name : dependencies) {
    append_struct_signature(out, name, types.at(name));
  }
  return out;
}

std::optional<warden::schema::hash32_t> type_hash(
    const type_definitions_t& types,
    const std::string& primary) {
  auto encoded = encode_type(types, primary);
  if (encoded.empty()) {
    return std::nullopt;
  }
  return warden::crypto::keccak256(std::string_view{encoded});
}

std::optional<warden::schema::hash32_t> hash_struct(
    const type_definitions_t& types,
    const std::string& primary,
    const struct_value_t& values) {
  auto primary_hash = type_hash(types, primary);
  if (!primary_hash) {
    return std::nullopt;
  }
  const auto& fields = types.at(primary);
  if (fields.size() != values.size()) {
    return std::nullopt;
  }

  auto encoded = warden::schema::bytes_t{};
  encoded.reserve(32 * (fields.size() + 1));
  append_word(encoded, *primary_hash);
  for (size_t i = 0; i < fields.size(); ++i) {
    auto word = encode_member(types, fields[i], values[i]);
    if (!word) {
      return std::nullopt;
    }
    append_word(encoded, *word);
  }
  return warden::crypto::keccak256(std::span<const uint8_t>{encoded});
}

warden::schema::hash32_t domain_separator(const domain_t& domain) {
  auto values = struct_value_t{
      value_t{domain.name}, value_t{domain.version},
      value_t{warden::schema::uint256_t{domain.chain_id}},
      value_t{domain.verifying_contract}};
  auto separator = hash_struct(kDomainTypes, "EIP712Domain", values);
  if (!separator) {
    warden::common::critical("failed to hash EIP712Domain");
  }
  return *separator;
}

warden::schema::hash32_t digest(const warden::schema::hash32_t& separator,
                                const warden::schema::hash32_t& struct_hash) {
  auto encoded = warden::schema::bytes_t{};
  encoded.reserve(2 + separator.size() + struct_hash.size());
  encoded.push_back(0x19);
  encoded.push_back(0x01);
  append_word(encoded, separator);
  append_word(encoded, struct_hash);
  return warden::crypto::keccak256(std::span<const uint8_t>{encoded});
}

}  // namespace warden::eip712
