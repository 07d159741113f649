#include <warden/abi/encode.hpp>

#include <algorithm>

namespace warden::abi {

namespace {

constexpr auto kWordSize = size_t{32};

bool is_dynamic(const argument_t& argument) {
  return std::holds_alternative<std::string>(argument) ||
         std::holds_alternative<warden::schema::bytes_t>(argument);
}

void append_word(warden::schema::bytes_t& out,
                 const warden::schema::hash32_t& word) {
  out.insert(std::end(out), std::begin(word), std::end(word));
}

void append_length_prefixed(warden::schema::bytes_t& out,
                            const warden::schema::bytes_view_t& bytes) {
  append_word(out, warden::schema::to_word(
                       warden::schema::uint256_t{bytes.size()}));
  out.insert(std::end(out), std::begin(bytes), std::end(bytes));
  auto padding = (kWordSize - bytes.size() % kWordSize) % kWordSize;
  out.insert(std::end(out), padding, uint8_t{0});
}

warden::schema::hash32_t static_word(const argument_t& argument) {
  return std::visit(
      overloaded{
          [](const warden::schema::uint256_t& number) {
            return warden::schema::to_word(number);
          },
          [](const warden::schema::hash32_t& word) { return word; },
          [](const warden::schema::address_t& address) {
            auto word = warden::schema::make_zero_hash();
            std::copy(std::begin(address), std::end(address),
                      std::begin(word) + 12);
            return word;
          },
          [](const bool flag) {
            return warden::schema::to_word(
                warden::schema::uint256_t{flag ? 1 : 0});
          },
          [](const auto&) { return warden::schema::make_zero_hash(); }},
      argument);
}

}  // namespace

warden::schema::bytes_t encode(const std::vector<argument_t>& arguments) {
  auto head = warden::schema::bytes_t{};
  auto tail = warden::schema::bytes_t{};
  head.reserve(arguments.size() * kWordSize);
  const auto head_size = arguments.size() * kWordSize;

  for (const auto& argument : arguments) {
    if (!is_dynamic(argument)) {
      append_word(head, static_word(argument));
      continue;
    }
    append_word(head, warden::schema::to_word(
                          warden::schema::uint256_t{head_size + tail.size()}));
    if (const auto* str = std::get_if<std::string>(&argument)) {
      append_length_prefixed(tail, warden::schema::make_bytes_view(*str));
    } else {
      append_length_prefixed(
          tail, warden::schema::make_bytes_view(
                    std::get<warden::schema::bytes_t>(argument)));
    }
  }

  head.insert(std::end(head), std::begin(tail), std::end(tail));
  return head;
}

}  // namespace warden::abi
