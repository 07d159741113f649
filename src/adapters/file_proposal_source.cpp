#include <spdlog/spdlog.h>
#include <warden/adapters/file_proposal_source.hpp>

#include "line_reader.hpp"

#include <set>
#include <utility>

namespace warden::adapters {

bool valid_source_key(const std::string_view source_key) {
  if (source_key.empty() || source_key == "." || source_key == "..") {
    return false;
  }
  return source_key.find('/') == std::string_view::npos &&
         source_key.find('\\') == std::string_view::npos &&
         source_key.find('\0') == std::string_view::npos;
}

file_proposal_source::file_proposal_source(std::filesystem::path directory)
    : directory_{std::move(directory)} {}

warden::schema::outcome_t<std::vector<warden::schema::pending_item_t>>
file_proposal_source::list_pending(const std::string_view source_key) {
  if (!valid_source_key(source_key)) {
    return warden::schema::permanent_error("invalid source key '" +
                                           std::string{source_key} + "'");
  }
  auto path = directory_ / (std::string{source_key} + ".feed");
  auto ec = std::error_code{};
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      return warden::schema::transient_error("cannot stat " + path.string() +
                                             ": " + ec.message());
    }
    return warden::schema::permanent_error("no feed at " + path.string());
  }
  auto lines = detail::read_lines(path);
  if (!lines) {
    return warden::schema::transient_error("cannot read " + path.string());
  }

  auto items = std::vector<warden::schema::pending_item_t>{};
  auto seen = std::set<std::string>{};
  for (const auto& line : *lines) {
    if (detail::ignorable(line)) {
      continue;
    }
    auto fields = detail::split_fields(line, 3);
    if (fields[0].empty()) {
      spdlog::warn("feed {}: ignoring line without an item id", path.string());
      continue;
    }
    auto item = warden::schema::pending_item_t{
        .item_id = std::string{fields[0]},
        .origin = fields.size() > 1 ? std::string{fields[1]} : std::string{},
        .payload = fields.size() > 2 ? std::string{fields[2]} : std::string{}};
    if (!seen.insert(item.item_id).second) {
      spdlog::warn("feed {}: duplicate item '{}' ignored", path.string(),
                   item.item_id);
      continue;
    }
    items.push_back(std::move(item));
  }
  spdlog::debug("feed {}: {} pending items", path.string(), items.size());
  return items;
}

}  // namespace warden::adapters
