#include <spdlog/spdlog.h>
#include <warden/adapters/verdict_file_engine.hpp>

#include "line_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <utility>

namespace warden::adapters {

namespace {

std::optional<double> parse_confidence(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto copy = std::string{text};
  char* end = nullptr;
  errno = 0;
  auto value = std::strtod(copy.c_str(), &end);
  if (errno != 0 || end != copy.c_str() + copy.size()) {
    return std::nullopt;
  }
  if (!(value >= 0.0 && value <= 1.0)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<warden::schema::decision_t> parse_verdict_line(
    const std::string_view line) {
  auto fields = detail::split_fields(line, 5);
  if (fields.size() < 4 || fields[0].empty()) {
    return std::nullopt;
  }
  auto verdict =
      warden::schema::try_from_string<warden::schema::verdict_t>(fields[1]);
  auto confidence = parse_confidence(fields[2]);
  if (!verdict || !confidence) {
    return std::nullopt;
  }
  return warden::schema::decision_t{
      .item_id = std::string{fields[0]},
      .verdict = *verdict,
      .confidence = *confidence,
      .rationale = fields.size() > 4 ? std::string{fields[4]} : std::string{},
      .strategy_applied = std::string{fields[3]}};
}

verdict_file_engine::verdict_file_engine(std::filesystem::path directory)
    : directory_{std::move(directory)} {}

warden::schema::outcome_t<warden::schema::decision_t>
verdict_file_engine::decide(const warden::schema::pending_item_t& item) {
  auto ec = std::error_code{};
  auto files = std::vector<std::filesystem::path>{};
  for (auto it = std::filesystem::directory_iterator{directory_, ec};
       !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
    if (it->path().extension() == ".verdicts") {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return warden::schema::transient_error("cannot list " +
                                           directory_.string() + ": " +
                                           ec.message());
  }
  std::sort(std::begin(files), std::end(files));

  for (const auto& path : files) {
    auto lines = detail::read_lines(path);
    if (!lines) {
      return warden::schema::transient_error("cannot read " + path.string());
    }
    for (const auto& line : *lines) {
      if (detail::ignorable(line)) {
        continue;
      }
      auto id = detail::split_fields(line, 2)[0];
      if (id != item.item_id) {
        continue;
      }
      auto decision = parse_verdict_line(line);
      if (!decision) {
        return warden::schema::permanent_error("malformed verdict for '" +
                                               item.item_id + "' in " +
                                               path.string());
      }
      spdlog::debug("verdict for '{}': {} at {:.2f}", item.item_id,
                    warden::schema::to_string(decision->verdict),
                    decision->confidence);
      return *decision;
    }
  }
  return warden::schema::permanent_error("no verdict for '" + item.item_id +
                                         "'");
}

}  // namespace warden::adapters
