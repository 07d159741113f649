#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::adapters::detail {

/// Split on '\t', keeping everything after the last wanted field in it.
inline std::vector<std::string_view> split_fields(std::string_view line,
                                                  const size_t fields) {
  auto out = std::vector<std::string_view>{};
  while (out.size() + 1 < fields) {
    auto tab = line.find('\t');
    if (tab == std::string_view::npos) {
      break;
    }
    out.push_back(line.substr(0, tab));
    line.remove_prefix(tab + 1);
  }
  out.push_back(line);
  return out;
}

inline bool ignorable(const std::string_view line) {
  return line.empty() || line.front() == '#';
}

/// Lines of `path` without trailing '\r'. nullopt when unreadable.
inline std::optional<std::vector<std::string>> read_lines(
    const std::filesystem::path& path) {
  auto in = std::ifstream{path};
  if (!in) {
    return std::nullopt;
  }
  auto lines = std::vector<std::string>{};
  auto line = std::string{};
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  if (in.bad()) {
    return std::nullopt;
  }
  return lines;
}

}  // namespace warden::adapters::detail
