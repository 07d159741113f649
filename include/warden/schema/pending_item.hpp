#pragma once
#include <string>

namespace warden::schema {

/// One unit of work as delivered by the proposal feed.
struct pending_item final {
  std::string item_id;
  std::string origin;
  std::string payload;
};

using pending_item_t = pending_item;

}  // namespace warden::schema
