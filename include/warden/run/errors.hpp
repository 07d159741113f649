#pragma once
#include <warden/schema/item_outcome.hpp>

#include <stdexcept>
#include <string>

namespace warden::run {

/// The run cannot continue safely: durable state or the proposal feed is out
/// of reach. Items already checkpointed stay as they are.
class fatal_run_error final : public std::runtime_error {
 public:
  fatal_run_error(warden::schema::item_phase_t phase, const std::string& reason)
      : std::runtime_error{std::string{warden::schema::to_string(phase)} +
                           ": " + reason},
        phase_{phase} {}

  warden::schema::item_phase_t phase() const { return phase_; }

 private:
  warden::schema::item_phase_t phase_;
};

/// Another run for the same source key is active.
class run_in_progress_error final : public std::runtime_error {
 public:
  explicit run_in_progress_error(const std::string& source_key)
      : std::runtime_error{"a run for '" + source_key +
                           "' is already in progress"} {}
};

}  // namespace warden::run
