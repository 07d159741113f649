#include <warden/schema/decision.hpp>

#include <algorithm>
#include <cmath>

namespace warden::schema {

uint32_t confidence_bps(const double confidence) {
  const auto clamped = std::clamp(confidence, 0.0, 1.0);
  return static_cast<uint32_t>(std::llround(clamped * 10000.0));
}

double confidence_from_bps(const uint32_t bps) {
  return static_cast<double>(bps) / 10000.0;
}

}  // namespace warden::schema
