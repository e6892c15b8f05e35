/* @file SweepAxis.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// rfsweep headers
#include "core/Errors.hpp"
#include "protocols/SweepAxis.hpp"

using namespace rfsweep::protocols;

SweepAxis::SweepAxis(int start, int stop, int step) : start_{ start }, stop_{ stop }, step_{ step } {
  if (step_ <= 0)
    throw rfsweep::core::ConfigurationError("sweep step must be positive, got " + std::to_string(step_));
  if (start_ < 0 || stop_ > 0xFF || start_ > stop_)
    throw rfsweep::core::ConfigurationError("sweep range [" + std::to_string(start_) + ", " +
                                   std::to_string(stop_) + "] must be ascending and fit a byte");
}

std::vector<std::uint8_t> SweepAxis::values() const {
  std::vector<std::uint8_t> out;
  out.reserve(size());
  for (int v = start_; v <= stop_; v += step_)
    out.push_back(static_cast<std::uint8_t>(v));
  return out;
}

std::size_t SweepAxis::size() const { return static_cast<std::size_t>((stop_ - start_) / step_ + 1); }
