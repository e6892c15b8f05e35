/* @file ResourceArbiter.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ResourceArbiter.hpp"

using namespace rfsweep::core;

bool ResourceArbiter::claim(const std::string& resource) {
  std::lock_guard<std::mutex> lock(mtx_);
  return claimed_.insert(resource).second;
}

void ResourceArbiter::release(const std::string& resource) {
  std::lock_guard<std::mutex> lock(mtx_);
  claimed_.erase(resource);
}

bool ResourceArbiter::isClaimed(const std::string& resource) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return claimed_.count(resource) != 0;
}

std::size_t ResourceArbiter::claimed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return claimed_.size();
}
