#pragma once
/** @file  ResourceArbiter.hpp
 *  @brief Tracks which instrument resources are claimed by an open connection.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <set>
#include <string>

namespace rfsweep::core {

  /**
 * @class ResourceArbiter
 * @brief Owned by whatever composes instrument connections and passed to it by
 *        reference, so two identical instruments are never opened through the
 *        same resource twice.
 */
  class ResourceArbiter {
  public:
    /// @returns false if \p resource is already claimed.
    bool claim(const std::string& resource);

    void release(const std::string& resource);

    bool isClaimed(const std::string& resource) const;
    std::size_t claimed() const;

  private:
    std::set<std::string> claimed_;
    mutable std::mutex mtx_;
  };

} // namespace rfsweep::core
