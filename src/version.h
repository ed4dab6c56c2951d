/**
 * @file version.h
 * @brief tastemix version information
 */

#pragma once

#include <cstdint>
#include <string>

namespace tastemix {

/**
 * @brief Version information
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "0.3.0")
   */
  static std::string String() { return "0.3.0"; }

  static int Major() { return 0; }
  static int Minor() { return 3; }
  static int Patch() { return 0; }

  /**
   * @brief Snapshot format version written by this build
   */
  static constexpr uint32_t SnapshotFormat() { return 1; }
};

}  // namespace tastemix
