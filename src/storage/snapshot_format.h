/**
 * @file snapshot_format.h
 * @brief Binary format definitions for store snapshot files
 *
 * A snapshot holds the complete persisted state owned by the engine: the
 * feature store and the genre cache.
 *
 * File Format Overview:
 * Every snapshot file starts with an 8-byte fixed header:
 *   - 4 bytes: Magic number "TMIX"
 *   - 4 bytes: Format version (uint32_t, little-endian)
 *
 * The fixed header is followed by version-specific data.
 * See snapshot_format_v1.h for Version 1 format details.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace tastemix::storage {

/**
 * @brief Snapshot file format constants
 */
namespace snapshot_format {

// Magic number for snapshot files ("TMIX" in ASCII)
constexpr std::array<char, 4> kMagicNumber = {'T', 'M', 'I', 'X'};

// Current format version (version we write)
constexpr uint32_t kCurrentVersion = 1;

// Versions we can read
constexpr uint32_t kMaxSupportedVersion = 1;
constexpr uint32_t kMinSupportedVersion = 1;

// Fixed file header size (magic + version)
constexpr size_t kFixedHeaderSize = 8;

// Section names, in the order they are written
constexpr const char* kFeaturesSection = "features";
constexpr const char* kGenresSection = "genres";

/**
 * @brief Header flags (Version 1)
 */
namespace flags_v1 {
constexpr uint32_t kWithCRC = 0x00000010;  // Contains CRC checksums (always set in V1)
}  // namespace flags_v1

/**
 * @brief Which part of a snapshot failed verification
 */
enum class CRCErrorType : std::uint8_t {
  None = 0,
  FileCRC = 1,      // Body checksum or file size mismatch
  FeaturesCRC = 2,  // Feature store section
  GenresCRC = 3,    // Genre cache section
};

/**
 * @brief File integrity error information
 *
 * Filled by VerifySnapshotIntegrity() and ReadSnapshotV1() when a check fails.
 */
struct IntegrityError {
  CRCErrorType type = CRCErrorType::None;
  std::string message;       // Human-readable error message
  std::string section_name;  // Section name for section-level errors

  [[nodiscard]] bool HasError() const { return type != CRCErrorType::None; }
};

}  // namespace snapshot_format

}  // namespace tastemix::storage
