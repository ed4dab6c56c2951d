/**
 * @file snapshot_format_v1.h
 * @brief Snapshot file format Version 1 serialization/deserialization
 *
 * File Structure:
 * ┌─────────────────────────────────────────────────────────────┐
 * │ Fixed File Header (8 bytes)                                 │
 * │   - Magic: "TMIX" (4 bytes)                                 │
 * │   - Format Version: 1 (4 bytes)                             │
 * ├─────────────────────────────────────────────────────────────┤
 * │ Version 1 Header                                            │
 * │   - Header Size                                             │
 * │   - Flags (kWithCRC)                                        │
 * │   - Snapshot Timestamp                                      │
 * │   - Total File Size (for truncation detection)              │
 * │   - Body CRC32 (everything after this header)               │
 * │   - Reserved (length-prefixed, empty)                       │
 * ├─────────────────────────────────────────────────────────────┤
 * │ Body                                                        │
 * │   - Section Count (4 bytes): 2                              │
 * │   ┌───────────────────────────────────────────────────────┐ │
 * │   │ For each section ("features", "genres"):              │ │
 * │   │   - Section Name (length-prefixed string)             │ │
 * │   │   - Data Length (4 bytes)                             │ │
 * │   │   - Data CRC32 (4 bytes)                              │ │
 * │   │   - Data (starts with a uint32_t item count)          │ │
 * │   └───────────────────────────────────────────────────────┘ │
 * └─────────────────────────────────────────────────────────────┘
 *
 * All multi-byte integers are stored in little-endian format.
 * All strings are UTF-8 encoded with length-prefix (uint32_t).
 * CRC32 checksums use zlib implementation (polynomial: 0xEDB88320).
 */

#pragma once

#include <iosfwd>
#include <string>

#include "storage/snapshot_format.h"
#include "store/feature_store.h"
#include "store/genre_cache.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::storage::snapshot_v1 {

using utils::Error;
using utils::Expected;

/**
 * @brief Version 1 snapshot header
 *
 * Layout:
 * | Offset | Size | Field             | Description                        |
 * |--------|------|-------------------|------------------------------------|
 * | 0      | 4    | header_size       | Size of V1 header in bytes         |
 * | 4      | 4    | flags             | Feature flags (see flags_v1)       |
 * | 8      | 8    | snapshot_timestamp| Unix timestamp (seconds)           |
 * | 16     | 8    | total_file_size   | Expected file size (bytes)         |
 * | 24     | 4    | body_crc32        | CRC32 of the body                  |
 * | 28     | 4    | reserved_length   | Length of reserved field           |
 * | 32     | N    | reserved          | Reserved for future use            |
 */
struct HeaderV1 {
  uint32_t header_size = 0;
  uint32_t flags = 0;
  uint64_t snapshot_timestamp = 0;
  uint64_t total_file_size = 0;
  uint32_t body_crc32 = 0;
  std::string reserved;
};

Expected<void, Error> WriteHeaderV1(std::ostream& output_stream, const HeaderV1& header);
Expected<void, Error> ReadHeaderV1(std::istream& input_stream, HeaderV1& header);

/**
 * @brief Serialize all feature records in insertion order
 */
Expected<void, Error> SerializeFeatureStore(std::ostream& output_stream, const store::FeatureStore& feature_store);

/**
 * @brief Replace the contents of a feature store with serialized records
 *
 * Records are decoded completely before the store is touched, so a
 * malformed section leaves the store unchanged.
 */
Expected<void, Error> DeserializeFeatureStore(std::istream& input_stream, store::FeatureStore& feature_store);

Expected<void, Error> SerializeGenreCache(std::ostream& output_stream, const store::GenreCache& genre_cache);

/**
 * @brief Replace the contents of a genre cache with serialized entries
 */
Expected<void, Error> DeserializeGenreCache(std::istream& input_stream, store::GenreCache& genre_cache);

/**
 * @brief Write complete snapshot to file (Version 1 format)
 *
 * Write process:
 * 1. Serialize both sections into memory and compute their CRC32
 * 2. Compute the body CRC32 and total file size
 * 3. Write fixed header, V1 header and body to "<filepath>.tmp"
 * 4. Atomic rename from temp file to final path
 *
 * @param filepath Output file path
 * @param feature_store Feature store to serialize
 * @param genre_cache Genre cache to serialize
 * @return Expected<void, Error> Success or kStorageDumpWriteError (context: filepath)
 */
Expected<void, Error> WriteSnapshotV1(const std::string& filepath, const store::FeatureStore& feature_store,
                                      const store::GenreCache& genre_cache);

/**
 * @brief Read complete snapshot from file (Version 1 format)
 *
 * The file size, body CRC32 and every section CRC32 are verified before any
 * store is modified. Loaded data replaces existing store contents.
 *
 * @param filepath Input file path
 * @param feature_store Feature store to load into
 * @param genre_cache Genre cache to load into
 * @param integrity_error Optional output for detailed integrity error information
 * @return Expected<void, Error> Success, kStorageDumpReadError, kStorageVersionMismatch
 *         or kStorageCRCMismatch
 */
Expected<void, Error> ReadSnapshotV1(const std::string& filepath, store::FeatureStore& feature_store,
                                     store::GenreCache& genre_cache,
                                     snapshot_format::IntegrityError* integrity_error = nullptr);

/**
 * @brief Verify magic, version, file size and body CRC32 without loading
 */
Expected<void, Error> VerifySnapshotIntegrity(const std::string& filepath,
                                               snapshot_format::IntegrityError& integrity_error);

uint32_t CalculateCRC32(const void* data, size_t length);
uint32_t CalculateCRC32(const std::string& str);

/**
 * @brief Snapshot file metadata information
 */
struct SnapshotInfo {
  uint32_t version = 0;        // Format version (1 for V1)
  uint32_t section_count = 0;  // Number of sections (2 for V1)
  uint32_t flags = 0;          // Feature flags (see snapshot_format::flags_v1)
  uint64_t file_size = 0;      // Total file size in bytes
  uint64_t timestamp = 0;      // Unix timestamp when snapshot was created
  uint64_t track_count = 0;    // Records in the "features" section
  uint64_t artist_count = 0;   // Entries in the "genres" section
};

/**
 * @brief Read snapshot metadata and section item counts without loading stores
 *
 * Does not verify CRC checksums; use VerifySnapshotIntegrity() for that.
 */
Expected<void, Error> GetSnapshotInfo(const std::string& filepath, SnapshotInfo& info);

}  // namespace tastemix::storage::snapshot_v1
