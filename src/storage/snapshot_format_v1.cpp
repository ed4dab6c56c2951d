/**
 * @file snapshot_format_v1.cpp
 * @brief Snapshot file format Version 1 implementation
 */

#include "storage/snapshot_format_v1.h"

#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>
#include <vector>

#include "utils/structured_log.h"

namespace tastemix::storage::snapshot_v1 {

using namespace utils;

namespace {

constexpr uint32_t kMaxStringLength = 16 * 1024 * 1024;  // 16MB limit per string
constexpr uint32_t kSectionCount = 2;
constexpr uint32_t kReserveLimit = 1 << 16;  // Cap on up-front reservations from untrusted counts

/**
 * @brief Write binary data to stream
 */
template <typename T>
bool WriteBinary(std::ostream& output_stream, const T& value) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  output_stream.write(reinterpret_cast<const char*>(&value), sizeof(T));
  return output_stream.good();
}

/**
 * @brief Read binary data from stream
 */
template <typename T>
bool ReadBinary(std::istream& input_stream, T& value) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  input_stream.read(reinterpret_cast<char*>(&value), sizeof(T));
  return input_stream.good();
}

/**
 * @brief Write string to stream (length-prefixed)
 */
bool WriteString(std::ostream& output_stream, const std::string& str) {
  auto len = static_cast<uint32_t>(str.size());
  if (!WriteBinary(output_stream, len)) {
    return false;
  }
  if (len > 0) {
    output_stream.write(str.data(), len);
  }
  return output_stream.good();
}

/**
 * @brief Read string from stream (length-prefixed)
 */
bool ReadString(std::istream& input_stream, std::string& str) {
  uint32_t len = 0;
  if (!ReadBinary(input_stream, len)) {
    return false;
  }
  if (len > kMaxStringLength) {
    LogStorageError("snapshot_read", "string_length_exceeded",
                    "String length " + std::to_string(len) + " exceeds limit");
    return false;
  }
  if (len > 0) {
    str.resize(len);
    input_stream.read(str.data(), len);
  } else {
    str.clear();
  }
  return input_stream.good();
}

bool WriteStringList(std::ostream& output_stream, const std::vector<std::string>& values) {
  auto count = static_cast<uint32_t>(values.size());
  if (!WriteBinary(output_stream, count)) {
    return false;
  }
  for (const auto& value : values) {
    if (!WriteString(output_stream, value)) {
      return false;
    }
  }
  return true;
}

bool ReadStringList(std::istream& input_stream, std::vector<std::string>& values) {
  uint32_t count = 0;
  if (!ReadBinary(input_stream, count)) {
    return false;
  }
  values.clear();
  values.reserve(std::min(count, kReserveLimit));
  for (uint32_t i = 0; i < count; ++i) {
    std::string value;
    if (!ReadString(input_stream, value)) {
      return false;
    }
    values.push_back(std::move(value));
  }
  return true;
}

/**
 * @brief Append one named section (name, length, CRC32, data) to the body
 */
bool WriteSection(std::ostream& output_stream, const std::string& name, const std::string& data) {
  auto size = static_cast<uint32_t>(data.size());
  uint32_t crc = CalculateCRC32(data);
  if (!WriteString(output_stream, name) || !WriteBinary(output_stream, size) || !WriteBinary(output_stream, crc)) {
    return false;
  }
  output_stream.write(data.data(), size);
  return output_stream.good();
}

/**
 * @brief Raw section as read from the body
 */
struct RawSection {
  std::string name;
  uint32_t crc32 = 0;
  std::string data;
};

/**
 * @brief Bytes left between the current read position and the end of the stream
 */
uint64_t RemainingBytes(std::istream& input_stream) {
  const auto position = input_stream.tellg();
  if (position < 0) {
    return 0;
  }
  input_stream.seekg(0, std::ios::end);
  const auto end = input_stream.tellg();
  input_stream.seekg(position);
  if (end < position) {
    return 0;
  }
  return static_cast<uint64_t>(end - position);
}

bool ReadSection(std::istream& input_stream, RawSection& section) {
  uint32_t size = 0;
  if (!ReadString(input_stream, section.name) || !ReadBinary(input_stream, size) ||
      !ReadBinary(input_stream, section.crc32)) {
    return false;
  }
  // The length is untrusted until the CRC is checked
  if (size > RemainingBytes(input_stream)) {
    LogStorageError("snapshot_read", section.name,
                    "Section length " + std::to_string(size) + " exceeds remaining file size");
    return false;
  }
  section.data.assign(size, '\0');
  if (size > 0) {
    input_stream.read(section.data.data(), size);
  }
  return input_stream.good();
}

/**
 * @brief Fixed header + V1 header reader shared by every entry point
 *
 * On success the stream is positioned at the start of the body.
 */
Expected<HeaderV1, Error> ReadPreamble(std::istream& input_stream, const std::string& filepath,
                                       uint32_t* version_out = nullptr) {
  std::array<char, 4> magic{};
  input_stream.read(magic.data(), magic.size());
  if (!input_stream.good() || magic != snapshot_format::kMagicNumber) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Invalid magic number", filepath));
  }

  uint32_t version = 0;
  if (!ReadBinary(input_stream, version)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read format version", filepath));
  }
  if (version_out != nullptr) {
    *version_out = version;
  }
  if (version < snapshot_format::kMinSupportedVersion || version > snapshot_format::kMaxSupportedVersion) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageVersionMismatch, "Unsupported version: " + std::to_string(version), filepath));
  }

  HeaderV1 header;
  auto read_header_result = ReadHeaderV1(input_stream, header);
  if (!read_header_result) {
    return MakeUnexpected(read_header_result.error());
  }
  return header;
}

void SetIntegrityError(snapshot_format::IntegrityError* integrity_error, snapshot_format::CRCErrorType type,
                       const std::string& message, const std::string& section_name = "") {
  if (integrity_error != nullptr) {
    integrity_error->type = type;
    integrity_error->message = message;
    integrity_error->section_name = section_name;
  }
}

}  // namespace

// ============================================================================
// CRC32 Calculation
// ============================================================================

uint32_t CalculateCRC32(const void* data, size_t length) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(length)));
}

uint32_t CalculateCRC32(const std::string& str) { return CalculateCRC32(str.data(), str.size()); }

// ============================================================================
// Header V1 Serialization
// ============================================================================

Expected<void, Error> WriteHeaderV1(std::ostream& output_stream, const HeaderV1& header) {
  if (!WriteBinary(output_stream, header.header_size)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write header size"));
  }
  if (!WriteBinary(output_stream, header.flags)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write header flags"));
  }
  if (!WriteBinary(output_stream, header.snapshot_timestamp)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write snapshot timestamp"));
  }
  if (!WriteBinary(output_stream, header.total_file_size)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write total file size"));
  }
  if (!WriteBinary(output_stream, header.body_crc32)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write body CRC32"));
  }
  if (!WriteString(output_stream, header.reserved)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write reserved field"));
  }
  return {};
}

Expected<void, Error> ReadHeaderV1(std::istream& input_stream, HeaderV1& header) {
  if (!ReadBinary(input_stream, header.header_size)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read header size"));
  }
  if (!ReadBinary(input_stream, header.flags)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read header flags"));
  }
  if (!ReadBinary(input_stream, header.snapshot_timestamp)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read snapshot timestamp"));
  }
  if (!ReadBinary(input_stream, header.total_file_size)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read total file size"));
  }
  if (!ReadBinary(input_stream, header.body_crc32)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read body CRC32"));
  }
  if (!ReadString(input_stream, header.reserved)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read reserved field"));
  }
  return {};
}

// ============================================================================
// FeatureStore Serialization
// ============================================================================

Expected<void, Error> SerializeFeatureStore(std::ostream& output_stream, const store::FeatureStore& feature_store) {
  std::vector<store::FeatureRecord> records = feature_store.Snapshot();

  auto record_count = static_cast<uint32_t>(records.size());
  if (!WriteBinary(output_stream, record_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write record count"));
  }

  for (const auto& record : records) {
    const store::Track& track = record.track;
    if (!WriteString(output_stream, track.id) || !WriteString(output_stream, track.title) ||
        !WriteString(output_stream, track.link) || !WriteStringList(output_stream, track.artists)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write track: " + track.id));
    }

    uint8_t has_followers = track.followers.has_value() ? 1 : 0;
    uint64_t followers = track.followers.value_or(0);
    if (!WriteBinary(output_stream, has_followers) || !WriteBinary(output_stream, followers)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write follower count"));
    }

    for (float component : record.features.values) {
      if (!WriteBinary(output_stream, component)) {
        return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write feature component"));
      }
    }
  }

  return {};
}

Expected<void, Error> DeserializeFeatureStore(std::istream& input_stream, store::FeatureStore& feature_store) {
  uint32_t record_count = 0;
  if (!ReadBinary(input_stream, record_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read record count"));
  }

  std::vector<store::FeatureRecord> records;
  records.reserve(std::min(record_count, kReserveLimit));
  for (uint32_t record_idx = 0; record_idx < record_count; ++record_idx) {
    store::FeatureRecord record;
    store::Track& track = record.track;
    if (!ReadString(input_stream, track.id) || !ReadString(input_stream, track.title) ||
        !ReadString(input_stream, track.link) || !ReadStringList(input_stream, track.artists)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError,
                                      "Failed to read track " + std::to_string(record_idx)));
    }

    uint8_t has_followers = 0;
    uint64_t followers = 0;
    if (!ReadBinary(input_stream, has_followers) || !ReadBinary(input_stream, followers)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read follower count"));
    }
    if (has_followers != 0) {
      track.followers = followers;
    }

    for (float& component : record.features.values) {
      if (!ReadBinary(input_stream, component)) {
        return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read feature component"));
      }
    }
    records.push_back(std::move(record));
  }

  feature_store.Clear();
  for (const auto& record : records) {
    auto result = feature_store.Upsert(record.track, record.features);
    if (!result) {
      return MakeUnexpected(
          MakeError(ErrorCode::kStorageDumpReadError, "Failed to add record: " + result.error().message()));
    }
  }

  return {};
}

// ============================================================================
// GenreCache Serialization
// ============================================================================

Expected<void, Error> SerializeGenreCache(std::ostream& output_stream, const store::GenreCache& genre_cache) {
  auto entries = genre_cache.Entries();

  auto entry_count = static_cast<uint32_t>(entries.size());
  if (!WriteBinary(output_stream, entry_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write genre entry count"));
  }

  for (const auto& [artist, genres] : entries) {
    std::vector<std::string> tags(genres.begin(), genres.end());
    if (!WriteString(output_stream, artist) || !WriteStringList(output_stream, tags)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write genres for: " + artist));
    }
  }

  return {};
}

Expected<void, Error> DeserializeGenreCache(std::istream& input_stream, store::GenreCache& genre_cache) {
  uint32_t entry_count = 0;
  if (!ReadBinary(input_stream, entry_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read genre entry count"));
  }

  std::vector<std::pair<std::string, store::GenreSet>> entries;
  entries.reserve(std::min(entry_count, kReserveLimit));
  for (uint32_t entry_idx = 0; entry_idx < entry_count; ++entry_idx) {
    std::string artist;
    std::vector<std::string> tags;
    if (!ReadString(input_stream, artist) || !ReadStringList(input_stream, tags)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError,
                                      "Failed to read genre entry " + std::to_string(entry_idx)));
    }
    entries.emplace_back(std::move(artist), store::GenreSet(tags.begin(), tags.end()));
  }

  genre_cache.Clear();
  for (auto& [artist, genres] : entries) {
    genre_cache.Upsert(artist, std::move(genres));
  }

  return {};
}

// ============================================================================
// Snapshot Write / Read
// ============================================================================

Expected<void, Error> WriteSnapshotV1(const std::string& filepath, const store::FeatureStore& feature_store,
                                      const store::GenreCache& genre_cache) {
  // Serialize sections
  std::ostringstream features_ss;
  auto features_result = SerializeFeatureStore(features_ss, feature_store);
  if (!features_result) {
    return features_result;
  }
  std::ostringstream genres_ss;
  auto genres_result = SerializeGenreCache(genres_ss, genre_cache);
  if (!genres_result) {
    return genres_result;
  }

  std::ostringstream body_ss;
  WriteBinary(body_ss, kSectionCount);
  if (!WriteSection(body_ss, snapshot_format::kFeaturesSection, features_ss.str()) ||
      !WriteSection(body_ss, snapshot_format::kGenresSection, genres_ss.str())) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to assemble snapshot body", filepath));
  }
  std::string body = body_ss.str();

  HeaderV1 header;
  header.flags = snapshot_format::flags_v1::kWithCRC;
  header.snapshot_timestamp = static_cast<uint64_t>(std::time(nullptr));
  header.body_crc32 = CalculateCRC32(body);

  // Header size does not depend on field values, only on the reserved length
  std::ostringstream header_ss;
  auto header_result = WriteHeaderV1(header_ss, header);
  if (!header_result) {
    return header_result;
  }
  header.header_size = static_cast<uint32_t>(header_ss.str().size());
  header.total_file_size = snapshot_format::kFixedHeaderSize + header.header_size + body.size();

  std::error_code fs_error;
  std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, fs_error);
    if (fs_error) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError,
                                      "Failed to create snapshot directory: " + fs_error.message(), filepath));
    }
  }

  std::string temp_filepath = filepath + ".tmp";
  {
    std::ofstream output_stream(temp_filepath, std::ios::binary | std::ios::trunc);
    if (!output_stream) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError,
                                      "Failed to open file for writing: " + temp_filepath + " (" +
                                          std::strerror(errno) + ")",
                                      filepath));
    }

    output_stream.write(snapshot_format::kMagicNumber.data(), snapshot_format::kMagicNumber.size());
    uint32_t version = snapshot_format::kCurrentVersion;
    WriteBinary(output_stream, version);
    auto write_header_result = WriteHeaderV1(output_stream, header);
    if (write_header_result) {
      output_stream.write(body.data(), static_cast<std::streamsize>(body.size()));
    }
    output_stream.flush();

    if (!write_header_result || !output_stream.good()) {
      output_stream.close();
      std::filesystem::remove(temp_filepath, fs_error);
      LogStorageError("snapshot_write", filepath, "Short write");
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write snapshot data", filepath));
    }
  }

  std::filesystem::rename(temp_filepath, filepath, fs_error);
  if (fs_error) {
    std::error_code remove_error;
    std::filesystem::remove(temp_filepath, remove_error);
    LogStorageError("snapshot_write", filepath, fs_error.message());
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageDumpWriteError, "Failed to rename snapshot: " + fs_error.message(), filepath));
  }

  LogStorageInfo("snapshot_write", "Snapshot written to " + filepath + " (" +
                                       std::to_string(feature_store.Size()) + " tracks, " +
                                       std::to_string(genre_cache.Size()) + " artists)");
  return {};
}

Expected<void, Error> ReadSnapshotV1(const std::string& filepath, store::FeatureStore& feature_store,
                                     store::GenreCache& genre_cache,
                                     snapshot_format::IntegrityError* integrity_error) {
  std::ifstream input_stream(filepath, std::ios::binary);
  if (!input_stream) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError,
                                    "Failed to open file for reading: " + filepath + " (" + std::strerror(errno) +
                                        ")",
                                    filepath));
  }

  auto header = ReadPreamble(input_stream, filepath);
  if (!header) {
    SetIntegrityError(integrity_error, snapshot_format::CRCErrorType::FileCRC, header.error().message());
    return MakeUnexpected(header.error());
  }

  auto body_offset = static_cast<uint64_t>(input_stream.tellg());
  std::string body((std::istreambuf_iterator<char>(input_stream)), std::istreambuf_iterator<char>());

  uint64_t actual_file_size = body_offset + body.size();
  if (actual_file_size != header->total_file_size) {
    std::string message = "File size mismatch: expected " + std::to_string(header->total_file_size) + ", got " +
                          std::to_string(actual_file_size);
    SetIntegrityError(integrity_error, snapshot_format::CRCErrorType::FileCRC, message);
    LogStorageError("snapshot_read", filepath, message);
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, message, filepath));
  }

  if (CalculateCRC32(body) != header->body_crc32) {
    SetIntegrityError(integrity_error, snapshot_format::CRCErrorType::FileCRC, "Body CRC32 mismatch");
    LogStorageError("snapshot_read", filepath, "Body CRC32 mismatch");
    return MakeUnexpected(MakeError(ErrorCode::kStorageCRCMismatch, "Body CRC32 mismatch", filepath));
  }

  std::istringstream body_ss(body);
  uint32_t section_count = 0;
  if (!ReadBinary(body_ss, section_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read section count", filepath));
  }

  // Verify every section before touching the stores
  std::vector<RawSection> sections;
  for (uint32_t section_idx = 0; section_idx < section_count; ++section_idx) {
    RawSection section;
    if (!ReadSection(body_ss, section)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError,
                                      "Failed to read section " + std::to_string(section_idx), filepath));
    }
    if (CalculateCRC32(section.data) != section.crc32) {
      auto type = section.name == snapshot_format::kGenresSection ? snapshot_format::CRCErrorType::GenresCRC
                                                                  : snapshot_format::CRCErrorType::FeaturesCRC;
      std::string message = "Section CRC32 mismatch: " + section.name;
      SetIntegrityError(integrity_error, type, message, section.name);
      LogStorageError("snapshot_read", filepath, message);
      return MakeUnexpected(MakeError(ErrorCode::kStorageCRCMismatch, message, filepath));
    }
    sections.push_back(std::move(section));
  }

  for (const auto& section : sections) {
    std::istringstream section_ss(section.data);
    if (section.name == snapshot_format::kFeaturesSection) {
      auto deserialize_result = DeserializeFeatureStore(section_ss, feature_store);
      if (!deserialize_result) {
        return deserialize_result;
      }
    } else if (section.name == snapshot_format::kGenresSection) {
      auto deserialize_result = DeserializeGenreCache(section_ss, genre_cache);
      if (!deserialize_result) {
        return deserialize_result;
      }
    } else {
      LogStorageWarning("snapshot_read", "Unknown section name: " + section.name);
    }
  }

  LogStorageInfo("snapshot_read", "Snapshot loaded from " + filepath + " (" + std::to_string(feature_store.Size()) +
                                      " tracks, " + std::to_string(genre_cache.Size()) + " artists)");
  return {};
}

Expected<void, Error> VerifySnapshotIntegrity(const std::string& filepath,
                                               snapshot_format::IntegrityError& integrity_error) {
  std::ifstream input_stream(filepath, std::ios::binary);
  if (!input_stream) {
    integrity_error.type = snapshot_format::CRCErrorType::FileCRC;
    integrity_error.message = "Failed to open file: " + std::string(std::strerror(errno));
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, integrity_error.message, filepath));
  }

  auto header = ReadPreamble(input_stream, filepath);
  if (!header) {
    SetIntegrityError(&integrity_error, snapshot_format::CRCErrorType::FileCRC, header.error().message());
    return MakeUnexpected(header.error());
  }

  auto body_offset = static_cast<uint64_t>(input_stream.tellg());
  std::string body((std::istreambuf_iterator<char>(input_stream)), std::istreambuf_iterator<char>());
  if (body_offset + body.size() != header->total_file_size) {
    SetIntegrityError(&integrity_error, snapshot_format::CRCErrorType::FileCRC,
                      "File size mismatch: expected " + std::to_string(header->total_file_size) + ", got " +
                          std::to_string(body_offset + body.size()));
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, integrity_error.message, filepath));
  }
  if (CalculateCRC32(body) != header->body_crc32) {
    SetIntegrityError(&integrity_error, snapshot_format::CRCErrorType::FileCRC, "Body CRC32 mismatch");
    return MakeUnexpected(MakeError(ErrorCode::kStorageCRCMismatch, integrity_error.message, filepath));
  }

  LogStorageInfo("snapshot_verify", "Snapshot integrity verified: " + filepath);
  return {};
}

Expected<void, Error> GetSnapshotInfo(const std::string& filepath, SnapshotInfo& info) {
  std::ifstream input_stream(filepath, std::ios::binary);
  if (!input_stream) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError,
                                    "Failed to open file for reading: " + filepath + " (" + std::strerror(errno) +
                                        ")",
                                    filepath));
  }

  auto header = ReadPreamble(input_stream, filepath, &info.version);
  if (!header) {
    return MakeUnexpected(header.error());
  }

  info.flags = header->flags;
  info.timestamp = header->snapshot_timestamp;
  info.file_size = header->total_file_size;

  if (!ReadBinary(input_stream, info.section_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read section count", filepath));
  }

  for (uint32_t section_idx = 0; section_idx < info.section_count; ++section_idx) {
    RawSection section;
    if (!ReadSection(input_stream, section)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError,
                                      "Failed to read section " + std::to_string(section_idx), filepath));
    }
    uint32_t item_count = 0;
    if (section.data.size() >= sizeof(item_count)) {
      std::memcpy(&item_count, section.data.data(), sizeof(item_count));
    }
    if (section.name == snapshot_format::kFeaturesSection) {
      info.track_count = item_count;
    } else if (section.name == snapshot_format::kGenresSection) {
      info.artist_count = item_count;
    }
  }

  return {};
}

}  // namespace tastemix::storage::snapshot_v1
