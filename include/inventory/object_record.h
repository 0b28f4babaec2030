#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace inventory
{

// One inventory row
struct ObjectRecord
{
  std::string bucket;
  std::string key;
  int64_t size = 0;
  int64_t last_modified = 0;   // epoch seconds
  std::string checksum;        // e_tag
};

enum class FileFormat
{
  Orc,
  Parquet,
};

// Manifest literals
constexpr const char* kOrcFormatName     = "ORC";
constexpr const char* kParquetFormatName = "Parquet";

// Column names every shard must carry
constexpr const char* kBucketColumn       = "bucket";
constexpr const char* kKeyColumn          = "key";
constexpr const char* kSizeColumn         = "size";
constexpr const char* kLastModifiedColumn = "last_modified_date";
constexpr const char* kChecksumColumn     = "e_tag";

std::optional<FileFormat> parse_file_format(const std::string& name);
const char* file_format_name(FileFormat format);

} // namespace inventory
