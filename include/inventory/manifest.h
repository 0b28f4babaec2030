#pragma once

#include "inventory/object_record.h"

#include <string>
#include <utility>
#include <vector>

namespace inventory
{

class IObjectStore;

struct ShardFile
{
  std::string key;
};

// Parsed inventory manifest. Immutable after load_manifest returns.
struct Manifest
{
  std::string url;                    // where the manifest was fetched from
  std::string inventory_bucket_arn;   // "destinationBucket"
  std::string inventory_bucket;       // resource part of the arn; holds the shards
  std::string source_bucket;
  std::string format_name;            // "fileFormat" as written
  FileFormat format = FileFormat::Parquet;
  std::vector<ShardFile> files;
};

struct Arn
{
  std::string partition;
  std::string service;
  std::string region;
  std::string account_id;
  std::string resource;
};

// arn:partition:service:region:account-id:resource. Throws std::invalid_argument.
Arn parse_arn(const std::string& arn);

// "s3://bucket/path/to/key" -> {bucket, "path/to/key"}. Throws std::invalid_argument.
std::pair<std::string, std::string> parse_object_url(const std::string& url);

// Decode and validate a manifest body; `manifest_url` is stamped as origin
Manifest parse_manifest(const std::string& body, const std::string& manifest_url);

// Fetch `manifest_url` from the store and parse it (one read, no retries)
Manifest load_manifest(const std::string& manifest_url, IObjectStore& store);

} // namespace inventory
