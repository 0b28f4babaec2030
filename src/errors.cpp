// src/errors.cpp
#include "inventory/errors.h"

#include <sstream>

using namespace std;

namespace inventory
{

static string store_message(const string& bucket, const string& key, long status, const string& detail)
{
  ostringstream oss;
  oss << "object store: " << detail << " (bucket=" << bucket << " key=" << key;
  if (status) oss << " http_code=" << status;
  oss << ")";
  return oss.str();
}

ObjectStoreError::ObjectStoreError(const string& bucket, const string& key, long http_status, const string& detail)
: InventoryError(store_message(bucket, key, http_status, detail)),
  bucket_(bucket), key_(key), http_status_(http_status) {}

ManifestError::ManifestError(const string& manifest_url, const string& stage, const string& detail)
: InventoryError("manifest " + stage + " failed: " + detail + " (manifest=" + manifest_url + ")"),
  manifest_url_(manifest_url), stage_(stage) {}

UnsupportedFormatError::UnsupportedFormatError(const string& manifest_url, const string& format)
: ManifestError(manifest_url, "decode",
                "unsupported inventory format. supported formats: ORC, Parquet. got format: " + format),
  format_(format) {}

MalformedArnError::MalformedArnError(const string& manifest_url, const string& arn, const string& detail)
: ManifestError(manifest_url, "decode", "failed to parse inventory bucket arn '" + arn + "': " + detail),
  arn_(arn) {}

OrderingError::OrderingError(const string& manifest_url, const string& shard_key, const string& detail)
: InventoryError("failed to sort inventory files in manifest " + manifest_url +
                 ": shard=" + shard_key + ": " + detail),
  manifest_url_(manifest_url), shard_key_(shard_key) {}

static string shard_message(const string& shard_key, const string& stage, const string& detail,
                            const string& manifest_url)
{
  string msg = "inventory shard " + stage + " failed: shard=" + shard_key + ": " + detail;
  if (!manifest_url.empty()) msg += " (manifest=" + manifest_url + ")";
  return msg;
}

ShardError::ShardError(const string& shard_key, const string& stage, const string& detail,
                       const string& manifest_url)
: InventoryError(shard_message(shard_key, stage, detail, manifest_url)),
  shard_key_(shard_key), stage_(stage), detail_(detail), manifest_url_(manifest_url) {}

} // namespace inventory
