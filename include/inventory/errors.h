#pragma once

#include <stdexcept>
#include <string>

namespace inventory
{

// Base of every terminal inventory failure
class InventoryError : public std::runtime_error
{
public:
  explicit InventoryError(const std::string& msg) : std::runtime_error(msg) {}
};

class ObjectStoreError : public InventoryError
{
public:
  ObjectStoreError(const std::string& bucket, const std::string& key,
                   long http_status, const std::string& detail);

  const std::string& bucket() const { return bucket_; }
  const std::string& key() const { return key_; }
  // 0 when the request never produced an HTTP response
  long http_status() const { return http_status_; }

private:
  std::string bucket_;
  std::string key_;
  long http_status_;
};

class ManifestError : public InventoryError
{
public:
  ManifestError(const std::string& manifest_url, const std::string& stage, const std::string& detail);

  const std::string& manifest_url() const { return manifest_url_; }
  const std::string& stage() const { return stage_; }

private:
  std::string manifest_url_;
  std::string stage_;
};

class UnsupportedFormatError : public ManifestError
{
public:
  UnsupportedFormatError(const std::string& manifest_url, const std::string& format);

  const std::string& format() const { return format_; }

private:
  std::string format_;
};

class MalformedArnError : public ManifestError
{
public:
  MalformedArnError(const std::string& manifest_url, const std::string& arn, const std::string& detail);

  const std::string& arn() const { return arn_; }

private:
  std::string arn_;
};

class OrderingError : public InventoryError
{
public:
  OrderingError(const std::string& manifest_url, const std::string& shard_key, const std::string& detail);

  const std::string& manifest_url() const { return manifest_url_; }
  const std::string& shard_key() const { return shard_key_; }

private:
  std::string manifest_url_;
  std::string shard_key_;
};

// stage: "open" | "metadata" | "skip" | "read" | "close"
class ShardError : public InventoryError
{
public:
  ShardError(const std::string& shard_key, const std::string& stage, const std::string& detail,
             const std::string& manifest_url = "");

  const std::string& shard_key() const { return shard_key_; }
  const std::string& stage() const { return stage_; }
  const std::string& detail() const { return detail_; }
  // empty until the iterator attaches it
  const std::string& manifest_url() const { return manifest_url_; }

private:
  std::string shard_key_;
  std::string stage_;
  std::string detail_;
  std::string manifest_url_;
};

// Raised when iteration was stopped on request; not a failure
class CancelledError : public std::runtime_error
{
public:
  explicit CancelledError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error
{
public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace inventory
