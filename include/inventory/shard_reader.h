#pragma once

#include "inventory/object_record.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace inventory
{

class IObjectStore;
struct Manifest;

// Boundary metadata of one shard, read from the file footer only
class IShardMetadataReader
{
public:
  virtual ~IShardMetadataReader() = default;

  virtual int64_t row_count() const = 0;
  virtual const std::string& min_value() const = 0;
  virtual const std::string& max_value() const = 0;

  // Releases the session; a second call does nothing. Throws on failure.
  virtual void close() = 0;
};

// Full decoding session over one shard
class IShardReader : public IShardMetadataReader
{
public:
  // Advance past n rows without building records. Throws ShardError if
  // n exceeds the remaining rows; the cursor is then left unchanged.
  virtual void skip(int64_t n) = 0;

  // Decode up to buf.size() rows into buf. Returns the number filled;
  // fewer than buf.size() only when the shard is exhausted, 0 after that.
  virtual size_t read_batch(std::vector<ObjectRecord>& buf) = 0;
};

class IShardReaderFactory
{
public:
  virtual ~IShardReaderFactory() = default;

  virtual std::unique_ptr<IShardMetadataReader> open_metadata(const Manifest& m, const std::string& key) = 0;
  virtual std::unique_ptr<IShardReader> open(const Manifest& m, const std::string& key) = 0;
};

// Opens Parquet or ORC readers over shards held in an object store.
// Full readers work on a local copy under tmp_dir (removed on close).
class ShardReaderFactory : public IShardReaderFactory
{
public:
  ShardReaderFactory(IObjectStore& store, std::string tmp_dir = "");

  std::unique_ptr<IShardMetadataReader> open_metadata(const Manifest& m, const std::string& key) override;
  std::unique_ptr<IShardReader> open(const Manifest& m, const std::string& key) override;

private:
  std::string local_copy(const Manifest& m, const std::string& key);

  IObjectStore& store_;
  std::string tmp_dir_;
};

} // namespace inventory
