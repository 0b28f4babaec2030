// parquet_shard_reader.h
// Parquet shard readers (no Parquet headers exposed)

#pragma once

#include "inventory/shard_reader.h"

#include <memory>
#include <string>

namespace inventory
{

// Footer-only reader: fetches the Parquet footer with ranged reads
class ParquetMetadataReader : public IShardMetadataReader
{
public:
  ParquetMetadataReader(IObjectStore& store, const std::string& bucket, const std::string& key);
  ~ParquetMetadataReader() override;

  int64_t row_count() const override;
  const std::string& min_value() const override;
  const std::string& max_value() const override;
  void close() override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Row reader over a local Parquet file. shard_key names the shard in errors;
// with remove_on_close the file is deleted by close().
class ParquetShardReader : public IShardReader
{
public:
  ParquetShardReader(std::string local_path, std::string shard_key, bool remove_on_close = false);
  ~ParquetShardReader() override;

  ParquetShardReader(const ParquetShardReader&) = delete;
  ParquetShardReader& operator=(const ParquetShardReader&) = delete;

  int64_t row_count() const override;
  const std::string& min_value() const override;
  const std::string& max_value() const override;
  void skip(int64_t n) override;
  size_t read_batch(std::vector<ObjectRecord>& buf) override;
  void close() override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace inventory
