// orc_shard_reader.h
// ORC shard readers (no ORC headers exposed)

#pragma once

#include "inventory/shard_reader.h"

#include <memory>
#include <string>

namespace inventory
{

// Tail-only reader: file statistics come through ranged reads
class OrcMetadataReader : public IShardMetadataReader
{
public:
  OrcMetadataReader(IObjectStore& store, const std::string& bucket, const std::string& key);
  ~OrcMetadataReader() override;

  int64_t row_count() const override;
  const std::string& min_value() const override;
  const std::string& max_value() const override;
  void close() override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

class OrcShardReader : public IShardReader
{
public:
  OrcShardReader(std::string local_path, std::string shard_key, bool remove_on_close = false);
  ~OrcShardReader() override;

  OrcShardReader(const OrcShardReader&) = delete;
  OrcShardReader& operator=(const OrcShardReader&) = delete;

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
