// fake_shards.h
// In-memory shard readers that count opens and closes

#pragma once

#include "inventory/errors.h"
#include "inventory/manifest.h"
#include "inventory/shard_reader.h"

#include <algorithm>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace inventory_test
{

using inventory::IShardMetadataReader;
using inventory::IShardReader;
using inventory::Manifest;
using inventory::ObjectRecord;

struct FakeStats
{
  int metadata_opens = 0;
  int metadata_closes = 0;
  int opens = 0;
  int closes = 0;
  int open_readers = 0;
  int max_open_readers = 0;
};

struct FakeShard
{
  std::vector<ObjectRecord> rows;
  bool fail_metadata = false;
  bool fail_open = false;
  bool fail_close = false;
  int64_t fail_read_at = -1;   // row at which read_batch throws
};

class FakeShardReader : public IShardReader
{
public:
  FakeShardReader(const FakeShard& shard, FakeStats& stats, bool full)
  : shard_(shard), stats_(stats), full_(full)
  {
    if (!shard_.rows.empty())
    {
      auto mm = std::minmax_element(shard_.rows.begin(), shard_.rows.end(),
                                    [](const ObjectRecord& a, const ObjectRecord& b) { return a.key < b.key; });
      min_ = mm.first->key;
      max_ = mm.second->key;
    }
    if (full_)
    {
      ++stats_.opens;
      ++stats_.open_readers;
      stats_.max_open_readers = std::max(stats_.max_open_readers, stats_.open_readers);
    }
    else
    {
      ++stats_.metadata_opens;
    }
  }

  ~FakeShardReader() override
  {
    if (!closed_)
    {
      closed_ = true;
      count_close();
    }
  }

  int64_t row_count() const override { return static_cast<int64_t>(shard_.rows.size()); }
  const std::string& min_value() const override { return min_; }
  const std::string& max_value() const override { return max_; }

  void skip(int64_t n) override
  {
    if (n < 0 || pos_ + n > row_count())
    {
      throw std::runtime_error("skip past end");
    }
    pos_ += n;
  }

  size_t read_batch(std::vector<ObjectRecord>& buf) override
  {
    if (closed_) throw std::runtime_error("read after close");
    size_t n = 0;
    while (n < buf.size() && pos_ < row_count())
    {
      if (pos_ == shard_.fail_read_at) throw std::runtime_error("corrupt page");
      buf[n++] = shard_.rows[static_cast<size_t>(pos_++)];
    }
    return n;
  }

  void close() override
  {
    if (closed_) return;
    closed_ = true;
    count_close();
    if (shard_.fail_close) throw std::runtime_error("close failed");
  }

private:
  void count_close()
  {
    if (full_)
    {
      ++stats_.closes;
      --stats_.open_readers;
    }
    else
    {
      ++stats_.metadata_closes;
    }
  }

  const FakeShard& shard_;
  FakeStats& stats_;
  bool full_;
  bool closed_ = false;
  int64_t pos_ = 0;
  std::string min_;
  std::string max_;
};

class FakeShardFactory : public inventory::IShardReaderFactory
{
public:
  std::map<std::string, FakeShard> shards;
  FakeStats stats;
  // every full decode fails on its first row
  bool fail_all_decoding = false;

  std::unique_ptr<IShardMetadataReader> open_metadata(const Manifest&, const std::string& key) override
  {
    FakeShard& s = find(key);
    if (s.fail_metadata) throw inventory::ShardError(key, "metadata", "footer unreadable");
    return std::make_unique<FakeShardReader>(s, stats, false);
  }

  std::unique_ptr<IShardReader> open(const Manifest&, const std::string& key) override
  {
    FakeShard& s = find(key);
    if (s.fail_open) throw std::runtime_error("download failed");
    if (fail_all_decoding) s.fail_read_at = 0;
    return std::make_unique<FakeShardReader>(s, stats, true);
  }

  Manifest manifest(const std::vector<std::string>& keys) const
  {
    Manifest m;
    m.url = "s3://inventory-dest/source-bucket/config/manifest.json";
    m.inventory_bucket_arn = "arn:aws:s3:::inventory-dest";
    m.inventory_bucket = "inventory-dest";
    m.source_bucket = "source-bucket";
    m.format_name = "Parquet";
    m.format = inventory::FileFormat::Parquet;
    for (const auto& k : keys) m.files.push_back(inventory::ShardFile{k});
    return m;
  }

private:
  FakeShard& find(const std::string& key)
  {
    auto it = shards.find(key);
    if (it == shards.end()) throw inventory::ShardError(key, "open", "no such shard");
    return it->second;
  }
};

} // namespace inventory_test
