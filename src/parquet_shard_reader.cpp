// parquet_shard_reader.cpp
// Implementation of the Parquet shard readers (private Parquet/Arrow deps here)

#include "inventory/parquet_shard_reader.h"
#include "inventory/errors.h"
#include "inventory/iobject_store.h"
#include "inventory/logging.h"

#include <parquet/api/reader.h>
#include <parquet/schema.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

using namespace std;
namespace fs = std::filesystem;

namespace inventory
{

namespace
{

enum Col { BUCKET = 0, KEY, SIZE, MTIME, ETAG, NCOLS };

const array<const char*, NCOLS> kColumnNames = {
  kBucketColumn, kKeyColumn, kSizeColumn, kLastModifiedColumn, kChecksumColumn
};

int find_col_idx(const parquet::SchemaDescriptor* schema, const string& name)
{
  for (int i = 0; i < schema->num_columns(); ++i)
  {
    if (schema->Column(i)->path()->ToDotString() == name)
    {
      return i;
    }
  }
  return -1;
}

// Locates and type-checks the five inventory columns
array<int, NCOLS> resolve_columns(const parquet::SchemaDescriptor* schema)
{
  array<int, NCOLS> idx{};
  for (int c = 0; c < NCOLS; ++c)
  {
    idx[c] = find_col_idx(schema, kColumnNames[c]);
    if (idx[c] < 0)
    {
      throw runtime_error(string("missing column ") + kColumnNames[c]);
    }
    const parquet::ColumnDescriptor* d = schema->Column(idx[c]);
    if (d->max_repetition_level() != 0)
    {
      throw runtime_error(string("column ") + kColumnNames[c] + " is repeated");
    }
    const bool numeric = (c == SIZE || c == MTIME);
    const parquet::Type::type want = numeric ? parquet::Type::INT64 : parquet::Type::BYTE_ARRAY;
    if (d->physical_type() != want)
    {
      throw runtime_error(string("column ") + kColumnNames[c] + " has unsupported physical type " +
                          parquet::TypeToString(d->physical_type()));
    }
  }
  return idx;
}

// Divisor turning the stored timestamp into epoch seconds
int64_t timestamp_divisor(const parquet::ColumnDescriptor* d)
{
  const auto& lt = d->logical_type();
  if (lt && lt->is_timestamp())
  {
    auto ts = static_pointer_cast<const parquet::TimestampLogicalType>(lt);
    switch (ts->time_unit())
    {
      case parquet::LogicalType::TimeUnit::MILLIS: return 1'000LL;
      case parquet::LogicalType::TimeUnit::MICROS: return 1'000'000LL;
      case parquet::LogicalType::TimeUnit::NANOS:  return 1'000'000'000LL;
      default: throw runtime_error("unknown timestamp unit in last_modified_date");
    }
  }
  return 1'000LL;
}

string byte_array_string(const parquet::ByteArray& v)
{
  return string(reinterpret_cast<const char*>(v.ptr), v.len);
}

// Min of row-group minima and max of row-group maxima of the key column
pair<string, string> key_boundaries(parquet::FileMetaData& md, int key_col)
{
  bool have = false;
  string lo, hi;
  for (int i = 0; i < md.num_row_groups(); ++i)
  {
    auto rg = md.RowGroup(i);
    if (rg->num_rows() == 0) continue;

    auto cc = rg->ColumnChunk(key_col);
    shared_ptr<parquet::Statistics> st = cc->is_stats_set() ? cc->statistics() : nullptr;
    if (!st || !st->HasMinMax())
    {
      throw runtime_error("key column has no min/max statistics in row group " + to_string(i));
    }
    auto bst = static_pointer_cast<parquet::ByteArrayStatistics>(st);
    string mn = byte_array_string(bst->min());
    string mx = byte_array_string(bst->max());
    if (!have || mn < lo) lo = mn;
    if (!have || mx > hi) hi = mx;
    have = true;
  }
  return {lo, hi};
}

uint32_t read_le32(const string& s, size_t at)
{
  return static_cast<uint32_t>(static_cast<unsigned char>(s[at])) |
         (static_cast<uint32_t>(static_cast<unsigned char>(s[at + 1])) << 8) |
         (static_cast<uint32_t>(static_cast<unsigned char>(s[at + 2])) << 16) |
         (static_cast<uint32_t>(static_cast<unsigned char>(s[at + 3])) << 24);
}

} // namespace

// ======== Footer-only reader ========

struct ParquetMetadataReader::Impl
{
  string key;
  int64_t rows = 0;
  string min_value;
  string max_value;
};

ParquetMetadataReader::ParquetMetadataReader(IObjectStore& store, const string& bucket, const string& key)
: impl_(make_unique<Impl>())
{
  impl_->key = key;
  try
  {
    // <footer><footer length: 4 bytes LE>"PAR1"
    const uint64_t size = store.head_object(bucket, key).size;
    if (size < 12)
    {
      throw runtime_error("file too small to be parquet");
    }
    const string tail = store.get_range(bucket, key, size - 8, 8);
    if (tail.size() != 8 || tail.compare(4, 4, "PAR1") != 0)
    {
      throw runtime_error("parquet magic not found (encrypted footers are not supported)");
    }
    uint32_t len = read_le32(tail, 0);
    if (static_cast<uint64_t>(len) + 8 > size)
    {
      throw runtime_error("parquet footer length exceeds file size");
    }
    const string footer = store.get_range(bucket, key, size - 8 - len, len);
    if (footer.size() != len)
    {
      throw runtime_error("short read of parquet footer");
    }

    shared_ptr<parquet::FileMetaData> md = parquet::FileMetaData::Make(footer.data(), &len);
    auto cols = resolve_columns(md->schema());
    impl_->rows = md->num_rows();
    tie(impl_->min_value, impl_->max_value) = key_boundaries(*md, cols[KEY]);
  }
  catch (const exception& e)
  {
    throw ShardError(key, "metadata", e.what());
  }
}

ParquetMetadataReader::~ParquetMetadataReader() = default;

int64_t ParquetMetadataReader::row_count() const { return impl_->rows; }
const string& ParquetMetadataReader::min_value() const { return impl_->min_value; }
const string& ParquetMetadataReader::max_value() const { return impl_->max_value; }

// footer bytes were released after parsing; nothing is held open
void ParquetMetadataReader::close() {}

// ======== RowGroup cursor over a local file ========

struct ParquetShardReader::Impl
{
  string path;
  string key;
  bool remove_on_close = false;
  bool closed = false;

  unique_ptr<parquet::ParquetFileReader> reader;
  shared_ptr<parquet::FileMetaData> md;
  const parquet::SchemaDescriptor* schema = nullptr;
  array<int, NCOLS> col{};
  array<int16_t, NCOLS> max_def{};
  int64_t ts_divisor = 1000;

  int64_t total_rows = 0;
  int64_t consumed = 0;
  string min_value;
  string max_value;

  int rg_idx = -1;
  int64_t rg_rows_left = 0;
  shared_ptr<parquet::RowGroupReader> rg;
  array<shared_ptr<parquet::ColumnReader>, NCOLS> readers;

  // decode scratch, reused across batches
  vector<int16_t> defbuf;
  vector<parquet::ByteArray> babuf;
  vector<int64_t> i64buf;

  void open_row_group(int idx)
  {
    rg_idx = idx;
    rg = reader->RowGroup(idx);
    rg_rows_left = rg->metadata()->num_rows();
    for (int c = 0; c < NCOLS; ++c)
    {
      readers[c] = rg->Column(col[c]);
    }
  }

  bool next_row_group()
  {
    while (rg_idx + 1 < md->num_row_groups())
    {
      open_row_group(rg_idx + 1);
      if (rg_rows_left > 0) return true;
    }
    return false;
  }

  void read_string_column(int c, int64_t rows, vector<ObjectRecord>& buf, size_t at, string ObjectRecord::* field)
  {
    auto* r = static_cast<parquet::ByteArrayReader*>(readers[c].get());
    const int16_t md_level = max_def[c];
    defbuf.resize(rows);
    babuf.resize(rows);

    int64_t done = 0;
    while (done < rows)
    {
      int64_t values_read = 0;
      int64_t levels = r->ReadBatch(rows - done, md_level ? defbuf.data() : nullptr, nullptr,
                                    babuf.data(), &values_read);
      if (levels == 0 && values_read == 0) break;

      int64_t v = 0;
      for (int64_t i = 0; i < levels; ++i)
      {
        string& dst = buf[at + done + i].*field;
        if (md_level == 0 || defbuf[i] == md_level)
        {
          dst.assign(reinterpret_cast<const char*>(babuf[v].ptr), babuf[v].len);
          ++v;
        }
        else
        {
          dst.clear();
        }
      }
      done += levels;
    }
    if (done != rows) throw runtime_error(string("short read in column ") + kColumnNames[c]);
  }

  void read_int64_column(int c, int64_t rows, vector<ObjectRecord>& buf, size_t at,
                         int64_t ObjectRecord::* field, int64_t divisor)
  {
    auto* r = static_cast<parquet::Int64Reader*>(readers[c].get());
    const int16_t md_level = max_def[c];
    defbuf.resize(rows);
    i64buf.resize(rows);

    int64_t done = 0;
    while (done < rows)
    {
      int64_t values_read = 0;
      int64_t levels = r->ReadBatch(rows - done, md_level ? defbuf.data() : nullptr, nullptr,
                                    i64buf.data(), &values_read);
      if (levels == 0 && values_read == 0) break;

      int64_t v = 0;
      for (int64_t i = 0; i < levels; ++i)
      {
        int64_t& dst = buf[at + done + i].*field;
        if (md_level == 0 || defbuf[i] == md_level)
        {
          dst = i64buf[v++] / divisor;
        }
        else
        {
          dst = 0;
        }
      }
      done += levels;
    }
    if (done != rows) throw runtime_error(string("short read in column ") + kColumnNames[c]);
  }

  void skip_in_row_group(int64_t rows)
  {
    for (int c = 0; c < NCOLS; ++c)
    {
      int64_t skipped = 0;
      if (c == SIZE || c == MTIME)
        skipped = static_cast<parquet::Int64Reader*>(readers[c].get())->Skip(rows);
      else
        skipped = static_cast<parquet::ByteArrayReader*>(readers[c].get())->Skip(rows);
      if (skipped != rows) throw runtime_error(string("short skip in column ") + kColumnNames[c]);
    }
    rg_rows_left -= rows;
  }
};

ParquetShardReader::ParquetShardReader(string local_path, string shard_key, bool remove_on_close)
: impl_(make_unique<Impl>())
{
  impl_->path = move(local_path);
  impl_->key = move(shard_key);
  impl_->remove_on_close = remove_on_close;

  try
  {
    impl_->reader = parquet::ParquetFileReader::OpenFile(impl_->path, /*memory_map=*/false);
    impl_->md     = impl_->reader->metadata();
    impl_->schema = impl_->md->schema();
    impl_->col    = resolve_columns(impl_->schema);
    for (int c = 0; c < NCOLS; ++c)
    {
      impl_->max_def[c] = impl_->schema->Column(impl_->col[c])->max_definition_level();
    }
    impl_->ts_divisor = timestamp_divisor(impl_->schema->Column(impl_->col[MTIME]));
    impl_->total_rows = impl_->md->num_rows();
    tie(impl_->min_value, impl_->max_value) = key_boundaries(*impl_->md, impl_->col[KEY]);
  }
  catch (const exception& e)
  {
    impl_->reader.reset();
    throw ShardError(impl_->key, "open", e.what());
  }
}

ParquetShardReader::~ParquetShardReader()
{
  try
  {
    close();
  }
  catch (const exception& e)
  {
    log_error(string("[ParquetShardReader] close failed: ") + e.what());
  }
}

int64_t ParquetShardReader::row_count() const { return impl_->total_rows; }
const string& ParquetShardReader::min_value() const { return impl_->min_value; }
const string& ParquetShardReader::max_value() const { return impl_->max_value; }

void ParquetShardReader::skip(int64_t n)
{
  Impl& s = *impl_;
  if (s.closed) throw ShardError(s.key, "skip", "reader is closed");
  if (n < 0 || n > s.total_rows - s.consumed)
  {
    throw ShardError(s.key, "skip", "cannot skip " + to_string(n) + " rows, " +
                     to_string(s.total_rows - s.consumed) + " remaining");
  }

  try
  {
    int64_t left = n;
    while (left > 0)
    {
      if (s.rg_rows_left == 0)
      {
        // whole row groups are passed over without opening them
        const int next = s.rg_idx + 1;
        const int64_t rows = s.md->RowGroup(next)->num_rows();
        if (rows <= left)
        {
          s.rg_idx = next;
          s.rg.reset();
          left -= rows;
          s.consumed += rows;
          continue;
        }
        s.open_row_group(next);
      }
      const int64_t k = min(left, s.rg_rows_left);
      s.skip_in_row_group(k);
      left -= k;
      s.consumed += k;
    }
  }
  catch (const ShardError&)
  {
    throw;
  }
  catch (const exception& e)
  {
    throw ShardError(s.key, "skip", e.what());
  }
}

size_t ParquetShardReader::read_batch(vector<ObjectRecord>& buf)
{
  Impl& s = *impl_;
  if (s.closed) throw ShardError(s.key, "read", "reader is closed");

  size_t filled = 0;
  try
  {
    while (filled < buf.size())
    {
      if (s.rg_rows_left == 0 && !s.next_row_group()) break;

      const int64_t k = min<int64_t>(static_cast<int64_t>(buf.size() - filled), s.rg_rows_left);
      s.read_string_column(BUCKET, k, buf, filled, &ObjectRecord::bucket);
      s.read_string_column(KEY,    k, buf, filled, &ObjectRecord::key);
      s.read_int64_column (SIZE,   k, buf, filled, &ObjectRecord::size, 1);
      s.read_int64_column (MTIME,  k, buf, filled, &ObjectRecord::last_modified, s.ts_divisor);
      s.read_string_column(ETAG,   k, buf, filled, &ObjectRecord::checksum);

      filled += static_cast<size_t>(k);
      s.rg_rows_left -= k;
      s.consumed += k;
    }
  }
  catch (const exception& e)
  {
    throw ShardError(s.key, "read", e.what());
  }
  return filled;
}

void ParquetShardReader::close()
{
  Impl& s = *impl_;
  if (s.closed) return;
  s.closed = true;

  for (auto& r : s.readers) r.reset();
  s.rg.reset();
  if (s.reader)
  {
    s.reader->Close();
    s.reader.reset();
  }

  if (s.remove_on_close)
  {
    error_code ec;
    fs::remove(s.path, ec);
    if (ec)
    {
      throw ShardError(s.key, "close", "cannot remove local copy " + s.path + ": " + ec.message());
    }
  }
}

} // namespace inventory
