// orc_shard_reader.cpp
// Implementation of the ORC shard readers (private liborc deps here)

#include "inventory/orc_shard_reader.h"
#include "inventory/errors.h"
#include "inventory/iobject_store.h"
#include "inventory/logging.h"

#include <orc/OrcFile.hh>

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <list>
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

constexpr uint64_t kMinBatchRows = 1024;
constexpr uint64_t kNaturalReadSize = 256 * 1024;

bool is_string_kind(orc::TypeKind k)
{
  return k == orc::STRING || k == orc::VARCHAR || k == orc::CHAR || k == orc::BINARY;
}

bool is_integer_kind(orc::TypeKind k)
{
  return k == orc::LONG || k == orc::INT || k == orc::SHORT || k == orc::BYTE;
}

// Field positions of the inventory columns inside a struct type
array<int, NCOLS> resolve_fields(const orc::Type& type)
{
  if (type.getKind() != orc::STRUCT)
  {
    throw runtime_error("root type is not a struct");
  }
  array<int, NCOLS> idx;
  idx.fill(-1);
  for (uint64_t i = 0; i < type.getSubtypeCount(); ++i)
  {
    const string& name = type.getFieldName(i);
    for (int c = 0; c < NCOLS; ++c)
    {
      if (name == kColumnNames[c]) idx[c] = static_cast<int>(i);
    }
  }
  for (int c = 0; c < NCOLS; ++c)
  {
    if (idx[c] < 0)
    {
      throw runtime_error(string("missing column ") + kColumnNames[c]);
    }
    const orc::TypeKind k = type.getSubtype(idx[c])->getKind();
    bool ok = false;
    if (c == SIZE) ok = is_integer_kind(k);
    else if (c == MTIME) ok = (k == orc::TIMESTAMP);
    else ok = is_string_kind(k);
    if (!ok)
    {
      throw runtime_error(string("column ") + kColumnNames[c] + " has unsupported type " +
                          type.getSubtype(idx[c])->toString());
    }
  }
  return idx;
}

// File-level statistics of the key column
pair<string, string> key_boundaries(const orc::Reader& reader)
{
  const orc::Type& type = reader.getType();
  const array<int, NCOLS> idx = resolve_fields(type);
  if (reader.getNumberOfRows() == 0) return {string(), string()};

  const uint32_t column_id = static_cast<uint32_t>(type.getSubtype(idx[KEY])->getColumnId());
  unique_ptr<orc::ColumnStatistics> stats = reader.getColumnStatistics(column_id);
  const auto* ss = dynamic_cast<const orc::StringColumnStatistics*>(stats.get());
  if (!ss || !ss->hasMinimum() || !ss->hasMaximum())
  {
    throw runtime_error("key column has no min/max statistics");
  }
  return {ss->getMinimum(), ss->getMaximum()};
}

// orc::InputStream served by ranged reads on the object store
class ObjectRangeStream : public orc::InputStream
{
public:
  ObjectRangeStream(IObjectStore& store, string bucket, string key)
  : store_(store), bucket_(move(bucket)), key_(move(key))
  {
    length_ = store_.head_object(bucket_, key_).size;
    name_ = bucket_ + "/" + key_;
  }

  uint64_t getLength() const override { return length_; }
  uint64_t getNaturalReadSize() const override { return kNaturalReadSize; }

  void read(void* buf, uint64_t length, uint64_t offset) override
  {
    const string data = store_.get_range(bucket_, key_, offset, length);
    if (data.size() != length)
    {
      throw runtime_error("short ranged read at offset " + to_string(offset));
    }
    memcpy(buf, data.data(), length);
  }

  const string& getName() const override { return name_; }

private:
  IObjectStore& store_;
  string bucket_;
  string key_;
  string name_;
  uint64_t length_ = 0;
};

} // namespace

// ======== Tail-only reader ========

struct OrcMetadataReader::Impl
{
  unique_ptr<orc::Reader> reader;
  int64_t rows = 0;
  string min_value;
  string max_value;
};

OrcMetadataReader::OrcMetadataReader(IObjectStore& store, const string& bucket, const string& key)
: impl_(make_unique<Impl>())
{
  try
  {
    orc::ReaderOptions opts;
    impl_->reader = orc::createReader(make_unique<ObjectRangeStream>(store, bucket, key), opts);
    impl_->rows = static_cast<int64_t>(impl_->reader->getNumberOfRows());
    tie(impl_->min_value, impl_->max_value) = key_boundaries(*impl_->reader);
  }
  catch (const exception& e)
  {
    throw ShardError(key, "metadata", e.what());
  }
}

OrcMetadataReader::~OrcMetadataReader() = default;

int64_t OrcMetadataReader::row_count() const { return impl_->rows; }
const string& OrcMetadataReader::min_value() const { return impl_->min_value; }
const string& OrcMetadataReader::max_value() const { return impl_->max_value; }

void OrcMetadataReader::close()
{
  impl_->reader.reset();
}

// ======== Stripe cursor over a local file ========

struct OrcShardReader::Impl
{
  string path;
  string key;
  bool remove_on_close = false;
  bool closed = false;

  unique_ptr<orc::Reader> reader;
  unique_ptr<orc::RowReader> rows;
  unique_ptr<orc::ColumnVectorBatch> batch;
  array<int, NCOLS> field{};   // positions in the selected struct

  int64_t total_rows = 0;
  int64_t consumed = 0;
  string min_value;
  string max_value;

  // rows decoded by the last next() and not yet handed out
  uint64_t batch_pos = 0;
  uint64_t batch_len = 0;

  bool refill(size_t want)
  {
    if (!batch)
    {
      batch = rows->createRowBatch(max<uint64_t>(want, kMinBatchRows));
    }
    if (!rows->next(*batch)) return false;
    batch_pos = 0;
    batch_len = batch->numElements;
    return batch_len > 0;
  }

  static void copy_string(const orc::StringVectorBatch* sv, uint64_t src, string& dst)
  {
    if (sv->hasNulls && !sv->notNull[src])
    {
      dst.clear();
      return;
    }
    dst.assign(sv->data[src], static_cast<size_t>(sv->length[src]));
  }

  void copy_rows(vector<ObjectRecord>& buf, size_t at, uint64_t n)
  {
    auto& root = dynamic_cast<orc::StructVectorBatch&>(*batch);
    const auto* bucket = dynamic_cast<const orc::StringVectorBatch*>(root.fields[field[BUCKET]]);
    const auto* keycol = dynamic_cast<const orc::StringVectorBatch*>(root.fields[field[KEY]]);
    const auto* etag   = dynamic_cast<const orc::StringVectorBatch*>(root.fields[field[ETAG]]);
    const auto* size   = dynamic_cast<const orc::LongVectorBatch*>(root.fields[field[SIZE]]);
    const auto* mtime  = dynamic_cast<const orc::TimestampVectorBatch*>(root.fields[field[MTIME]]);
    if (!bucket || !keycol || !etag || !size || !mtime)
    {
      throw runtime_error("unexpected column batch types");
    }

    for (uint64_t i = 0; i < n; ++i)
    {
      const uint64_t src = batch_pos + i;
      ObjectRecord& r = buf[at + i];
      copy_string(bucket, src, r.bucket);
      copy_string(keycol, src, r.key);
      copy_string(etag, src, r.checksum);
      r.size = (size->hasNulls && !size->notNull[src]) ? 0 : size->data[src];
      r.last_modified = (mtime->hasNulls && !mtime->notNull[src]) ? 0 : mtime->data[src];
    }
    batch_pos += n;
  }
};

OrcShardReader::OrcShardReader(string local_path, string shard_key, bool remove_on_close)
: impl_(make_unique<Impl>())
{
  impl_->path = move(local_path);
  impl_->key = move(shard_key);
  impl_->remove_on_close = remove_on_close;

  try
  {
    orc::ReaderOptions opts;
    impl_->reader = orc::createReader(orc::readLocalFile(impl_->path), opts);
    impl_->total_rows = static_cast<int64_t>(impl_->reader->getNumberOfRows());
    tie(impl_->min_value, impl_->max_value) = key_boundaries(*impl_->reader);

    orc::RowReaderOptions rro;
    rro.include(list<string>(kColumnNames.begin(), kColumnNames.end()));
    impl_->rows = impl_->reader->createRowReader(rro);
    impl_->field = resolve_fields(impl_->rows->getSelectedType());
  }
  catch (const exception& e)
  {
    impl_->rows.reset();
    impl_->reader.reset();
    throw ShardError(impl_->key, "open", e.what());
  }
}

OrcShardReader::~OrcShardReader()
{
  try
  {
    close();
  }
  catch (const exception& e)
  {
    log_error(string("[OrcShardReader] close failed: ") + e.what());
  }
}

int64_t OrcShardReader::row_count() const { return impl_->total_rows; }
const string& OrcShardReader::min_value() const { return impl_->min_value; }
const string& OrcShardReader::max_value() const { return impl_->max_value; }

void OrcShardReader::skip(int64_t n)
{
  Impl& s = *impl_;
  if (s.closed) throw ShardError(s.key, "skip", "reader is closed");
  if (n < 0 || n > s.total_rows - s.consumed)
  {
    throw ShardError(s.key, "skip", "cannot skip " + to_string(n) + " rows, " +
                     to_string(s.total_rows - s.consumed) + " remaining");
  }
  if (n == 0) return;

  try
  {
    // rows already decoded into the batch are dropped first
    const uint64_t buffered = min<uint64_t>(static_cast<uint64_t>(n), s.batch_len - s.batch_pos);
    s.batch_pos += buffered;
    const uint64_t rest = static_cast<uint64_t>(n) - buffered;
    if (rest > 0)
    {
      s.rows->seekToRow(static_cast<uint64_t>(s.consumed) + static_cast<uint64_t>(n));
      s.batch_pos = s.batch_len = 0;
    }
    s.consumed += n;
  }
  catch (const exception& e)
  {
    throw ShardError(s.key, "skip", e.what());
  }
}

size_t OrcShardReader::read_batch(vector<ObjectRecord>& buf)
{
  Impl& s = *impl_;
  if (s.closed) throw ShardError(s.key, "read", "reader is closed");

  size_t filled = 0;
  try
  {
    while (filled < buf.size())
    {
      if (s.batch_pos == s.batch_len && !s.refill(buf.size())) break;

      const uint64_t k = min<uint64_t>(buf.size() - filled, s.batch_len - s.batch_pos);
      s.copy_rows(buf, filled, k);
      filled += static_cast<size_t>(k);
      s.consumed += static_cast<int64_t>(k);
    }
  }
  catch (const exception& e)
  {
    throw ShardError(s.key, "read", e.what());
  }
  return filled;
}

void OrcShardReader::close()
{
  Impl& s = *impl_;
  if (s.closed) return;
  s.closed = true;

  s.batch.reset();
  s.rows.reset();
  s.reader.reset();

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
