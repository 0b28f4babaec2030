// shard_reader.cpp
// Format dispatch for shard readers

#include "inventory/shard_reader.h"
#include "inventory/errors.h"
#include "inventory/iobject_store.h"
#include "inventory/logging.h"
#include "inventory/manifest.h"
#include "inventory/orc_shard_reader.h"
#include "inventory/parquet_shard_reader.h"

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace std;
namespace fs = std::filesystem;

namespace inventory
{

namespace
{

atomic<uint64_t> g_copy_seq{0};

string basename_of(const string& key)
{
  const size_t slash = key.find_last_of('/');
  return slash == string::npos ? key : key.substr(slash + 1);
}

} // namespace

ShardReaderFactory::ShardReaderFactory(IObjectStore& store, string tmp_dir)
: store_(store), tmp_dir_(move(tmp_dir))
{
  if (tmp_dir_.empty())
  {
    tmp_dir_ = fs::temp_directory_path().string();
  }
}

unique_ptr<IShardMetadataReader> ShardReaderFactory::open_metadata(const Manifest& m, const string& key)
{
  switch (m.format)
  {
    case FileFormat::Parquet:
      return make_unique<ParquetMetadataReader>(store_, m.inventory_bucket, key);
    case FileFormat::Orc:
      return make_unique<OrcMetadataReader>(store_, m.inventory_bucket, key);
  }
  throw ShardError(key, "metadata", "unknown file format");
}

// Download the shard next to other local copies; the name is unique per process
string ShardReaderFactory::local_copy(const Manifest& m, const string& key)
{
  ostringstream name;
  name << "inventory-" << ::getpid() << "-" << g_copy_seq.fetch_add(1) << "-" << basename_of(key);
  const string path = (fs::path(tmp_dir_) / name.str()).string();

  try
  {
    store_.download(m.inventory_bucket, key, path);
  }
  catch (const exception& e)
  {
    error_code ec;
    fs::remove(path, ec);
    throw ShardError(key, "open", e.what());
  }
  return path;
}

unique_ptr<IShardReader> ShardReaderFactory::open(const Manifest& m, const string& key)
{
  const string path = local_copy(m, key);
  try
  {
    unique_ptr<IShardReader> reader;
    if (m.format == FileFormat::Orc)
    {
      reader = make_unique<OrcShardReader>(path, key, true);
    }
    else
    {
      reader = make_unique<ParquetShardReader>(path, key, true);
    }
    log_message("[ShardReaderFactory] opened " + key + " (" + to_string(reader->row_count()) + " rows)");
    return reader;
  }
  catch (const exception&)
  {
    error_code ec;
    fs::remove(path, ec);
    throw;
  }
}

} // namespace inventory
