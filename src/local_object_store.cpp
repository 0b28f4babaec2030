// src/local_object_store.cpp
#include "inventory/local_object_store.h"
#include "inventory/errors.h"

#include <filesystem>
#include <fstream>
#include <system_error>

using namespace std;
namespace fs = std::filesystem;

namespace inventory
{

string LocalObjectStore::path_for(const string& bucket, const string& key) const
{
  // keys may carry a leading '/' when taken from a URL path
  string rel = key;
  while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
  return (fs::path(root_) / bucket / rel).string();
}

ObjectInfo LocalObjectStore::head_object(const string& bucket, const string& key)
{
  const string path = path_for(bucket, key);
  error_code ec;
  if (!fs::is_regular_file(path, ec))
  {
    throw ObjectStoreError(bucket, key, 404, "no such object");
  }
  const auto size = fs::file_size(path, ec);
  if (ec)
  {
    throw ObjectStoreError(bucket, key, 0, "stat failed: " + ec.message());
  }
  ObjectInfo info;
  info.size = static_cast<uint64_t>(size);
  return info;
}

string LocalObjectStore::get_object(const string& bucket, const string& key)
{
  const ObjectInfo info = head_object(bucket, key);
  return get_range(bucket, key, 0, info.size);
}

string LocalObjectStore::get_range(const string& bucket, const string& key, uint64_t offset, uint64_t length)
{
  const ObjectInfo info = head_object(bucket, key);
  if (offset > info.size)
  {
    throw ObjectStoreError(bucket, key, 416, "range starts past end of object");
  }
  if (length > info.size - offset) length = info.size - offset;

  ifstream in(path_for(bucket, key), ios::binary);
  if (!in.is_open())
  {
    throw ObjectStoreError(bucket, key, 0, "cannot open object file");
  }
  string out(length, '\0');
  in.seekg(static_cast<streamoff>(offset));
  in.read(out.data(), static_cast<streamsize>(length));
  if (static_cast<uint64_t>(in.gcount()) != length)
  {
    throw ObjectStoreError(bucket, key, 0, "short read");
  }
  return out;
}

void LocalObjectStore::download(const string& bucket, const string& key, const string& local_path)
{
  (void)head_object(bucket, key);
  error_code ec;
  fs::copy_file(path_for(bucket, key), local_path, fs::copy_options::overwrite_existing, ec);
  if (ec)
  {
    throw ObjectStoreError(bucket, key, 0, "copy to " + local_path + " failed: " + ec.message());
  }
}

} // namespace inventory
