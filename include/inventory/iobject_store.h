#pragma once
#include <cstdint>
#include <string>

namespace inventory
{

struct ObjectInfo
{
  uint64_t size = 0;
};

// Read-only access to the store holding the manifest and its shards.
// Implementations throw ObjectStoreError.
class IObjectStore
{
public:
  virtual ~IObjectStore() = default;

  virtual std::string get_object(const std::string& bucket, const std::string& key) = 0;

  // Bytes [offset, offset + length); shorter only at end of object
  virtual std::string get_range(const std::string& bucket, const std::string& key,
                                uint64_t offset, uint64_t length) = 0;

  virtual ObjectInfo head_object(const std::string& bucket, const std::string& key) = 0;

  // Copy the whole object to a local file (created or truncated)
  virtual void download(const std::string& bucket, const std::string& key,
                        const std::string& local_path) = 0;
};

} // namespace inventory
