#pragma once
#include "inventory/iobject_store.h"

#include <string>
#include <utility>

namespace inventory
{

// Objects stored as <root>/<bucket>/<key>
class LocalObjectStore : public IObjectStore
{
public:
  explicit LocalObjectStore(std::string root) : root_(std::move(root)) {}

  std::string get_object(const std::string& bucket, const std::string& key) override;
  std::string get_range(const std::string& bucket, const std::string& key,
                        uint64_t offset, uint64_t length) override;
  ObjectInfo head_object(const std::string& bucket, const std::string& key) override;
  void download(const std::string& bucket, const std::string& key,
                const std::string& local_path) override;

  std::string path_for(const std::string& bucket, const std::string& key) const;

private:
  std::string root_;
};

} // namespace inventory
