#pragma once

#include "inventory/iobject_store.h"
#include "inventory/inventory.h"
#include "inventory/s3_client.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace inventory
{

struct StoreConfig
{
  std::string type = "s3";   // "s3" | "local"
  std::string root;          // local only
  S3Options s3;
};

struct AppConfig
{
  std::string manifest_url;
  InventoryOptions inventory;
  size_t batch_size = 1000;
  std::string tmp_dir;
  std::string log_path;
  StoreConfig store;
};

// Both throw ConfigError. Missing S3 credentials are taken from the environment.
AppConfig parse_config(const std::string& text);
AppConfig load_config(const std::string& path);

std::unique_ptr<IObjectStore> make_object_store(const StoreConfig& cfg);

} // namespace inventory
