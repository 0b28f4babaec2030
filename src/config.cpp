// src/config.cpp
#include "inventory/config.h"
#include "inventory/errors.h"
#include "inventory/local_object_store.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using namespace std;
using json = nlohmann::json;

namespace inventory
{

AppConfig parse_config(const string& text)
{
  json config;
  try
  {
    config = json::parse(text);
  }
  catch (const json::exception& e)
  {
    throw ConfigError(string("failed to parse config: ") + e.what());
  }
  if (!config.is_object())
  {
    throw ConfigError("config must be a JSON object");
  }

  AppConfig cfg;
  try
  {
    cfg.manifest_url                    = config.value("manifest_url", string(""));
    cfg.inventory.sort                  = config.value("sort", true);
    cfg.inventory.tolerate_sort_failure = config.value("tolerate_sort_failure", false);
    const long long batch_size          = config.value("batch_size", 1000LL);
    cfg.tmp_dir                         = config.value("tmp_dir", string(""));
    cfg.log_path                        = config.value("log_path", string(""));

    if (batch_size <= 0)
    {
      throw ConfigError("batch_size must be positive, got " + to_string(batch_size));
    }
    cfg.batch_size = static_cast<size_t>(batch_size);

    const json store = config.value("store", json::object());
    cfg.store.type          = store.value("type", string("s3"));
    cfg.store.root          = store.value("root", string(""));
    cfg.store.s3.endpoint   = store.value("endpoint", string(""));
    cfg.store.s3.region     = store.value("region", string("us-east-1"));
    cfg.store.s3.path_style = store.value("path_style", false);
    cfg.store.s3.timeout_sec = store.value("timeout_sec", 60L);
    cfg.store.s3.credentials.access_key_id     = store.value("access_key_id", string(""));
    cfg.store.s3.credentials.secret_access_key = store.value("secret_access_key", string(""));
    cfg.store.s3.credentials.session_token     = store.value("session_token", string(""));
  }
  catch (const json::exception& e)
  {
    throw ConfigError(string("invalid config value: ") + e.what());
  }

  if (cfg.manifest_url.empty())
  {
    throw ConfigError("manifest_url is required");
  }
  if (cfg.store.type == "s3")
  {
    cfg.store.s3.credentials = credentials_from_env(cfg.store.s3.credentials);
  }
  else if (cfg.store.type == "local")
  {
    if (cfg.store.root.empty()) throw ConfigError("store.root is required for a local store");
  }
  else
  {
    throw ConfigError("unknown store type: " + cfg.store.type);
  }
  if (cfg.store.s3.timeout_sec <= 0)
  {
    throw ConfigError("store.timeout_sec must be positive");
  }
  return cfg;
}

AppConfig load_config(const string& path)
{
  ifstream config_file(path);
  if (!config_file.is_open())
  {
    throw ConfigError("cannot open " + path);
  }
  ostringstream text;
  text << config_file.rdbuf();
  return parse_config(text.str());
}

unique_ptr<IObjectStore> make_object_store(const StoreConfig& cfg)
{
  if (cfg.type == "local")
  {
    return make_unique<LocalObjectStore>(cfg.root);
  }
  return make_unique<S3Client>(cfg.s3);
}

} // namespace inventory
