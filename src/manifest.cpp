// src/manifest.cpp
#include "inventory/manifest.h"
#include "inventory/errors.h"
#include "inventory/iobject_store.h"
#include "inventory/logging.h"

#include <nlohmann/json.hpp>

#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using namespace std;

namespace inventory
{

optional<FileFormat> parse_file_format(const string& name)
{
  if (name == kOrcFormatName) return FileFormat::Orc;
  if (name == kParquetFormatName) return FileFormat::Parquet;
  return nullopt;
}

const char* file_format_name(FileFormat format)
{
  switch (format)
  {
    case FileFormat::Orc:     return kOrcFormatName;
    case FileFormat::Parquet: return kParquetFormatName;
  }
  return "unknown";
}

Arn parse_arn(const string& arn)
{
  static const string prefix = "arn:";
  if (arn.compare(0, prefix.size(), prefix) != 0)
  {
    throw invalid_argument("arn: invalid prefix");
  }

  // first five separators split fixed sections; the resource may hold ':'
  vector<string> sections;
  size_t start = 0;
  for (int i = 0; i < 5; ++i)
  {
    size_t p = arn.find(':', start);
    if (p == string::npos)
    {
      throw invalid_argument("arn: not enough sections");
    }
    sections.push_back(arn.substr(start, p - start));
    start = p + 1;
  }
  sections.push_back(arn.substr(start));

  Arn out;
  out.partition  = sections[1];
  out.service    = sections[2];
  out.region     = sections[3];
  out.account_id = sections[4];
  out.resource   = sections[5];
  if (out.resource.empty())
  {
    throw invalid_argument("arn: empty resource");
  }
  return out;
}

pair<string, string> parse_object_url(const string& url)
{
  size_t p = url.find("://");
  if (p == string::npos || p == 0)
  {
    throw invalid_argument("missing scheme in url: " + url);
  }
  string rest = url.substr(p + 3);
  size_t slash = rest.find('/');
  string bucket = rest.substr(0, slash);
  string key = (slash == string::npos) ? string() : rest.substr(slash + 1);
  while (!key.empty() && key.front() == '/') key.erase(0, 1);
  if (bucket.empty()) throw invalid_argument("missing bucket in url: " + url);
  if (key.empty()) throw invalid_argument("missing key in url: " + url);
  return {bucket, key};
}

static string string_field(const json& j, const char* name, const string& manifest_url)
{
  auto it = j.find(name);
  if (it == j.end() || it->is_null()) return string();
  if (!it->is_string())
  {
    throw ManifestError(manifest_url, "decode", string("field '") + name + "' is not a string");
  }
  return it->get<string>();
}

Manifest parse_manifest(const string& body, const string& manifest_url)
{
  json j;
  try
  {
    j = json::parse(body);
  }
  catch (const json::exception& e)
  {
    throw ManifestError(manifest_url, "decode", string("invalid json: ") + e.what());
  }
  if (!j.is_object())
  {
    throw ManifestError(manifest_url, "decode", "manifest is not a json object");
  }

  Manifest m;
  m.inventory_bucket_arn = string_field(j, "destinationBucket", manifest_url);
  m.source_bucket        = string_field(j, "sourceBucket", manifest_url);
  m.format_name          = string_field(j, "fileFormat", manifest_url);

  auto files = j.find("files");
  if (files != j.end() && !files->is_null())
  {
    if (!files->is_array())
    {
      throw ManifestError(manifest_url, "decode", "field 'files' is not an array");
    }
    m.files.reserve(files->size());
    for (size_t i = 0; i < files->size(); ++i)
    {
      const json& f = (*files)[i];
      if (!f.is_object() || !f.contains("key") || !f["key"].is_string())
      {
        ostringstream oss;
        oss << "files[" << i << "] has no string 'key'";
        throw ManifestError(manifest_url, "decode", oss.str());
      }
      m.files.push_back(ShardFile{f["key"].get<string>()});
    }
  }

  auto format = parse_file_format(m.format_name);
  if (!format)
  {
    throw UnsupportedFormatError(manifest_url, m.format_name);
  }
  m.format = *format;
  m.url = manifest_url;

  try
  {
    m.inventory_bucket = parse_arn(m.inventory_bucket_arn).resource;
  }
  catch (const invalid_argument& e)
  {
    throw MalformedArnError(manifest_url, m.inventory_bucket_arn, e.what());
  }
  return m;
}

Manifest load_manifest(const string& manifest_url, IObjectStore& store)
{
  pair<string, string> location;
  try
  {
    location = parse_object_url(manifest_url);
  }
  catch (const invalid_argument& e)
  {
    throw ManifestError(manifest_url, "fetch", e.what());
  }

  string body;
  try
  {
    body = store.get_object(location.first, location.second);
  }
  catch (const exception& e)
  {
    throw ManifestError(manifest_url, "fetch", e.what());
  }

  Manifest m = parse_manifest(body, manifest_url);

  ostringstream oss;
  oss << "[load_manifest] url=" << m.url
      << " format=" << m.format_name
      << " source_bucket=" << m.source_bucket
      << " inventory_bucket=" << m.inventory_bucket
      << " files=" << m.files.size();
  log_message(oss.str());
  return m;
}

} // namespace inventory
