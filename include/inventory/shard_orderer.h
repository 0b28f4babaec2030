#pragma once

#include "inventory/manifest.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace inventory
{

class IShardReaderFactory;

struct ShardBoundary
{
  std::string min_key;
  std::string max_key;
  int64_t rows = 0;
};

struct OrderingResult
{
  std::vector<ShardFile> files;            // sorted by (min_key, max_key)
  std::vector<ShardBoundary> boundaries;   // parallel to files
};

// Read every shard's key boundaries from its footer and return the shards
// sorted by them. The manifest is left as loaded. Throws OrderingError.
OrderingResult order_shards(const Manifest& m, IShardReaderFactory& factory);

} // namespace inventory
