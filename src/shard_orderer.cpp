// shard_orderer.cpp
// Two-phase ordering: collect footer boundaries, then sort once

#include "inventory/shard_orderer.h"
#include "inventory/errors.h"
#include "inventory/logging.h"
#include "inventory/shard_reader.h"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace inventory
{

OrderingResult order_shards(const Manifest& m, IShardReaderFactory& factory)
{
  vector<ShardBoundary> bounds(m.files.size());

  for (size_t i = 0; i < m.files.size(); ++i)
  {
    const string& key = m.files[i].key;
    try
    {
      unique_ptr<IShardMetadataReader> reader = factory.open_metadata(m, key);
      bounds[i].min_key = reader->min_value();
      bounds[i].max_key = reader->max_value();
      bounds[i].rows = reader->row_count();
      try
      {
        reader->close();
      }
      catch (const exception& e)
      {
        log_warning("[order_shards] close failed for " + key + ": " + e.what());
      }
    }
    catch (const exception& e)
    {
      throw OrderingError(m.url, key, e.what());
    }
  }

  vector<size_t> order(m.files.size());
  iota(order.begin(), order.end(), size_t{0});
  stable_sort(order.begin(), order.end(), [&](size_t a, size_t b)
  {
    if (bounds[a].min_key != bounds[b].min_key) return bounds[a].min_key < bounds[b].min_key;
    return bounds[a].max_key < bounds[b].max_key;
  });

  OrderingResult result;
  result.files.reserve(order.size());
  result.boundaries.reserve(order.size());
  for (size_t idx : order)
  {
    result.files.push_back(m.files[idx]);
    result.boundaries.push_back(bounds[idx]);
  }

  // boundary check only, rows are never compared
  size_t overlaps = 0;
  size_t first = 0;
  for (size_t i = 0; i + 1 < result.boundaries.size(); ++i)
  {
    if (result.boundaries[i].max_key > result.boundaries[i + 1].min_key)
    {
      if (overlaps == 0) first = i;
      ++overlaps;
    }
  }
  if (overlaps > 0)
  {
    ostringstream oss;
    oss << "[order_shards] " << overlaps << " overlapping shard pair(s), first: "
        << result.files[first].key << " [" << result.boundaries[first].max_key << "] > "
        << result.files[first + 1].key << " [" << result.boundaries[first + 1].min_key << "]";
    log_warning(oss.str());
  }

  log_message("[order_shards] ordered " + to_string(result.files.size()) + " shards of " + m.url);
  return result;
}

} // namespace inventory
