#pragma once

#include "inventory/inventory_iterator.h"
#include "inventory/manifest.h"

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace inventory
{

class IObjectStore;
class IShardReaderFactory;

struct InventoryOptions
{
  bool sort = true;
  // on an ordering failure keep the manifest order instead of throwing
  bool tolerate_sort_failure = false;
};

// A loaded (and usually ordered) inventory. Iterators share the ordered
// shard list read-only and own their readers. The factory must outlive
// the inventory and every iterator made from it.
class Inventory
{
public:
  static Inventory generate(const std::string& manifest_url, IObjectStore& store,
                            IShardReaderFactory& factory, const InventoryOptions& options = {});

  // Wrap an already parsed manifest
  Inventory(Manifest manifest, IShardReaderFactory& factory, const InventoryOptions& options = {});

  std::unique_ptr<InventoryIterator> iterator(std::stop_token stop = {}) const;
  std::unique_ptr<InventoryIterator> iterator(ShardRange range, std::stop_token stop = {}) const;
  std::unique_ptr<InventoryIterator> iterator_from(IteratorPosition position, std::stop_token stop = {}) const;

  const std::string& source_name() const { return manifest_->source_bucket; }
  const std::string& inventory_url() const { return manifest_->url; }
  const Manifest& manifest() const { return *manifest_; }
  const std::vector<ShardFile>& shards() const { return *files_; }
  size_t shard_count() const { return files_->size(); }
  bool sorted() const { return sorted_; }

private:
  std::shared_ptr<const Manifest> manifest_;
  std::shared_ptr<const std::vector<ShardFile>> files_;
  IShardReaderFactory* factory_;
  bool sorted_ = false;
};

} // namespace inventory
