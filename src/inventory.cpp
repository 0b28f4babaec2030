// inventory.cpp
#include "inventory/inventory.h"
#include "inventory/errors.h"
#include "inventory/logging.h"
#include "inventory/shard_orderer.h"
#include "inventory/shard_reader.h"

#include <utility>

using namespace std;

namespace inventory
{

Inventory Inventory::generate(const string& manifest_url, IObjectStore& store,
                              IShardReaderFactory& factory, const InventoryOptions& options)
{
  return Inventory(load_manifest(manifest_url, store), factory, options);
}

Inventory::Inventory(Manifest manifest, IShardReaderFactory& factory, const InventoryOptions& options)
: factory_(&factory)
{
  auto m = make_shared<const Manifest>(move(manifest));
  manifest_ = m;

  if (!options.sort)
  {
    files_ = make_shared<const vector<ShardFile>>(m->files);
    return;
  }

  try
  {
    OrderingResult ordered = order_shards(*m, factory);
    files_ = make_shared<const vector<ShardFile>>(move(ordered.files));
    sorted_ = true;
  }
  catch (const OrderingError& e)
  {
    if (!options.tolerate_sort_failure) throw;
    log_warning(string("[Inventory] ") + e.what() + "; using manifest order");
    files_ = make_shared<const vector<ShardFile>>(m->files);
  }
}

unique_ptr<InventoryIterator> Inventory::iterator(stop_token stop) const
{
  return make_unique<InventoryIterator>(manifest_, files_, *factory_, ShardRange{}, move(stop));
}

unique_ptr<InventoryIterator> Inventory::iterator(ShardRange range, stop_token stop) const
{
  return make_unique<InventoryIterator>(manifest_, files_, *factory_, range, move(stop));
}

unique_ptr<InventoryIterator> Inventory::iterator_from(IteratorPosition position, stop_token stop) const
{
  return make_unique<InventoryIterator>(manifest_, files_, *factory_, position, ShardRange{}, move(stop));
}

} // namespace inventory
