#pragma once

#include "inventory/manifest.h"
#include "inventory/object_record.h"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace inventory
{

class IShardReader;
class IShardReaderFactory;

struct IteratorPosition
{
  size_t shard_index = 0;
  int64_t row = 0;
};

// Half-open range of shard indexes; `last` is clamped to the shard count
struct ShardRange
{
  size_t first = 0;
  size_t last = std::numeric_limits<size_t>::max();
};

// Forward-only cursor over the ordered shards. Holds at most one open
// reader; it is closed on end-of-shard, error, cancellation and destruction.
class InventoryIterator
{
public:
  // Throws std::invalid_argument when range or start lies outside the shards
  InventoryIterator(std::shared_ptr<const Manifest> manifest,
                    std::shared_ptr<const std::vector<ShardFile>> files,
                    IShardReaderFactory& factory,
                    ShardRange range = {},
                    std::stop_token stop = {});
  InventoryIterator(std::shared_ptr<const Manifest> manifest,
                    std::shared_ptr<const std::vector<ShardFile>> files,
                    IShardReaderFactory& factory,
                    IteratorPosition start,
                    ShardRange range = {},
                    std::stop_token stop = {});
  ~InventoryIterator();

  InventoryIterator(const InventoryIterator&) = delete;
  InventoryIterator& operator=(const InventoryIterator&) = delete;

  // Fill buf (its size is the batch size). Returns 0 only when exhausted.
  // Throws ShardError on open/skip/read failure and CancelledError on stop;
  // after either the iterator is exhausted. A shard failure met after part
  // of buf was filled is thrown by the following call.
  size_t next_batch(std::vector<ObjectRecord>& buf);

  std::vector<ObjectRecord> next(size_t batch_size_hint = 1000);

  IteratorPosition position() const;
  bool done() const { return state_ == State::Exhausted; }

  // Release the open reader and stop; later calls return 0
  void close();

private:
  enum class State { NotStarted, ReadingShard, Exhausted };

  void open_shard();
  void advance();
  void close_reader();
  void finish();
  void check_stop();
  [[noreturn]] void fail(const std::string& stage, const std::exception& e);

  std::shared_ptr<const Manifest> manifest_;
  std::shared_ptr<const std::vector<ShardFile>> files_;
  IShardReaderFactory& factory_;
  std::stop_token stop_;

  size_t last_ = 0;
  IteratorPosition start_;

  State state_ = State::NotStarted;
  size_t shard_ = 0;
  int64_t row_ = 0;
  std::unique_ptr<IShardReader> reader_;
  std::vector<ObjectRecord> scratch_;
  std::exception_ptr pending_error_;
};

} // namespace inventory
