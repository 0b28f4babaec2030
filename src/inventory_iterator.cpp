// inventory_iterator.cpp
// Shard-by-shard concatenation of the ordered inventory

#include "inventory/inventory_iterator.h"
#include "inventory/errors.h"
#include "inventory/logging.h"
#include "inventory/shard_reader.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

using namespace std;

namespace inventory
{

InventoryIterator::InventoryIterator(shared_ptr<const Manifest> manifest,
                                     shared_ptr<const vector<ShardFile>> files,
                                     IShardReaderFactory& factory,
                                     ShardRange range,
                                     stop_token stop)
: InventoryIterator(manifest, files, factory, IteratorPosition{range.first, 0}, range, move(stop))
{
}

InventoryIterator::InventoryIterator(shared_ptr<const Manifest> manifest,
                                     shared_ptr<const vector<ShardFile>> files,
                                     IShardReaderFactory& factory,
                                     IteratorPosition start,
                                     ShardRange range,
                                     stop_token stop)
: manifest_(move(manifest)), files_(move(files)), factory_(factory), stop_(move(stop)), start_(start)
{
  if (!manifest_ || !files_)
  {
    throw invalid_argument("iterator needs a manifest and a shard list");
  }
  last_ = min(range.last, files_->size());
  if (range.first > last_)
  {
    throw invalid_argument("shard range starts at " + to_string(range.first) +
                           " beyond its end " + to_string(last_));
  }
  if (start_.shard_index < range.first || start_.shard_index > last_ || start_.row < 0)
  {
    throw invalid_argument("start position (" + to_string(start_.shard_index) + ", " +
                           to_string(start_.row) + ") outside shard range");
  }
  shard_ = start_.shard_index;
  row_ = start_.row;
}

InventoryIterator::~InventoryIterator()
{
  close_reader();
}

IteratorPosition InventoryIterator::position() const
{
  return IteratorPosition{shard_, row_};
}

void InventoryIterator::close()
{
  pending_error_ = nullptr;
  finish();
}

// Close failures never end iteration; they are logged
void InventoryIterator::close_reader()
{
  if (!reader_) return;
  unique_ptr<IShardReader> r = move(reader_);
  try
  {
    r->close();
  }
  catch (const exception& e)
  {
    log_error(string("[InventoryIterator] close failed: ") + e.what());
  }
}

void InventoryIterator::finish()
{
  close_reader();
  state_ = State::Exhausted;
}

void InventoryIterator::check_stop()
{
  if (stop_.stop_requested())
  {
    finish();
    throw CancelledError("inventory iteration cancelled at shard " + to_string(shard_) +
                         ", row " + to_string(row_));
  }
}

void InventoryIterator::fail(const string& stage, const exception& e)
{
  const string key = shard_ < files_->size() ? (*files_)[shard_].key : string();
  finish();
  if (const auto* se = dynamic_cast<const ShardError*>(&e))
  {
    throw ShardError(se->shard_key(), se->stage(), se->detail(), manifest_->url);
  }
  throw ShardError(key, stage, e.what(), manifest_->url);
}

void InventoryIterator::open_shard()
{
  const string& key = (*files_)[shard_].key;
  try
  {
    reader_ = factory_.open(*manifest_, key);
  }
  catch (const exception& e)
  {
    fail("open", e);
  }

  // resumed start: skip rows already consumed
  if (row_ > 0)
  {
    try
    {
      reader_->skip(row_);
    }
    catch (const exception& e)
    {
      fail("skip", e);
    }
  }
}

// End of the current shard: release it and move to the next one
void InventoryIterator::advance()
{
  close_reader();
  ++shard_;
  row_ = 0;
  if (shard_ >= last_)
  {
    shard_ = last_;
    state_ = State::Exhausted;
  }
}

size_t InventoryIterator::next_batch(vector<ObjectRecord>& buf)
{
  // a failure after part of the previous batch was filled surfaces now
  if (pending_error_)
  {
    exception_ptr e = move(pending_error_);
    pending_error_ = nullptr;
    rethrow_exception(e);
  }
  if (state_ == State::Exhausted) return 0;
  if (buf.empty())
  {
    throw invalid_argument("next_batch needs a non-empty buffer");
  }
  check_stop();

  if (state_ == State::NotStarted)
  {
    state_ = State::ReadingShard;
    if (shard_ >= last_)
    {
      finish();
      return 0;
    }
  }

  size_t filled = 0;
  while (filled < buf.size() && state_ == State::ReadingShard)
  {
    const size_t want = buf.size() - filled;
    size_t n = 0;
    try
    {
      if (!reader_)
      {
        if (filled > 0 && stop_.stop_requested()) break;
        check_stop();
        open_shard();
      }

      try
      {
        if (filled == 0)
        {
          n = reader_->read_batch(buf);
        }
        else
        {
          scratch_.resize(want);
          n = reader_->read_batch(scratch_);
          move(scratch_.begin(), scratch_.begin() + static_cast<ptrdiff_t>(n),
               buf.begin() + static_cast<ptrdiff_t>(filled));
        }
      }
      catch (const exception& e)
      {
        fail("read", e);
      }
    }
    catch (const ShardError&)
    {
      if (filled == 0) throw;
      pending_error_ = current_exception();
      break;
    }

    filled += n;
    row_ += static_cast<int64_t>(n);
    if (n < want) advance();
  }
  return filled;
}

vector<ObjectRecord> InventoryIterator::next(size_t batch_size_hint)
{
  vector<ObjectRecord> out(max<size_t>(batch_size_hint, 1));
  out.resize(next_batch(out));
  return out;
}

} // namespace inventory
