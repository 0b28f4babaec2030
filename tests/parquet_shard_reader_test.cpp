// parquet_shard_reader_test.cpp

#include "inventory/errors.h"
#include "inventory/logging.h"
#include "inventory/manifest.h"
#include "inventory/parquet_shard_reader.h"
#include "inventory/shard_reader.h"
#include "shard_fixtures.h"

#include <gtest/gtest.h>

#include <fstream>

using namespace inventory;
using namespace inventory_test;
namespace fs = std::filesystem;

namespace
{

struct QuietLog : ::testing::Environment
{
  void SetUp() override { set_log_console(false); }
};
const auto* const kQuiet = ::testing::AddGlobalTestEnvironment(new QuietLog);

std::vector<ObjectRecord> read_all(IShardReader& r, size_t batch)
{
  std::vector<ObjectRecord> out;
  std::vector<ObjectRecord> buf(batch);
  while (size_t n = r.read_batch(buf))
  {
    out.insert(out.end(), buf.begin(), buf.begin() + n);
  }
  return out;
}

void expect_same(const std::vector<ObjectRecord>& got, const std::vector<ObjectRecord>& want)
{
  ASSERT_EQ(got.size(), want.size());
  for (size_t i = 0; i < want.size(); ++i)
  {
    EXPECT_EQ(got[i].bucket, want[i].bucket) << "row " << i;
    EXPECT_EQ(got[i].key, want[i].key) << "row " << i;
    EXPECT_EQ(got[i].size, want[i].size) << "row " << i;
    EXPECT_EQ(got[i].last_modified, want[i].last_modified) << "row " << i;
    EXPECT_EQ(got[i].checksum, want[i].checksum) << "row " << i;
  }
}

} // namespace

class ParquetShardReaderTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    rows = make_records(numbered_keys("k", 10));
    path = (dir.path() / "shard.parquet").string();
    write_parquet_shard(path, rows, 4);   // row groups of 4, 4, 2
  }

  TempDir dir;
  std::vector<ObjectRecord> rows;
  std::string path;
};

TEST_F(ParquetShardReaderTest, ReadsEveryRecord)
{
  ParquetShardReader r(path, "shard.parquet");
  EXPECT_EQ(r.row_count(), 10);
  expect_same(read_all(r, 3), rows);
}

TEST_F(ParquetShardReaderTest, KeyBoundariesFromStatistics)
{
  ParquetShardReader r(path, "shard.parquet");
  EXPECT_EQ(r.min_value(), "k0");
  EXPECT_EQ(r.max_value(), "k9");
}

TEST_F(ParquetShardReaderTest, BatchLargerThanShard)
{
  ParquetShardReader r(path, "shard.parquet");
  std::vector<ObjectRecord> buf(100);
  EXPECT_EQ(r.read_batch(buf), 10u);
  EXPECT_EQ(r.read_batch(buf), 0u);
  EXPECT_EQ(r.read_batch(buf), 0u);
}

TEST_F(ParquetShardReaderTest, SkipWithinAndAcrossRowGroups)
{
  ParquetShardReader r(path, "shard.parquet");
  r.skip(0);
  r.skip(2);
  std::vector<ObjectRecord> buf(1);
  ASSERT_EQ(r.read_batch(buf), 1u);
  EXPECT_EQ(buf[0].key, "k2");

  r.skip(5);   // lands in the last row group
  ASSERT_EQ(r.read_batch(buf), 1u);
  EXPECT_EQ(buf[0].key, "k8");
}

TEST_F(ParquetShardReaderTest, SkipWholeRowGroupsFromStart)
{
  ParquetShardReader r(path, "shard.parquet");
  r.skip(8);
  std::vector<ObjectRecord> got = read_all(r, 5);
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0].key, "k8");
  EXPECT_EQ(got[1].key, "k9");
}

TEST_F(ParquetShardReaderTest, SkipPastEndFailsAndKeepsCursor)
{
  ParquetShardReader r(path, "shard.parquet");
  r.skip(3);
  try
  {
    r.skip(8);
    FAIL() << "expected ShardError";
  }
  catch (const ShardError& e)
  {
    EXPECT_EQ(e.stage(), "skip");
    EXPECT_EQ(e.shard_key(), "shard.parquet");
  }
  std::vector<ObjectRecord> buf(1);
  ASSERT_EQ(r.read_batch(buf), 1u);
  EXPECT_EQ(buf[0].key, "k3");
}

TEST_F(ParquetShardReaderTest, CloseRemovesLocalCopy)
{
  ParquetShardReader r(path, "shard.parquet", true);
  r.close();
  EXPECT_FALSE(fs::exists(path));
  r.close();
  std::vector<ObjectRecord> buf(1);
  EXPECT_THROW(r.read_batch(buf), ShardError);
}

TEST_F(ParquetShardReaderTest, KeepsFileWithoutRemoveOnClose)
{
  {
    ParquetShardReader r(path, "shard.parquet");
  }
  EXPECT_TRUE(fs::exists(path));
}

TEST_F(ParquetShardReaderTest, CorruptFileFailsOpen)
{
  const std::string bad = (dir.path() / "bad.parquet").string();
  std::ofstream(bad, std::ios::binary) << "this is not parquet at all";
  try
  {
    ParquetShardReader r(bad, "bad.parquet");
    FAIL() << "expected ShardError";
  }
  catch (const ShardError& e)
  {
    EXPECT_EQ(e.stage(), "open");
  }
}

TEST(ParquetMetadataReaderTest, ReadsFooterThroughRanges)
{
  InventoryFixture fx(FileFormat::Parquet);
  const std::string key = fx.add_shard("m.parquet", make_records({"b", "c", "a", "d"}));
  ParquetMetadataReader r(fx.store(), InventoryFixture::kInventoryBucket, key);
  EXPECT_EQ(r.row_count(), 4);
  EXPECT_EQ(r.min_value(), "a");
  EXPECT_EQ(r.max_value(), "d");
  r.close();
  r.close();
}

TEST(ParquetMetadataReaderTest, MissingAndCorruptShards)
{
  InventoryFixture fx(FileFormat::Parquet);
  EXPECT_THROW(ParquetMetadataReader(fx.store(), InventoryFixture::kInventoryBucket, "missing"), ShardError);
  fx.put("junk.parquet", "PAR1 but no footer here");
  try
  {
    ParquetMetadataReader r(fx.store(), InventoryFixture::kInventoryBucket, "junk.parquet");
    FAIL() << "expected ShardError";
  }
  catch (const ShardError& e)
  {
    EXPECT_EQ(e.stage(), "metadata");
  }
}

TEST(ShardReaderFactoryTest, OpensParquetFromStore)
{
  InventoryFixture fx(FileFormat::Parquet);
  const auto want = make_records(numbered_keys("p", 7));
  const std::string key = fx.add_shard("f.parquet", want);
  const Manifest m = load_manifest(fx.write_manifest({key}), fx.store());

  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  auto meta = factory.open_metadata(m, key);
  EXPECT_EQ(meta->row_count(), 7);

  auto r = factory.open(m, key);
  expect_same(read_all(*r, 4), want);
  EXPECT_FALSE(fs::is_empty(fx.scratch_dir()));
  r->close();
  EXPECT_TRUE(fs::is_empty(fx.scratch_dir()));
}

TEST(ShardReaderFactoryTest, MissingShardFailsOpen)
{
  InventoryFixture fx(FileFormat::Parquet);
  const Manifest m = load_manifest(fx.write_manifest({"gone.parquet"}), fx.store());
  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  try
  {
    factory.open(m, "gone.parquet");
    FAIL() << "expected ShardError";
  }
  catch (const ShardError& e)
  {
    EXPECT_EQ(e.stage(), "open");
    EXPECT_EQ(e.shard_key(), "gone.parquet");
  }
  EXPECT_TRUE(fs::is_empty(fx.scratch_dir()));
}
