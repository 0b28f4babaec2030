// inventory_test.cpp
// End to end over real shards in a local store

#include "inventory/errors.h"
#include "inventory/inventory.h"
#include "inventory/logging.h"
#include "inventory/shard_reader.h"
#include "shard_fixtures.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>

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

std::vector<std::string> padded_keys(const std::string& prefix, int from, int count)
{
  std::vector<std::string> keys;
  for (int i = from; i < from + count; ++i)
  {
    char num[16];
    snprintf(num, sizeof(num), "%06d", i);
    keys.push_back(prefix + num);
  }
  return keys;
}

} // namespace

class InventoryFormatTest : public ::testing::TestWithParam<FileFormat>
{
};

TEST_P(InventoryFormatTest, ProviderSeedsAreComplete)
{
  InventoryFixture fx(GetParam());
  const std::string small = fx.add_shard("small", make_records({"boo", "loo"}));
  const std::string large = fx.add_shard("large", make_records(numbered_keys("f", 12500)));
  const std::string url = fx.write_manifest({small, large});

  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  Inventory inv = Inventory::generate(url, fx.store(), factory);
  EXPECT_EQ(inv.source_name(), InventoryFixture::kSourceBucket);
  EXPECT_EQ(inv.inventory_url(), url);
  EXPECT_EQ(inv.shard_count(), 2u);
  EXPECT_TRUE(inv.sorted());

  auto it = inv.iterator();
  std::vector<ObjectRecord> buf(1000);
  std::vector<std::string> keys;
  while (size_t n = it->next_batch(buf))
  {
    for (size_t i = 0; i < n; ++i)
    {
      ASSERT_EQ(buf[i].bucket, InventoryFixture::kSourceBucket);
      keys.push_back(buf[i].key);
    }
  }
  std::vector<std::string> expected = numbered_keys("f", 12500);
  expected.push_back("boo");
  expected.push_back("loo");
  std::sort(expected.begin(), expected.end());
  std::sort(keys.begin(), keys.end());
  EXPECT_EQ(keys.size(), 12502u);
  EXPECT_EQ(keys, expected);
  EXPECT_TRUE(fs::is_empty(fx.scratch_dir()));
}

TEST_P(InventoryFormatTest, SingleShardBatchCounts)
{
  InventoryFixture fx(GetParam());
  const std::string key = fx.add_shard("only", make_records(numbered_keys("f", 12500)));
  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  Inventory inv = Inventory::generate(fx.write_manifest({key}), fx.store(), factory);

  auto it = inv.iterator();
  std::vector<size_t> sizes;
  while (true)
  {
    std::vector<ObjectRecord> batch = it->next(1000);
    if (batch.empty()) break;
    sizes.push_back(batch.size());
  }
  ASSERT_EQ(sizes.size(), 13u);
  EXPECT_EQ(sizes.front(), 1000u);
  EXPECT_EQ(sizes.back(), 500u);
}

TEST_P(InventoryFormatTest, DisjointShardsOutOfManifestOrder)
{
  InventoryFixture fx(GetParam());
  const std::string s3 = fx.add_shard("s3", make_records(padded_keys("k", 2000, 700)));
  const std::string s1 = fx.add_shard("s1", make_records(padded_keys("k", 0, 900)));
  const std::string s2 = fx.add_shard("s2", make_records(padded_keys("k", 900, 1100)));
  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  Inventory inv = Inventory::generate(fx.write_manifest({s3, s1, s2}), fx.store(), factory);

  ASSERT_EQ(inv.shard_count(), 3u);
  EXPECT_EQ(inv.shards()[0].key, s1);
  EXPECT_EQ(inv.shards()[1].key, s2);
  EXPECT_EQ(inv.shards()[2].key, s3);
  EXPECT_EQ(inv.manifest().files[0].key, s3);

  auto it = inv.iterator();
  std::vector<std::string> keys;
  std::vector<ObjectRecord> buf(333);
  while (size_t n = it->next_batch(buf))
  {
    for (size_t i = 0; i < n; ++i) keys.push_back(buf[i].key);
  }
  EXPECT_EQ(keys.size(), 2700u);
  EXPECT_TRUE(std::is_sorted(keys.begin(), keys.end()));
}

TEST_P(InventoryFormatTest, ResumeAcrossIterators)
{
  InventoryFixture fx(GetParam());
  const std::string a = fx.add_shard("a", make_records(padded_keys("k", 0, 1500)));
  const std::string b = fx.add_shard("b", make_records(padded_keys("k", 1500, 1500)));
  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  Inventory inv = Inventory::generate(fx.write_manifest({b, a}), fx.store(), factory);

  auto first = inv.iterator();
  std::vector<ObjectRecord> buf(1000);
  ASSERT_EQ(first->next_batch(buf), 1000u);
  ASSERT_EQ(first->next_batch(buf), 1000u);
  const IteratorPosition pos = first->position();
  EXPECT_EQ(pos.shard_index, 1u);
  EXPECT_EQ(pos.row, 500);
  first.reset();

  auto resumed = inv.iterator_from(pos);
  std::vector<ObjectRecord> rest = resumed->next(5000);
  ASSERT_EQ(rest.size(), 1000u);
  EXPECT_EQ(rest.front().key, "k002000");
  EXPECT_EQ(rest.back().key, "k002999");
  EXPECT_TRUE(fs::is_empty(fx.scratch_dir()));
}

TEST_P(InventoryFormatTest, CorruptShardIsReportedWhenRead)
{
  InventoryFixture fx(GetParam());
  const std::string good = fx.add_shard("good", make_records({"a", "b"}));
  fx.put("broken", "definitely not a columnar file");
  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  const std::string url = fx.write_manifest({good, "broken"});

  EXPECT_THROW(Inventory::generate(url, fx.store(), factory), OrderingError);

  Inventory inv = Inventory::generate(url, fx.store(), factory, InventoryOptions{true, true});
  EXPECT_FALSE(inv.sorted());
  auto it = inv.iterator();
  std::vector<ObjectRecord> buf(10);
  EXPECT_EQ(it->next_batch(buf), 2u);
  try
  {
    it->next_batch(buf);
    FAIL() << "expected ShardError";
  }
  catch (const ShardError& e)
  {
    EXPECT_EQ(e.shard_key(), "broken");
    EXPECT_EQ(e.stage(), "open");
    EXPECT_EQ(e.manifest_url(), url);
  }
  EXPECT_TRUE(fs::is_empty(fx.scratch_dir()));
}

INSTANTIATE_TEST_SUITE_P(Formats, InventoryFormatTest,
                         ::testing::Values(FileFormat::Orc, FileFormat::Parquet),
                         [](const ::testing::TestParamInfo<FileFormat>& info)
                         {
                           return std::string(file_format_name(info.param));
                         });

TEST(InventoryTest, UnsupportedFormatTouchesNoShard)
{
  InventoryFixture fx(FileFormat::Orc);
  const std::string key = "source-bucket/config/manifest.json";
  fx.put(key, manifest_json("arn:aws:s3:::inventory-dest", "source-bucket", "CSV", {"missing-shard"}));
  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  EXPECT_THROW(Inventory::generate("s3://inventory-dest/" + key, fx.store(), factory), UnsupportedFormatError);
}

TEST(InventoryTest, MissingManifest)
{
  InventoryFixture fx(FileFormat::Parquet);
  ShardReaderFactory factory(fx.store(), fx.scratch_dir());
  EXPECT_THROW(Inventory::generate("s3://inventory-dest/none.json", fx.store(), factory), ManifestError);
}
