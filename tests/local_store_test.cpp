// local_store_test.cpp

#include "inventory/errors.h"
#include "inventory/local_object_store.h"
#include "shard_fixtures.h"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

using namespace inventory;
using namespace inventory_test;

class LocalStoreTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    std::filesystem::create_directories(dir.path() / "b" / "dir");
    std::ofstream(dir.path() / "b" / "dir" / "obj.bin", std::ios::binary) << "0123456789";
  }

  TempDir dir;
  LocalObjectStore store{dir.path().string()};
};

TEST_F(LocalStoreTest, GetObject)
{
  EXPECT_EQ(store.get_object("b", "dir/obj.bin"), "0123456789");
  EXPECT_EQ(store.get_object("b", "/dir/obj.bin"), "0123456789");
}

TEST_F(LocalStoreTest, HeadObject)
{
  EXPECT_EQ(store.head_object("b", "dir/obj.bin").size, 10u);
}

TEST_F(LocalStoreTest, RangeIsClampedAtEnd)
{
  EXPECT_EQ(store.get_range("b", "dir/obj.bin", 2, 3), "234");
  EXPECT_EQ(store.get_range("b", "dir/obj.bin", 8, 100), "89");
  EXPECT_EQ(store.get_range("b", "dir/obj.bin", 10, 4), "");
  EXPECT_THROW(store.get_range("b", "dir/obj.bin", 11, 1), ObjectStoreError);
}

TEST_F(LocalStoreTest, MissingObjectIs404)
{
  try
  {
    store.get_object("b", "nope");
    FAIL() << "expected ObjectStoreError";
  }
  catch (const ObjectStoreError& e)
  {
    EXPECT_EQ(e.http_status(), 404);
    EXPECT_EQ(e.bucket(), "b");
    EXPECT_EQ(e.key(), "nope");
  }
}

TEST_F(LocalStoreTest, DownloadCopiesWholeObject)
{
  const std::string dst = (dir.path() / "copy.bin").string();
  store.download("b", "dir/obj.bin", dst);
  std::ifstream in(dst, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  EXPECT_EQ(ss.str(), "0123456789");
}
