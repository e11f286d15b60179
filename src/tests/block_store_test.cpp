#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>
#include <thread>
#include <vector>
#include "store/block_store.hpp"
#include "utils/digest.hpp"
#include "test_utils.hpp"

using namespace cloudsim::store;

class BlockStoreTest : public ::testing::Test {
protected:
  static constexpr uint32_t BLOCK_SIZE = 1024;
  static constexpr uint64_t CAPACITY = 16 * BLOCK_SIZE;

  std::filesystem::path test_dir;
  BlockStoreConfig config;
  std::unique_ptr<BlockStore> store;

  void SetUp() override {
    test_dir = make_temp_dir("block_store_test");
    config.storage_root = test_dir.string();
    config.capacity_bytes = CAPACITY;
    config.block_size = BLOCK_SIZE;
    store = std::make_unique<BlockStore>("node_0", config);
  }

  void TearDown() override {
    store.reset();
    std::filesystem::remove_all(test_dir);
  }

  static std::vector<uint8_t> pattern(std::size_t size, uint8_t seed = 7) {
    std::vector<uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
      data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return data;
  }

  // allocated_blocks + free_blocks == total_blocks, both by counters and by the block map
  void expect_block_accounting() {
    StorageInfo info = store->get_storage_info();
    EXPECT_EQ(info.allocated_blocks + info.free_blocks, info.total_blocks);

    uint32_t non_free = 0;
    for (const auto& block : store->get_block_map()) {
      if (block.status != BlockStatus::FREE) {
        ++non_free;
      }
    }
    EXPECT_EQ(non_free, info.allocated_blocks);
  }
};

TEST_F(BlockStoreTest, GeometryFromCapacityAndBlockSize) {
  StorageInfo info = store->get_storage_info();
  EXPECT_EQ(info.total_blocks, 16u);
  EXPECT_EQ(info.block_size, BLOCK_SIZE);
  EXPECT_EQ(info.total_capacity, CAPACITY);
  EXPECT_EQ(info.free_blocks, 16u);
  EXPECT_EQ(info.file_count, 0u);

  EXPECT_TRUE(std::filesystem::exists(test_dir / "node_0" / "disk.img"));
  EXPECT_TRUE(std::filesystem::exists(test_dir / "node_0" / "metadata.json"));
  EXPECT_EQ(std::filesystem::file_size(test_dir / "node_0" / "disk.img"), CAPACITY);
}

TEST_F(BlockStoreTest, PartialTrailingBlockIsUnusable) {
  BlockStoreConfig odd = config;
  odd.capacity_bytes = 10 * BLOCK_SIZE + 500;
  BlockStore disk("node_odd", odd);
  EXPECT_EQ(disk.get_storage_info().total_blocks, 10u);
  EXPECT_EQ(disk.get_storage_info().total_capacity, 10u * BLOCK_SIZE);
}

TEST_F(BlockStoreTest, UnusableGeometryThrows) {
  BlockStoreConfig zero_block = config;
  zero_block.block_size = 0;
  EXPECT_THROW(BlockStore("node_bad", zero_block), StoreError);

  BlockStoreConfig tiny = config;
  tiny.capacity_bytes = BLOCK_SIZE - 1;
  EXPECT_THROW(BlockStore("node_tiny", tiny), StoreError);
}

TEST_F(BlockStoreTest, AllocatesFirstFitInBlockOrder) {
  auto blocks = store->allocate("file_a", "a.txt", 2500);
  ASSERT_TRUE(blocks.has_value());
  EXPECT_EQ(*blocks, (std::vector<uint32_t>{0, 1, 2}));

  auto file = store->get_file("file_a");
  ASSERT_TRUE(file.has_value());
  EXPECT_EQ(file->filename, "a.txt");
  EXPECT_EQ(file->size, 2500u);
  EXPECT_EQ(file->checksum, cloudsim::utils::md5_hex(std::string("file_a-a.txt-2500")));

  StorageInfo info = store->get_storage_info();
  EXPECT_EQ(info.allocated_blocks, 3u);
  EXPECT_EQ(info.used_storage, 2500u);
  expect_block_accounting();

  for (const auto& block : store->get_block_map()) {
    if (block.block_id < 3) {
      EXPECT_EQ(block.status, BlockStatus::ALLOCATED);
      EXPECT_EQ(block.file_id.value_or(""), "file_a");
      EXPECT_FALSE(block.checksum.has_value());
    }
  }
}

TEST_F(BlockStoreTest, RoundTripAcrossBlockBoundaries) {
  auto data = pattern(3000);
  ASSERT_TRUE(store->allocate("file_a", "a.bin", data.size()));
  ASSERT_TRUE(store->write("file_a", data));

  auto read = store->read("file_a", data.size());
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, data);

  // Offset write and read starting inside the second block
  auto patch = pattern(600, 99);
  ASSERT_TRUE(store->write("file_a", patch, 1500));
  auto window = store->read("file_a", patch.size(), 1500);
  ASSERT_TRUE(window.has_value());
  EXPECT_EQ(*window, patch);
}

TEST_F(BlockStoreTest, WriteMarksBlocksOccupiedWithChecksums) {
  auto data = pattern(1500);
  ASSERT_TRUE(store->allocate("file_a", "a.bin", data.size()));
  ASSERT_TRUE(store->write("file_a", data));

  auto map = store->get_block_map();
  EXPECT_EQ(map[0].status, BlockStatus::OCCUPIED);
  EXPECT_EQ(map[0].checksum.value_or(""), cloudsim::utils::md5_hex(data.data(), BLOCK_SIZE));
  EXPECT_EQ(map[1].status, BlockStatus::OCCUPIED);
  EXPECT_EQ(map[1].checksum.value_or(""),
            cloudsim::utils::md5_hex(data.data() + BLOCK_SIZE, data.size() - BLOCK_SIZE));
  EXPECT_EQ(map[2].status, BlockStatus::FREE);
  expect_block_accounting();
}

TEST_F(BlockStoreTest, UnknownFilesFailWithoutThrowing) {
  EXPECT_FALSE(store->write("missing", pattern(10)));
  EXPECT_FALSE(store->read("missing", 10).has_value());
  EXPECT_FALSE(store->delete_file("missing"));
  EXPECT_FALSE(store->has_file("missing"));
  EXPECT_FALSE(store->get_file("missing").has_value());
}

TEST_F(BlockStoreTest, WritePastAllocationFails) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 100));
  EXPECT_FALSE(store->write("file_a", pattern(BLOCK_SIZE + 1)));
  EXPECT_FALSE(store->write("file_a", pattern(10), BLOCK_SIZE - 5));
  EXPECT_TRUE(store->write("file_a", pattern(BLOCK_SIZE)));
}

TEST_F(BlockStoreTest, WriteAtHugeOffsetIsRejected) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 100));
  uint64_t offset = std::numeric_limits<uint64_t>::max() - 4;
  EXPECT_FALSE(store->write("file_a", pattern(16), offset));
  EXPECT_FALSE(store->write("file_a", pattern(1), BLOCK_SIZE + 1));

  auto block_map = store->get_block_map();
  EXPECT_EQ(block_map[0].status, BlockStatus::ALLOCATED);
}

TEST_F(BlockStoreTest, DuplicateFileIdIsRejected) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 100));
  EXPECT_FALSE(store->allocate("file_a", "other.bin", 100).has_value());
  EXPECT_EQ(store->get_storage_info().allocated_blocks, 1u);
}

TEST_F(BlockStoreTest, DeleteFreesBlocksForReuse) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 2 * BLOCK_SIZE));
  ASSERT_TRUE(store->allocate("file_b", "b.bin", 2 * BLOCK_SIZE));
  uint32_t before = store->get_storage_info().allocated_blocks;

  ASSERT_TRUE(store->allocate("file_c", "c.bin", BLOCK_SIZE));
  ASSERT_TRUE(store->delete_file("file_c"));
  EXPECT_EQ(store->get_storage_info().allocated_blocks, before);

  ASSERT_TRUE(store->delete_file("file_a"));
  auto reused = store->allocate("file_d", "d.bin", BLOCK_SIZE);
  ASSERT_TRUE(reused.has_value());
  EXPECT_EQ(*reused, (std::vector<uint32_t>{0}));
  expect_block_accounting();
}

TEST_F(BlockStoreTest, DeletedContentIsZeroed) {
  auto data = pattern(BLOCK_SIZE);
  ASSERT_TRUE(store->allocate("file_a", "a.bin", data.size()));
  ASSERT_TRUE(store->write("file_a", data));
  ASSERT_TRUE(store->delete_file("file_a"));

  ASSERT_TRUE(store->allocate("file_b", "b.bin", data.size()));
  auto read = store->read("file_b", data.size());
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, std::vector<uint8_t>(data.size(), 0));
}

TEST_F(BlockStoreTest, InsufficientStorageAllocatesNothing) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 10 * BLOCK_SIZE));
  EXPECT_FALSE(store->allocate("file_b", "b.bin", 7 * BLOCK_SIZE).has_value());

  StorageInfo info = store->get_storage_info();
  EXPECT_EQ(info.allocated_blocks, 10u);
  EXPECT_EQ(info.file_count, 1u);
  EXPECT_FALSE(store->has_file("file_b"));
  expect_block_accounting();
}

TEST_F(BlockStoreTest, PutFileReplacesExistingCopy) {
  auto first = pattern(3 * BLOCK_SIZE);
  ASSERT_EQ(store->put_file("file_a", "a.bin", first), BlockStore::PutStatus::STORED);

  auto second = pattern(BLOCK_SIZE + 10, 42);
  std::vector<uint32_t> blocks;
  ASSERT_EQ(store->put_file("file_a", "a.bin", second, &blocks), BlockStore::PutStatus::STORED);
  EXPECT_EQ(blocks, (std::vector<uint32_t>{0, 1}));

  auto read = store->read("file_a", second.size());
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, second);
  EXPECT_EQ(store->get_storage_info().allocated_blocks, 2u);
  expect_block_accounting();
}

TEST_F(BlockStoreTest, PutFileThatDoesNotFitKeepsOldCopy) {
  auto old_data = pattern(2 * BLOCK_SIZE);
  ASSERT_EQ(store->put_file("file_a", "a.bin", old_data), BlockStore::PutStatus::STORED);
  ASSERT_TRUE(store->allocate("file_b", "b.bin", 10 * BLOCK_SIZE));

  // 4 free blocks plus the 2 of the old copy
  EXPECT_EQ(store->put_file("file_a", "a.bin", pattern(7 * BLOCK_SIZE)),
            BlockStore::PutStatus::INSUFFICIENT_STORAGE);
  auto read = store->read("file_a", old_data.size());
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, old_data);

  // Reusing the old copy's blocks makes this one fit
  auto larger = pattern(6 * BLOCK_SIZE, 3);
  EXPECT_EQ(store->put_file("file_a", "a.bin", larger), BlockStore::PutStatus::STORED);
  EXPECT_EQ(store->get_storage_info().free_blocks, 0u);
  expect_block_accounting();
}

TEST_F(BlockStoreTest, ConcurrentPutsOfOneIdNeverRunOutOfSpace) {
  auto data = pattern(2 * BLOCK_SIZE);
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;

  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, &data, &failures]() {
      for (int round = 0; round < 20; ++round) {
        if (store->put_file("file_a", "a.bin", data) != BlockStore::PutStatus::STORED) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(store->get_storage_info().allocated_blocks, 2u);
  EXPECT_EQ(store->get_storage_info().file_count, 1u);
  expect_block_accounting();
}

TEST_F(BlockStoreTest, SingleBlockDiskScenario) {
  BlockStoreConfig single = config;
  single.capacity_bytes = 64 * 1024;
  single.block_size = 64 * 1024;
  BlockStore disk("node_single", single);

  auto data = pattern(64 * 1024);
  ASSERT_TRUE(disk.allocate("big", "big.bin", data.size()));
  ASSERT_TRUE(disk.write("big", data));
  EXPECT_EQ(disk.get_storage_info().free_blocks, 0u);

  EXPECT_FALSE(disk.allocate("small", "small.bin", 1).has_value());
  auto read = disk.read("big", data.size());
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, data);
}

TEST_F(BlockStoreTest, ZeroSizeFileOwnsNoBlocks) {
  auto blocks = store->allocate("empty", "empty.txt", 0);
  ASSERT_TRUE(blocks.has_value());
  EXPECT_TRUE(blocks->empty());
  EXPECT_TRUE(store->has_file("empty"));

  auto read = store->read("empty", 100);
  ASSERT_TRUE(read.has_value());
  EXPECT_TRUE(read->empty());
  EXPECT_TRUE(store->delete_file("empty"));
}

TEST_F(BlockStoreTest, SnapshotSurvivesRestart) {
  auto data = pattern(2048 + 17);
  ASSERT_TRUE(store->allocate("file_a", "a.bin", data.size()));
  ASSERT_TRUE(store->write("file_a", data));
  ASSERT_TRUE(store->allocate("file_b", "b.bin", 10));
  auto map_before = store->get_block_map();

  store.reset();
  store = std::make_unique<BlockStore>("node_0", config);

  EXPECT_TRUE(store->has_file("file_a"));
  EXPECT_TRUE(store->has_file("file_b"));
  EXPECT_EQ(store->get_storage_info().allocated_blocks, 4u);
  EXPECT_EQ(store->get_storage_info().used_storage, data.size() + 10);

  auto read = store->read("file_a", data.size());
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, data);

  auto map_after = store->get_block_map();
  for (std::size_t i = 0; i < map_before.size(); ++i) {
    EXPECT_EQ(map_after[i].status, map_before[i].status) << "block " << i;
    EXPECT_EQ(map_after[i].file_id, map_before[i].file_id) << "block " << i;
    EXPECT_EQ(map_after[i].checksum, map_before[i].checksum) << "block " << i;
  }
  expect_block_accounting();
}

TEST_F(BlockStoreTest, DifferentGeometryStartsEmpty) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 100));
  store.reset();

  BlockStoreConfig bigger = config;
  bigger.block_size = 2 * BLOCK_SIZE;
  store = std::make_unique<BlockStore>("node_0", bigger);
  EXPECT_FALSE(store->has_file("file_a"));
  EXPECT_EQ(store->get_storage_info().total_blocks, 8u);
}

TEST_F(BlockStoreTest, SnapshotWithForeignBlocksIsIgnored) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 100));
  ASSERT_TRUE(store->allocate("file_b", "b.bin", 100));
  store.reset();

  std::filesystem::path metadata = test_dir / "node_0" / "metadata.json";
  nlohmann::json document;
  {
    std::ifstream in(metadata);
    document = nlohmann::json::parse(in);
  }

  // file_a claims an out of range block, file_b one that belongs to file_a
  document["files"]["file_a"]["blocks"] = nlohmann::json::array({999});
  {
    std::ofstream out(metadata, std::ios::trunc);
    out << document.dump();
  }
  store = std::make_unique<BlockStore>("node_0", config);
  EXPECT_FALSE(store->has_file("file_a"));
  EXPECT_EQ(store->get_storage_info().allocated_blocks, 0u);
  store.reset();

  document["files"]["file_a"]["blocks"] = nlohmann::json::array({0});
  document["files"]["file_b"]["blocks"] = nlohmann::json::array({0});
  {
    std::ofstream out(metadata, std::ios::trunc);
    out << document.dump();
  }
  store = std::make_unique<BlockStore>("node_0", config);
  EXPECT_FALSE(store->has_file("file_b"));
  EXPECT_TRUE(store->list_files().empty());
}

TEST_F(BlockStoreTest, ClearFreesEverything) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 3 * BLOCK_SIZE));
  ASSERT_TRUE(store->allocate("file_b", "b.bin", 1));
  store->clear();

  StorageInfo info = store->get_storage_info();
  EXPECT_EQ(info.allocated_blocks, 0u);
  EXPECT_EQ(info.used_storage, 0u);
  EXPECT_EQ(info.file_count, 0u);
  EXPECT_TRUE(store->list_files().empty());
}

TEST_F(BlockStoreTest, ReportsAreConsistent) {
  ASSERT_TRUE(store->allocate("file_a", "a.bin", 1500));
  ASSERT_TRUE(store->allocate("file_b", "b.bin", 200));

  auto files = store->list_files();
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].file_id, "file_a");
  EXPECT_EQ(files[0].block_count, 2u);
  EXPECT_EQ(files[1].to_json()["filename"], "b.bin");

  nlohmann::json info = store->get_storage_info().to_json();
  EXPECT_EQ(info["allocated_blocks"], 3);
  EXPECT_EQ(info["free_blocks"], 13);
  EXPECT_EQ(info["used_storage"], 1700);
  EXPECT_DOUBLE_EQ(info["utilization_percent"].get<double>(), 100.0 * 3 / 16);

  EXPECT_EQ(store->get_block_map().size(), 16u);
  EXPECT_EQ(store->get_block_map()[0].to_json()["status"], "allocated");
}

TEST_F(BlockStoreTest, ConcurrentAllocationsNeverShareBlocks) {
  std::vector<std::thread> threads;
  std::atomic<int> succeeded{0};

  for (int i = 0; i < 10; ++i) {
    threads.emplace_back([this, i, &succeeded]() {
      std::string id = "file_" + std::to_string(i);
      if (store->allocate(id, id, 2 * BLOCK_SIZE)) {
        store->write(id, pattern(2 * BLOCK_SIZE, static_cast<uint8_t>(i)));
        ++succeeded;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(succeeded.load(), 8);

  std::set<uint32_t> owned;
  for (const auto& file : store->list_files()) {
    auto record = store->get_file(file.file_id);
    ASSERT_TRUE(record.has_value());
    for (uint32_t block : record->blocks) {
      EXPECT_TRUE(owned.insert(block).second) << "block " << block << " assigned twice";
    }
  }
  EXPECT_EQ(owned.size(), 16u);
  expect_block_accounting();
}
