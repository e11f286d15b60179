#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cloudsim {
namespace store {

enum class BlockStatus : uint8_t {
  FREE,
  ALLOCATED,
  OCCUPIED
};

const char* to_string(BlockStatus status);
std::optional<BlockStatus> block_status_from_string(const std::string& name);

struct StorageBlock {
  uint32_t block_id{0};
  uint64_t offset{0};
  uint32_t size{0};
  BlockStatus status{BlockStatus::FREE};
  std::optional<std::string> file_id;
  // Digest of the bytes last written into the block
  std::optional<std::string> checksum;
};

struct VirtualFile {
  std::string file_id;
  std::string filename;
  uint64_t size{0};
  std::vector<uint32_t> blocks;
  double created_at{0.0};
  std::string checksum;
};

struct BlockStoreConfig {
  std::string storage_root{"virtual_storage"};
  uint64_t capacity_bytes{2ULL * 1024 * 1024 * 1024};
  uint32_t block_size{64 * 1024};
};


// ---- REPORTING VIEWS ----
struct StorageInfo {
  std::string node_id;
  uint64_t total_capacity{0};
  uint64_t used_storage{0};
  uint64_t free_storage{0};
  uint32_t block_size{0};
  uint32_t total_blocks{0};
  uint32_t allocated_blocks{0};
  uint32_t free_blocks{0};
  double utilization_percent{0.0};
  std::size_t file_count{0};
  std::string storage_path;

  nlohmann::json to_json() const;
};

struct FileInfo {
  std::string file_id;
  std::string filename;
  uint64_t size{0};
  std::size_t block_count{0};
  double created_at{0.0};
  std::string checksum;

  nlohmann::json to_json() const;
};

struct BlockInfo {
  uint32_t block_id{0};
  BlockStatus status{BlockStatus::FREE};
  std::optional<std::string> file_id;
  std::optional<std::string> checksum;

  nlohmann::json to_json() const;
};


// Fixed-capacity virtual disk of one node. Blocks live in a sparse image file,
// the allocation table and file index in a JSON snapshot next to it.
class BlockStore {
public:
  BlockStore(const BlockStore&) = delete;
  BlockStore& operator=(const BlockStore&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens or creates <storage_root>/<node_id>. Throws StoreError if the directory
  // or disk image is unusable or the geometry yields no blocks.
  BlockStore(const std::string& node_id, const BlockStoreConfig& config = BlockStoreConfig());
  ~BlockStore();


  // ---- CORE STORAGE OPERATIONS ----
  // Reserves ceil(size / block_size) free blocks in block id order. Nothing is
  // reserved if the file id exists or there is not enough free space.
  std::optional<std::vector<uint32_t>> allocate(const std::string& file_id, const std::string& filename,
                                                uint64_t size);
  // Writes forward across the file's blocks starting at the block holding offset
  bool write(const std::string& file_id, const std::vector<uint8_t>& data, uint64_t offset = 0);
  // Reads up to size bytes forward from offset, empty if the file id is unknown
  std::optional<std::vector<uint8_t>> read(const std::string& file_id, uint64_t size,
                                           uint64_t offset = 0) const;
  // Frees and zeroes every block of the file
  bool delete_file(const std::string& file_id);
  // Frees every block and drops the file index
  void clear();

  enum class PutStatus { STORED, INSUFFICIENT_STORAGE, WRITE_FAILED };
  // Allocates and writes data as one step, replacing an existing file with the
  // same id. The existing copy is kept when the new data does not fit.
  PutStatus put_file(const std::string& file_id, const std::string& filename,
                     const std::vector<uint8_t>& data, std::vector<uint32_t>* blocks = nullptr);


  // ---- QUERY OPERATIONS ----
  bool has_file(const std::string& file_id) const;
  std::optional<VirtualFile> get_file(const std::string& file_id) const;
  StorageInfo get_storage_info() const;
  std::vector<FileInfo> list_files() const;
  std::vector<BlockInfo> get_block_map() const;

  const std::string& get_node_id() const { return node_id_; }
  const std::filesystem::path& get_storage_path() const { return storage_path_; }

private:
  // ---- PARAMETERS ----
  const std::string node_id_;
  const uint32_t block_size_;
  const uint32_t total_blocks_;
  std::filesystem::path storage_path_;
  std::filesystem::path disk_path_;
  std::filesystem::path metadata_path_;

  // Allocation table, file index and counters, guarded by one mutex
  std::vector<StorageBlock> blocks_;
  std::map<std::string, VirtualFile> files_;
  uint32_t allocated_blocks_{0};
  uint64_t used_storage_{0};
  mutable std::fstream disk_;
  mutable std::mutex mutex_;


  // ---- UNLOCKED OPERATIONS ----
  // Callers hold mutex_
  std::optional<std::vector<uint32_t>> allocate_unlocked(const std::string& file_id, const std::string& filename,
                                                         uint64_t size);
  bool write_unlocked(const std::string& file_id, const std::vector<uint8_t>& data, uint64_t offset);
  bool delete_unlocked(const std::string& file_id);


  // ---- DISK IMAGE ----
  void open_disk(uint64_t capacity);
  bool write_block(const StorageBlock& block, uint32_t block_offset, const uint8_t* data, std::size_t size);
  bool read_block(const StorageBlock& block, uint32_t block_offset, uint8_t* data, std::size_t size) const;
  bool zero_block(const StorageBlock& block);
  void release_block(StorageBlock& block);


  // ---- METADATA SNAPSHOT ----
  // Writes the full snapshot to a temp file and renames it over the old one
  bool save_metadata() const;
  bool load_metadata();
  nlohmann::json metadata_to_json() const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace cloudsim
