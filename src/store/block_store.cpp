#include "store/block_store.hpp"
#include "network/message.hpp"
#include "utils/digest.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <limits>

namespace cloudsim {
namespace store {

namespace {

uint32_t compute_block_count(uint64_t capacity, uint32_t block_size) {
  if (block_size == 0) {
    throw StoreError("Store: Block size must be positive");
  }
  uint64_t count = capacity / block_size;
  if (count == 0 || count > std::numeric_limits<uint32_t>::max()) {
    throw StoreError("Store: Unusable disk geometry, capacity " + std::to_string(capacity) +
                     " with block size " + std::to_string(block_size));
  }
  return static_cast<uint32_t>(count);
}

} // namespace

const char* to_string(BlockStatus status) {
  switch (status) {
    case BlockStatus::FREE:      return "free";
    case BlockStatus::ALLOCATED: return "allocated";
    case BlockStatus::OCCUPIED:  return "occupied";
    default:                     return "unknown";
  }
}

std::optional<BlockStatus> block_status_from_string(const std::string& name) {
  if (name == "free") return BlockStatus::FREE;
  if (name == "allocated") return BlockStatus::ALLOCATED;
  if (name == "occupied") return BlockStatus::OCCUPIED;
  return std::nullopt;
}


//==============================================
// REPORTING VIEWS
//==============================================

nlohmann::json StorageInfo::to_json() const {
  return nlohmann::json{
    {"node_id", node_id},
    {"total_capacity", total_capacity},
    {"used_storage", used_storage},
    {"free_storage", free_storage},
    {"block_size", block_size},
    {"total_blocks", total_blocks},
    {"allocated_blocks", allocated_blocks},
    {"free_blocks", free_blocks},
    {"utilization_percent", utilization_percent},
    {"file_count", file_count},
    {"storage_path", storage_path}
  };
}

nlohmann::json FileInfo::to_json() const {
  return nlohmann::json{
    {"file_id", file_id},
    {"filename", filename},
    {"size", size},
    {"block_count", block_count},
    {"created_at", created_at},
    {"checksum", checksum}
  };
}

nlohmann::json BlockInfo::to_json() const {
  return nlohmann::json{
    {"block_id", block_id},
    {"status", to_string(status)},
    {"file_id", file_id ? nlohmann::json(*file_id) : nlohmann::json(nullptr)},
    {"checksum", checksum ? nlohmann::json(*checksum) : nlohmann::json(nullptr)}
  };
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlockStore::BlockStore(const std::string& node_id, const BlockStoreConfig& config)
  : node_id_(node_id)
  , block_size_(config.block_size)
  , total_blocks_(compute_block_count(config.capacity_bytes, config.block_size))
  , storage_path_(std::filesystem::path(config.storage_root) / node_id)
  , disk_path_(storage_path_ / "disk.img")
  , metadata_path_(storage_path_ / "metadata.json") {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing block store for node " << node_id_ << " at " << storage_path_
                          << " (" << total_blocks_ << " blocks of " << block_size_ << " bytes)";

  std::error_code ec;
  std::filesystem::create_directories(storage_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot create storage directory " << storage_path_ << ": " << ec.message();
    throw StoreError("Store: Cannot create storage directory " + storage_path_.string());
  }

  blocks_.reserve(total_blocks_);
  for (uint32_t i = 0; i < total_blocks_; ++i) {
    StorageBlock block;
    block.block_id = i;
    block.offset = static_cast<uint64_t>(i) * block_size_;
    block.size = block_size_;
    blocks_.push_back(block);
  }

  open_disk(static_cast<uint64_t>(total_blocks_) * block_size_);

  if (!load_metadata()) {
    save_metadata();
  }
}

BlockStore::~BlockStore() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disk_.is_open()) {
    disk_.close();
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::optional<std::vector<uint32_t>> BlockStore::allocate(const std::string& file_id, const std::string& filename,
                                                          uint64_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  return allocate_unlocked(file_id, filename, size);
}

bool BlockStore::write(const std::string& file_id, const std::vector<uint8_t>& data, uint64_t offset) {
  std::lock_guard<std::mutex> lock(mutex_);
  return write_unlocked(file_id, data, offset);
}

bool BlockStore::delete_file(const std::string& file_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return delete_unlocked(file_id);
}

BlockStore::PutStatus BlockStore::put_file(const std::string& file_id, const std::string& filename,
                                           const std::vector<uint8_t>& data, std::vector<uint32_t>* blocks) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Blocks of an existing copy count as free, it is only dropped once the new one fits
  uint64_t required = (data.size() + block_size_ - 1) / block_size_;
  uint64_t available = total_blocks_ - allocated_blocks_;
  auto existing = files_.find(file_id);
  if (existing != files_.end()) {
    available += existing->second.blocks.size();
  }
  if (required > available) {
    BOOST_LOG_TRIVIAL(error) << "Store: Insufficient storage on node " << node_id_ << " for " << file_id
                             << ": need " << required << " blocks, " << available << " available";
    return PutStatus::INSUFFICIENT_STORAGE;
  }

  if (existing != files_.end()) {
    BOOST_LOG_TRIVIAL(info) << "Store: Replacing " << file_id << " on node " << node_id_;
    delete_unlocked(file_id);
  }

  auto allocated = allocate_unlocked(file_id, filename, data.size());
  if (!allocated) {
    return PutStatus::INSUFFICIENT_STORAGE;
  }

  if (!write_unlocked(file_id, data, 0)) {
    delete_unlocked(file_id);
    return PutStatus::WRITE_FAILED;
  }

  if (blocks) {
    *blocks = *allocated;
  }
  return PutStatus::STORED;
}

std::optional<std::vector<uint32_t>> BlockStore::allocate_unlocked(const std::string& file_id,
                                                                   const std::string& filename, uint64_t size) {
  if (files_.count(file_id) > 0) {
    BOOST_LOG_TRIVIAL(error) << "Store: File " << file_id << " already exists on node " << node_id_;
    return std::nullopt;
  }

  uint64_t required = (size + block_size_ - 1) / block_size_;
  uint32_t free_blocks = total_blocks_ - allocated_blocks_;
  if (required > free_blocks) {
    BOOST_LOG_TRIVIAL(error) << "Store: Insufficient storage on node " << node_id_ << " for " << filename
                             << ": need " << required << " blocks, " << free_blocks << " free";
    return std::nullopt;
  }

  std::vector<uint32_t> allocated;
  allocated.reserve(required);
  for (auto& block : blocks_) {
    if (allocated.size() == required) {
      break;
    }
    if (block.status == BlockStatus::FREE) {
      block.status = BlockStatus::ALLOCATED;
      block.file_id = file_id;
      block.checksum.reset();
      allocated.push_back(block.block_id);
    }
  }

  VirtualFile file;
  file.file_id = file_id;
  file.filename = filename;
  file.size = size;
  file.blocks = allocated;
  file.created_at = network::unix_time_now();
  file.checksum = utils::md5_hex(file_id + "-" + filename + "-" + std::to_string(size));
  files_[file_id] = file;

  allocated_blocks_ += static_cast<uint32_t>(allocated.size());
  used_storage_ += size;
  save_metadata();

  BOOST_LOG_TRIVIAL(info) << "Store: Allocated " << allocated.size() << " blocks for " << filename
                          << " (" << file_id << ") on node " << node_id_;
  return allocated;
}

bool BlockStore::write_unlocked(const std::string& file_id, const std::vector<uint8_t>& data, uint64_t offset) {
  auto it = files_.find(file_id);
  if (it == files_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot write unknown file " << file_id << " on node " << node_id_;
    return false;
  }

  const VirtualFile& file = it->second;
  uint64_t file_capacity = static_cast<uint64_t>(file.blocks.size()) * block_size_;
  if (offset > file_capacity || data.size() > file_capacity - offset) {
    BOOST_LOG_TRIVIAL(error) << "Store: Write of " << data.size() << " bytes at offset " << offset
                             << " exceeds the " << file_capacity << " bytes allocated to " << file_id;
    return false;
  }

  std::size_t written = 0;
  std::size_t index = offset / block_size_;
  uint32_t block_offset = static_cast<uint32_t>(offset % block_size_);

  while (written < data.size()) {
    StorageBlock& block = blocks_[file.blocks[index]];
    std::size_t count = std::min<std::size_t>(block_size_ - block_offset, data.size() - written);

    if (!write_block(block, block_offset, data.data() + written, count)) {
      BOOST_LOG_TRIVIAL(error) << "Store: Disk write failed for block " << block.block_id << " of " << file_id;
      save_metadata();
      return false;
    }

    block.status = BlockStatus::OCCUPIED;
    block.checksum = utils::md5_hex(data.data() + written, count);

    written += count;
    block_offset = 0;
    ++index;
  }

  save_metadata();
  BOOST_LOG_TRIVIAL(debug) << "Store: Wrote " << written << " bytes to " << file_id << " on node " << node_id_;
  return true;
}

std::optional<std::vector<uint8_t>> BlockStore::read(const std::string& file_id, uint64_t size,
                                                     uint64_t offset) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = files_.find(file_id);
  if (it == files_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Cannot read unknown file " << file_id << " on node " << node_id_;
    return std::nullopt;
  }

  const VirtualFile& file = it->second;
  uint64_t file_capacity = static_cast<uint64_t>(file.blocks.size()) * block_size_;
  if (offset >= file_capacity) {
    return std::vector<uint8_t>();
  }

  std::vector<uint8_t> data(std::min(size, file_capacity - offset));
  std::size_t done = 0;
  std::size_t index = offset / block_size_;
  uint32_t block_offset = static_cast<uint32_t>(offset % block_size_);

  while (done < data.size()) {
    const StorageBlock& block = blocks_[file.blocks[index]];
    std::size_t count = std::min<std::size_t>(block_size_ - block_offset, data.size() - done);

    if (!read_block(block, block_offset, data.data() + done, count)) {
      BOOST_LOG_TRIVIAL(error) << "Store: Disk read failed for block " << block.block_id << " of " << file_id;
      return std::nullopt;
    }

    done += count;
    block_offset = 0;
    ++index;
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Read " << done << " bytes from " << file_id << " on node " << node_id_;
  return data;
}

bool BlockStore::delete_unlocked(const std::string& file_id) {
  auto it = files_.find(file_id);
  if (it == files_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Cannot delete unknown file " << file_id << " on node " << node_id_;
    return false;
  }

  for (uint32_t block_id : it->second.blocks) {
    release_block(blocks_[block_id]);
  }

  allocated_blocks_ -= static_cast<uint32_t>(it->second.blocks.size());
  used_storage_ -= it->second.size;
  BOOST_LOG_TRIVIAL(info) << "Store: Deleted " << it->second.filename << " (" << file_id << "), freed "
                          << it->second.blocks.size() << " blocks on node " << node_id_;
  files_.erase(it);

  save_metadata();
  return true;
}

void BlockStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing block store of node " << node_id_;

  for (auto& block : blocks_) {
    if (block.status != BlockStatus::FREE) {
      release_block(block);
    }
  }
  files_.clear();
  allocated_blocks_ = 0;
  used_storage_ = 0;

  save_metadata();
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool BlockStore::has_file(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.count(file_id) > 0;
}

std::optional<VirtualFile> BlockStore::get_file(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(file_id);
  if (it == files_.end()) {
    return std::nullopt;
  }
  return it->second;
}

StorageInfo BlockStore::get_storage_info() const {
  std::lock_guard<std::mutex> lock(mutex_);

  StorageInfo info;
  info.node_id = node_id_;
  info.total_capacity = static_cast<uint64_t>(total_blocks_) * block_size_;
  info.used_storage = used_storage_;
  info.free_storage = static_cast<uint64_t>(total_blocks_ - allocated_blocks_) * block_size_;
  info.block_size = block_size_;
  info.total_blocks = total_blocks_;
  info.allocated_blocks = allocated_blocks_;
  info.free_blocks = total_blocks_ - allocated_blocks_;
  info.utilization_percent = 100.0 * allocated_blocks_ / total_blocks_;
  info.file_count = files_.size();
  info.storage_path = storage_path_.string();
  return info;
}

std::vector<FileInfo> BlockStore::list_files() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<FileInfo> files;
  files.reserve(files_.size());
  for (const auto& [file_id, file] : files_) {
    files.push_back(FileInfo{file_id, file.filename, file.size, file.blocks.size(), file.created_at, file.checksum});
  }
  return files;
}

std::vector<BlockInfo> BlockStore::get_block_map() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<BlockInfo> map;
  map.reserve(blocks_.size());
  for (const auto& block : blocks_) {
    map.push_back(BlockInfo{block.block_id, block.status, block.file_id, block.checksum});
  }
  return map;
}


//==============================================
// DISK IMAGE
//==============================================

void BlockStore::open_disk(uint64_t capacity) {
  std::error_code ec;
  if (!std::filesystem::exists(disk_path_)) {
    std::ofstream create(disk_path_, std::ios::binary);
    if (!create) {
      throw StoreError("Store: Failed to create disk image " + disk_path_.string());
    }
  }

  // Sparse on filesystems that support it; unwritten ranges read back as zero
  if (std::filesystem::file_size(disk_path_, ec) != capacity) {
    std::filesystem::resize_file(disk_path_, capacity, ec);
    if (ec) {
      throw StoreError("Store: Failed to size disk image " + disk_path_.string() + ": " + ec.message());
    }
  }

  disk_.open(disk_path_, std::ios::in | std::ios::out | std::ios::binary);
  if (!disk_) {
    throw StoreError("Store: Failed to open disk image " + disk_path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Disk image ready at " << disk_path_;
}

bool BlockStore::write_block(const StorageBlock& block, uint32_t block_offset, const uint8_t* data, std::size_t size) {
  disk_.seekp(static_cast<std::streamoff>(block.offset + block_offset));
  disk_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  disk_.flush();
  if (!disk_) {
    disk_.clear();
    return false;
  }
  return true;
}

bool BlockStore::read_block(const StorageBlock& block, uint32_t block_offset, uint8_t* data, std::size_t size) const {
  disk_.seekg(static_cast<std::streamoff>(block.offset + block_offset));
  disk_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(size));
  if (!disk_) {
    disk_.clear();
    return false;
  }
  return true;
}

bool BlockStore::zero_block(const StorageBlock& block) {
  std::vector<uint8_t> zeros(block.size, 0);
  return write_block(block, 0, zeros.data(), zeros.size());
}

void BlockStore::release_block(StorageBlock& block) {
  if (!zero_block(block)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to zero block " << block.block_id << " on node " << node_id_;
  }
  block.status = BlockStatus::FREE;
  block.file_id.reset();
  block.checksum.reset();
}


//==============================================
// METADATA SNAPSHOT
//==============================================

nlohmann::json BlockStore::metadata_to_json() const {
  nlohmann::json blocks = nlohmann::json::array();
  for (const auto& block : blocks_) {
    if (block.status == BlockStatus::FREE) {
      continue;
    }
    blocks.push_back({
      {"block_id", block.block_id},
      {"status", to_string(block.status)},
      {"file_id", block.file_id ? nlohmann::json(*block.file_id) : nlohmann::json(nullptr)},
      {"checksum", block.checksum ? nlohmann::json(*block.checksum) : nlohmann::json(nullptr)}
    });
  }

  nlohmann::json files = nlohmann::json::object();
  for (const auto& [file_id, file] : files_) {
    files[file_id] = {
      {"filename", file.filename},
      {"size", file.size},
      {"blocks", file.blocks},
      {"created_at", file.created_at},
      {"checksum", file.checksum}
    };
  }

  return nlohmann::json{
    {"node_id", node_id_},
    {"block_size", block_size_},
    {"total_blocks", total_blocks_},
    {"allocated_blocks", allocated_blocks_},
    {"used_storage", used_storage_},
    {"blocks", blocks},
    {"files", files}
  };
}

bool BlockStore::save_metadata() const {
  std::filesystem::path temp_path = metadata_path_;
  temp_path += ".tmp";

  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to open metadata file " << temp_path;
      return false;
    }
    // Filenames are not guaranteed to be UTF-8, invalid bytes are stored as U+FFFD
    out << metadata_to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!out) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to write metadata file " << temp_path;
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, metadata_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to replace metadata file " << metadata_path_ << ": " << ec.message();
    return false;
  }
  return true;
}

bool BlockStore::load_metadata() {
  if (!std::filesystem::exists(metadata_path_)) {
    return false;
  }

  nlohmann::json document;
  try {
    std::ifstream in(metadata_path_);
    document = nlohmann::json::parse(in);

    if (document.at("block_size").get<uint32_t>() != block_size_ ||
        document.at("total_blocks").get<uint32_t>() != total_blocks_) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Metadata geometry of node " << node_id_
                                 << " does not match, starting with an empty disk";
      return false;
    }

    std::vector<StorageBlock> blocks = blocks_;
    uint32_t allocated = 0;
    for (const auto& entry : document.at("blocks")) {
      uint32_t block_id = entry.at("block_id").get<uint32_t>();
      auto status = block_status_from_string(entry.at("status").get<std::string>());
      if (block_id >= total_blocks_ || !status) {
        throw StoreError("invalid block entry " + entry.dump());
      }
      StorageBlock& block = blocks[block_id];
      block.status = *status;
      if (!entry.at("file_id").is_null()) {
        block.file_id = entry.at("file_id").get<std::string>();
      }
      if (!entry.at("checksum").is_null()) {
        block.checksum = entry.at("checksum").get<std::string>();
      }
      if (block.status != BlockStatus::FREE) {
        ++allocated;
      }
    }

    std::map<std::string, VirtualFile> files;
    uint64_t used = 0;
    for (const auto& item : document.at("files").items()) {
      const std::string& file_id = item.key();
      const nlohmann::json& entry = item.value();
      VirtualFile file;
      file.file_id = file_id;
      file.filename = entry.at("filename").get<std::string>();
      file.size = entry.at("size").get<uint64_t>();
      file.blocks = entry.at("blocks").get<std::vector<uint32_t>>();
      file.created_at = entry.at("created_at").get<double>();
      file.checksum = entry.at("checksum").get<std::string>();

      // Every listed block must exist and be owned by this file in the block table
      for (uint32_t block_id : file.blocks) {
        if (block_id >= total_blocks_ || blocks[block_id].status == BlockStatus::FREE ||
            blocks[block_id].file_id != file_id) {
          throw StoreError("file " + file_id + " lists block " + std::to_string(block_id) +
                           " it does not own");
        }
      }
      used += file.size;
      files[file_id] = file;
    }

    blocks_ = std::move(blocks);
    files_ = std::move(files);
    allocated_blocks_ = allocated;
    used_storage_ = used;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Ignoring unreadable metadata of node " << node_id_ << ": " << e.what();
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Loaded " << files_.size() << " files and " << allocated_blocks_
                          << " allocated blocks for node " << node_id_;
  return true;
}

} // namespace store
} // namespace cloudsim
