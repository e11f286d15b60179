#include "utils/digest.hpp"
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>

namespace cloudsim {
namespace utils {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// MESSAGE DIGESTS
//==============================================

std::string md5_hex(const uint8_t* data, std::size_t size) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw DigestError("Digest: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr)) {
    throw DigestError("Digest: Failed to initialize hash context");
  }

  if (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size)) {
    throw DigestError("Digest: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw DigestError("Digest: Failed to finalize hash");
  }

  return to_hex(hash, hash_len);
}

std::string md5_hex(const std::vector<uint8_t>& data) {
  return md5_hex(data.data(), data.size());
}

std::string md5_hex(const std::string& data) {
  return md5_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}


//==============================================
// HEX ENCODING
//==============================================

std::string to_hex(const uint8_t* data, std::size_t size) {
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const std::vector<uint8_t>& data) {
  return to_hex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return bytes;
}

} // namespace utils
} // namespace cloudsim
