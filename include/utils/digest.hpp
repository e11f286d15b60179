#ifndef CLOUDSIM_UTILS_DIGEST_HPP
#define CLOUDSIM_UTILS_DIGEST_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cloudsim {
namespace utils {

class DigestError : public std::runtime_error {
public:
  explicit DigestError(const std::string& message) : std::runtime_error(message) {}
};

// ---- MESSAGE DIGESTS ----
// MD5 of the given bytes as 32 lowercase hex characters (OpenSSL EVP)
std::string md5_hex(const uint8_t* data, std::size_t size);
std::string md5_hex(const std::vector<uint8_t>& data);
std::string md5_hex(const std::string& data);


// ---- HEX ENCODING ----
std::string to_hex(const uint8_t* data, std::size_t size);
std::string to_hex(const std::vector<uint8_t>& data);
// Decodes a hex string, empty if it has odd length or a non-hex character
std::optional<std::vector<uint8_t>> from_hex(const std::string& hex);

} // namespace utils
} // namespace cloudsim

#endif // CLOUDSIM_UTILS_DIGEST_HPP
