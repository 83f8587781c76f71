#ifndef S3SYNC_CRYPTO_DIGEST_HPP
#define S3SYNC_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace s3sync::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental message digest over OpenSSL EVP
class Digest {
public:

  enum class Algorithm {
    MD5,
    SHA256
  };

  static constexpr size_t BUFFER_SIZE = 64 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Digest(Algorithm algorithm);
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;


  // ---- HASHING OPERATIONS ----
  void update(const void* data, size_t length);
  // Feeds the stream until EOF, returns the number of bytes consumed
  std::uintmax_t update(std::istream& input);
  // Finalizes the digest. No further updates are accepted afterwards.
  std::vector<uint8_t> finish();
  std::string finish_hex();


  // ---- HELPERS ----
  static std::string to_hex(const std::vector<uint8_t>& bytes);

private:
  // ---- PARAMETERS ----
  Algorithm algorithm_;
  std::unique_ptr<DigestContext> context_;
  bool finished_ = false;
};

// One-shot helpers
std::string md5_hex(const std::string& data);
std::string sha256_hex(const std::string& data);

} // namespace s3sync::crypto

#endif // S3SYNC_CRYPTO_DIGEST_HPP
