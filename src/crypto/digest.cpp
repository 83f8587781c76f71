#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <array>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace s3sync::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Digest::Digest(Algorithm algorithm)
  : algorithm_(algorithm)
  , context_(std::make_unique<DigestContext>()) {
  const EVP_MD* md = (algorithm_ == Algorithm::MD5) ? EVP_md5() : EVP_sha256();
  if (!EVP_DigestInit_ex(context_->get(), md, nullptr)) {
    throw DigestError("Failed to initialize digest context");
  }
}

Digest::~Digest() = default;

//==============================================
// HASHING OPERATIONS
//==============================================

void Digest::update(const void* data, size_t length) {
  if (finished_) {
    throw DigestError("Digest already finalized");
  }

  if (length == 0) {
    return;
  }

  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update digest");
  }
}

std::uintmax_t Digest::update(std::istream& input) {
  std::array<char, BUFFER_SIZE> buffer;
  std::uintmax_t total = 0;

  while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
    update(buffer.data(), static_cast<size_t>(input.gcount()));
    total += static_cast<std::uintmax_t>(input.gcount());
  }

  if (input.bad()) {
    throw DigestError("Failed to read input stream");
  }

  BOOST_LOG_TRIVIAL(trace) << "Digest: Consumed " << total << " bytes from stream";
  return total;
}

std::vector<uint8_t> Digest::finish() {
  if (finished_) {
    throw DigestError("Digest already finalized");
  }

  std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if (!EVP_DigestFinal_ex(context_->get(), result.data(), &length)) {
    throw DigestError("Failed to finalize digest");
  }

  finished_ = true;
  result.resize(length);
  return result;
}

std::string Digest::finish_hex() {
  return to_hex(finish());
}

//==============================================
// HELPERS
//==============================================

std::string Digest::to_hex(const std::vector<uint8_t>& bytes) {
  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::string md5_hex(const std::string& data) {
  Digest digest(Digest::Algorithm::MD5);
  digest.update(data.data(), data.size());
  return digest.finish_hex();
}

std::string sha256_hex(const std::string& data) {
  Digest digest(Digest::Algorithm::SHA256);
  digest.update(data.data(), data.size());
  return digest.finish_hex();
}

} // namespace s3sync::crypto
