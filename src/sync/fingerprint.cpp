#include "sync/fingerprint.hpp"
#include "crypto/digest.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace s3sync {
namespace sync {

std::string local_checksum(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(debug) << "Fingerprint: Computing MD5 of " << path.string();

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Fingerprint: Failed to open file: " << path.string();
    throw FingerprintError("failed to open " + path.string());
  }

  try {
    crypto::Digest digest(crypto::Digest::Algorithm::MD5);
    std::uintmax_t bytes = digest.update(file);
    std::string checksum = digest.finish_hex();

    BOOST_LOG_TRIVIAL(debug) << "Fingerprint: " << path.string() << " (" << bytes << " bytes) -> " << checksum;
    return checksum;
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Fingerprint: Failed to hash " << path.string() << ": " << e.what();
    throw FingerprintError("failed to hash " + path.string() + ": " + e.what());
  }
}

std::string remote_checksum(const store::ObjectInfo& object) {
  const std::string& etag = object.etag;
  auto first = etag.find_first_not_of('"');
  if (first == std::string::npos) {
    return "";
  }
  auto last = etag.find_last_not_of('"');
  return etag.substr(first, last - first + 1);
}

} // namespace sync
} // namespace s3sync
