#ifndef S3SYNC_SYNC_FINGERPRINT_HPP
#define S3SYNC_SYNC_FINGERPRINT_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include "store/object_store.hpp"

namespace s3sync {
namespace sync {

class FingerprintError : public std::runtime_error {
public:
  explicit FingerprintError(const std::string& message)
    : std::runtime_error("Fingerprint error: " + message) {}
};

// Hex MD5 of the whole file content, the format stores report as ETag.
// Multipart ETags ("<hex>-<parts>") never equal this value, so such objects
// always compare as changed.
std::string local_checksum(const std::filesystem::path& path);

// Store-reported checksum with surrounding quotes removed
std::string remote_checksum(const store::ObjectInfo& object);

inline bool checksums_match(const std::string& local, const std::string& remote) {
  return local == remote;
}

} // namespace sync
} // namespace s3sync

#endif // S3SYNC_SYNC_FINGERPRINT_HPP
