#ifndef S3SYNC_STORE_OBJECT_STORE_HPP
#define S3SYNC_STORE_OBJECT_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "store/call_context.hpp"
#include "store/store_error.hpp"

namespace s3sync::store {

// Metadata of one stored object, as reported by the store
struct ObjectInfo {
  std::string bucket;
  std::string key;
  std::uintmax_t content_length{0};
  // Opaque content fingerprint, possibly quoted
  std::string etag;
};

// Transfer-level options passed through to the store
struct TransferOptions {
  // Canned ACL, e.g. "public-read". Empty keeps the store default.
  std::string acl;
  // Server-side encryption marker, e.g. "AES256". Empty disables it.
  std::string server_side_encryption;
};

inline constexpr const char* PUBLIC_READ_ACL = "public-read";
inline constexpr const char* AES256_ENCRYPTION = "AES256";

// Receives the number of bytes moved since the previous call. May be invoked
// from several threads during one transfer.
using ProgressCallback = std::function<void(std::uintmax_t)>;

// Authenticated handle to one named bucket
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  virtual const std::string& bucket() const = 0;

  // ---- QUERY OPERATIONS ----
  // Returns std::nullopt when the key does not exist. Any other failure throws.
  virtual std::optional<ObjectInfo> head(const std::string& key, const CallContext& ctx) = 0;
  // Objects whose key starts with prefix, in lexicographic key order
  virtual std::vector<ObjectInfo> list(const std::string& prefix, const CallContext& ctx) = 0;


  // ---- MUTATING OPERATIONS ----
  virtual void copy(const std::string& src_key, const std::string& dst_key,
                    const TransferOptions& options, const CallContext& ctx) = 0;
  // Removing an absent key is not an error
  virtual void remove(const std::string& key, const CallContext& ctx) = 0;


  // ---- TRANSFERS ----
  virtual void upload(const std::filesystem::path& local_path, const std::string& key,
                      const TransferOptions& options, const ProgressCallback& progress,
                      const CallContext& ctx) = 0;
  virtual void download(const std::string& key, const std::filesystem::path& local_path,
                        const ProgressCallback& progress, const CallContext& ctx) = 0;
};

} // namespace s3sync::store

#endif // S3SYNC_STORE_OBJECT_STORE_HPP
