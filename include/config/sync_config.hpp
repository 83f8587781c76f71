#ifndef S3SYNC_CONFIG_SYNC_CONFIG_HPP
#define S3SYNC_CONFIG_SYNC_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace s3sync {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

// Settings shared by the object store and the sync engine. Created once by
// the caller and reused for every bulk operation.
struct SyncConfig {
  // ---- STORE LOCATION ----
  std::string store_root;
  std::string bucket;

  // ---- LOGGING ----
  std::string log_file{"s3sync.log"};
  std::string log_level{"info"};

  // ---- REMOTE CALLS ----
  // Deadline applied to every remote call, zero disables it
  std::chrono::milliseconds call_timeout{0};
  // Treat any destination lookup failure during upload as "absent"
  bool treat_lookup_error_as_absent{false};

  // ---- MULTIPART TRANSFERS ----
  std::uintmax_t multipart_threshold{8 * 1024 * 1024};
  std::uintmax_t part_size{8 * 1024 * 1024};
  std::size_t max_part_workers{4};

  // Throws ConfigError when a field is unusable
  void validate() const;
};

// Parses a whole number of seconds, throws ConfigError on anything else
std::chrono::seconds parse_timeout_seconds(const std::string& value);

} // namespace config
} // namespace s3sync

#endif // S3SYNC_CONFIG_SYNC_CONFIG_HPP
