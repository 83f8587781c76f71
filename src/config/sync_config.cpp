#include "config/sync_config.hpp"
#include <boost/log/trivial.hpp>

namespace s3sync {
namespace config {

void SyncConfig::validate() const {
  if (store_root.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Config: Store root is empty";
    throw ConfigError("store root must not be empty");
  }

  if (bucket.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Config: Bucket name is empty";
    throw ConfigError("bucket name must not be empty");
  }

  // Bucket names become a single directory below the store root
  if (bucket.find('/') != std::string::npos || bucket == "." || bucket == "..") {
    BOOST_LOG_TRIVIAL(error) << "Config: Invalid bucket name: " << bucket;
    throw ConfigError("invalid bucket name: " + bucket);
  }

  if (part_size == 0) {
    throw ConfigError("part size must be greater than zero");
  }

  if (max_part_workers == 0) {
    throw ConfigError("at least one part worker is required");
  }

  if (call_timeout.count() < 0) {
    throw ConfigError("call timeout must not be negative");
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Validated configuration for bucket: " << bucket;
}

std::chrono::seconds parse_timeout_seconds(const std::string& value) {
  std::size_t consumed = 0;
  long long seconds = 0;
  try {
    seconds = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw ConfigError("invalid timeout: " + value);
  }

  if (consumed != value.size() || seconds < 0) {
    throw ConfigError("invalid timeout: " + value);
  }
  return std::chrono::seconds(seconds);
}

} // namespace config
} // namespace s3sync
