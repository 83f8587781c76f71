#pragma once

#include <optional>
#include <string>

namespace s3sync {
namespace utils {

// A fully-qualified "scheme://bucket/key" location
struct BucketUrl {
  std::string scheme;
  std::string bucket;
  std::string key;
};

// Parses "scheme://bucket/key". Returns std::nullopt for plain keys and paths.
std::optional<BucketUrl> parse_bucket_url(const std::string& location);

// Strips the scheme and bucket component of a fully-qualified location,
// leaving the key without leading slashes. Anything else is returned as is.
std::string strip_bucket_prefix(const std::string& location);

} // namespace utils
} // namespace s3sync
