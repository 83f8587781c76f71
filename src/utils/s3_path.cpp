#include "utils/s3_path.hpp"
#include <algorithm>
#include <cctype>

namespace s3sync {
namespace utils {

std::optional<BucketUrl> parse_bucket_url(const std::string& location) {
  auto separator = location.find("://");
  if (separator == std::string::npos || separator == 0) {
    return std::nullopt;
  }

  // Schemes are alphanumeric, e.g. "s3" or "gs"
  std::string scheme = location.substr(0, separator);
  bool valid_scheme = std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
  });
  if (!valid_scheme) {
    return std::nullopt;
  }

  std::string rest = location.substr(separator + 3);
  auto slash = rest.find('/');
  BucketUrl url;
  url.scheme = scheme;
  url.bucket = rest.substr(0, slash);
  if (slash != std::string::npos) {
    url.key = rest.substr(slash);
  }

  url.key.erase(0, url.key.find_first_not_of('/'));

  if (url.bucket.empty()) {
    return std::nullopt;
  }
  return url;
}

std::string strip_bucket_prefix(const std::string& location) {
  auto url = parse_bucket_url(location);
  if (!url) {
    return location;
  }
  return url->key;
}

} // namespace utils
} // namespace s3sync
