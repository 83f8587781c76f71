#include "sync/object_lister.hpp"
#include "sync/fingerprint.hpp"
#include <boost/log/trivial.hpp>

namespace s3sync {
namespace sync {

ChecksumListing list_checksums(store::ObjectStore& store,
                               const std::string& prefix,
                               const std::string& filter,
                               std::ostream& out,
                               const store::CallContext& ctx) {
  BOOST_LOG_TRIVIAL(info) << "Object lister: Listing " << store.bucket() << " prefix '" << prefix
                          << "' filter '" << filter << "'";

  ChecksumListing listing;
  for (const auto& object : store.list(prefix, ctx)) {
    if (object.key.find(filter) == std::string::npos) {
      continue;
    }

    std::string checksum = remote_checksum(object);
    out << "filename: " << object.key << '\n'
        << "md5_sum: " << checksum << std::endl;
    listing.emplace_back(object.key, checksum);
  }

  BOOST_LOG_TRIVIAL(info) << "Object lister: Retained " << listing.size() << " keys";
  return listing;
}

} // namespace sync
} // namespace s3sync
