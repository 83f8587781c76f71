#ifndef S3SYNC_SYNC_OBJECT_LISTER_HPP
#define S3SYNC_SYNC_OBJECT_LISTER_HPP

#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "store/object_store.hpp"

namespace s3sync {
namespace sync {

// Key -> checksum pairs in the order the store listed them
using ChecksumListing = std::vector<std::pair<std::string, std::string>>;

// Lists every object under prefix whose key contains filter (an empty filter
// keeps everything) and prints one entry per retained key. Store failures
// propagate to the caller.
ChecksumListing list_checksums(store::ObjectStore& store,
                               const std::string& prefix,
                               const std::string& filter,
                               std::ostream& out,
                               const store::CallContext& ctx = store::CallContext());

} // namespace sync
} // namespace s3sync

#endif // S3SYNC_SYNC_OBJECT_LISTER_HPP
