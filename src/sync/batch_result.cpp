#include "sync/batch_result.hpp"
#include <algorithm>
#include <sstream>

namespace s3sync {
namespace sync {

std::size_t BatchResult::count(Outcome outcome) const {
  return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(),
    [outcome](const ItemResult& item) { return item.outcome == outcome; }));
}

std::string BatchResult::summary() const {
  std::ostringstream ss;
  ss << succeeded() << " succeeded, " << skipped() << " skipped, " << failed() << " failed";
  return ss.str();
}

} // namespace sync
} // namespace s3sync
