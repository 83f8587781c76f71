#include "sync/progress_tracker.hpp"
#include <iomanip>
#include <system_error>
#include <boost/io/ios_state.hpp>
#include <boost/log/trivial.hpp>

namespace s3sync {
namespace sync {

namespace {

struct SizeVisitor {
  std::uintmax_t operator()(const LocalFileSize& local) const {
    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(local.path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Progress: Unknown size for " << local.path.string()
                                 << ": " << ec.message();
      return 0;
    }
    return size;
  }

  std::uintmax_t operator()(const RemoteObjectSize& remote) const {
    return remote.object.content_length;
  }
};

} // namespace

std::uintmax_t resolve_size(const SizeSource& source) {
  return std::visit(SizeVisitor{}, source);
}

ProgressTracker::ProgressTracker(const SizeSource& source, std::ostream& out)
  : total_(resolve_size(source))
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "Progress: Tracking transfer of " << total_ << " bytes";
}

void ProgressTracker::advance(std::uintmax_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  delivered_ += bytes;

  boost::io::ios_all_saver saver(out_);
  out_ << delivered_ << " / " << total_ << " ("
       << std::fixed << std::setprecision(2) << percent_locked() << "%)\r"
       << std::flush;
}

std::uintmax_t ProgressTracker::delivered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return delivered_;
}

double ProgressTracker::percent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return percent_locked();
}

double ProgressTracker::percent_locked() const {
  if (total_ == 0) {
    return 0.0;
  }
  return static_cast<double>(delivered_) / static_cast<double>(total_) * 100.0;
}

} // namespace sync
} // namespace s3sync
