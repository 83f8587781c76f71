#ifndef S3SYNC_SYNC_PROGRESS_TRACKER_HPP
#define S3SYNC_SYNC_PROGRESS_TRACKER_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <ostream>
#include <variant>
#include "store/object_store.hpp"

namespace s3sync {
namespace sync {

// Size of an upload source
struct LocalFileSize {
  std::filesystem::path path;
};

// Size of a download source
struct RemoteObjectSize {
  store::ObjectInfo object;
};

using SizeSource = std::variant<LocalFileSize, RemoteObjectSize>;

// Resolves the expected byte count. An unreadable local size counts as zero.
std::uintmax_t resolve_size(const SizeSource& source);

// Byte counter for a single transfer, rendering
// "<delivered> / <total> (<percent>%)" after every increment
class ProgressTracker {
public:
  // ---- CONSTRUCTOR ----
  ProgressTracker(const SizeSource& source, std::ostream& out);


  // ---- PROGRESS ----
  // Safe to call from several transfer workers at once
  void advance(std::uintmax_t bytes);


  // ---- GETTERS ----
  std::uintmax_t total() const { return total_; }
  std::uintmax_t delivered() const;
  // Zero when the total is zero
  double percent() const;

private:
  // ---- PARAMETERS ----
  const std::uintmax_t total_;
  std::uintmax_t delivered_{0};
  std::ostream& out_;
  mutable std::mutex mutex_;

  double percent_locked() const;
};

} // namespace sync
} // namespace s3sync

#endif // S3SYNC_SYNC_PROGRESS_TRACKER_HPP
