#ifndef S3SYNC_STORE_CALL_CONTEXT_HPP
#define S3SYNC_STORE_CALL_CONTEXT_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace s3sync::store {

// Shared flag a caller flips to stop a running batch
class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

// Deadline and cancellation state handed to every remote call
class CallContext {
public:
  using clock = std::chrono::steady_clock;

  // ---- CONSTRUCTOR ----
  // No deadline and no token: the call can never be cancelled
  CallContext() = default;
  // A zero timeout means no deadline
  CallContext(std::chrono::milliseconds timeout,
              std::shared_ptr<const CancellationToken> token);


  // ---- QUERY OPERATIONS ----
  bool cancelled() const;
  bool expired() const;

  // Throws CallCancelled naming the operation when the call must stop
  void check(const std::string& operation) const;

private:
  // ---- PARAMETERS ----
  std::optional<clock::time_point> deadline_;
  std::shared_ptr<const CancellationToken> token_;
};

} // namespace s3sync::store

#endif // S3SYNC_STORE_CALL_CONTEXT_HPP
