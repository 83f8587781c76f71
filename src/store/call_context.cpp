#include "store/call_context.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>

namespace s3sync::store {

CallContext::CallContext(std::chrono::milliseconds timeout,
                         std::shared_ptr<const CancellationToken> token)
  : token_(std::move(token)) {
  if (timeout.count() > 0) {
    deadline_ = clock::now() + timeout;
  }
}

bool CallContext::cancelled() const {
  return token_ && token_->cancelled();
}

bool CallContext::expired() const {
  return deadline_ && clock::now() >= *deadline_;
}

void CallContext::check(const std::string& operation) const {
  if (cancelled()) {
    BOOST_LOG_TRIVIAL(warning) << "Call context: Cancelled during " << operation;
    throw CallCancelled(operation + " was cancelled");
  }

  if (expired()) {
    BOOST_LOG_TRIVIAL(warning) << "Call context: Deadline exceeded during " << operation;
    throw CallCancelled(operation + " exceeded its deadline");
  }
}

} // namespace s3sync::store
