#ifndef S3SYNC_STORE_ERROR_HPP
#define S3SYNC_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace s3sync::store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message)
    : std::runtime_error(message) {}
};

class AccessDenied : public StoreError {
public:
  explicit AccessDenied(const std::string& message)
    : StoreError("Access denied: " + message) {}
};

// Raised by operations that need an existing object
class ObjectNotFound : public StoreError {
public:
  explicit ObjectNotFound(const std::string& key)
    : StoreError("No such key: " + key) {}
};

// Raised when a call runs past its deadline or its token is cancelled
class CallCancelled : public StoreError {
public:
  explicit CallCancelled(const std::string& message)
    : StoreError("Call cancelled: " + message) {}
};

} // namespace s3sync::store

#endif // S3SYNC_STORE_ERROR_HPP
