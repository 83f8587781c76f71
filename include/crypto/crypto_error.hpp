#ifndef S3SYNC_CRYPTO_ERROR_HPP
#define S3SYNC_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace s3sync::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

} // namespace s3sync::crypto

#endif // S3SYNC_CRYPTO_ERROR_HPP
