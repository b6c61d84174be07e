#ifndef PCLOUD_CRYPTO_ERROR_HPP
#define PCLOUD_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pcloud::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class KeyError : public CryptoError {
public:
    explicit KeyError(const std::string& message) 
        : CryptoError("Key error: " + message) {}
};

class SigningError : public CryptoError {
public:
    explicit SigningError(const std::string& message) 
        : CryptoError("Signing error: " + message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

} // namespace pcloud::crypto

#endif // PCLOUD_CRYPTO_ERROR_HPP
