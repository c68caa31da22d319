#ifndef PEERCHUNKS_CRYPTO_ERROR_HPP
#define PEERCHUNKS_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace peerchunks::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Key, nonce or ciphertext was not valid hex
class HexDecodeError : public CryptoError {
public:
    explicit HexDecodeError(const std::string& message)
        : CryptoError("Hex decoding error: " + message) {}
};

// Key is not 32 bytes or nonce is not 12 bytes
class InvalidKeyLengthError : public CryptoError {
public:
    explicit InvalidKeyLengthError(const std::string& message)
        : CryptoError("Invalid key length: " + message) {}
};

// Cipher failure, including authentication tag mismatch
class AesGcmError : public CryptoError {
public:
    explicit AesGcmError(const std::string& message)
        : CryptoError("AES-GCM operation failed: " + message) {}
};

} // namespace peerchunks::crypto

#endif // PEERCHUNKS_CRYPTO_ERROR_HPP
