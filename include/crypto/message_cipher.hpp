#ifndef PEERCHUNKS_MESSAGE_CIPHER_HPP
#define PEERCHUNKS_MESSAGE_CIPHER_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace peerchunks::crypto {

// Hex encoded nonce and ciphertext (ciphertext || tag)
struct EncryptedMessage {
  std::string nonce_hex;
  std::string ciphertext_hex;
};

class MessageCipher {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t NONCE_SIZE = 12;   // 96 bits for GCM
  static constexpr size_t TAG_SIZE = 16;     // GCM authentication tag

  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Encrypts plaintext under a 64 character hex key with a fresh random nonce
  static EncryptedMessage encrypt(const std::string& plaintext, const std::string& hex_key);
  // Authenticates and decrypts, all-or-nothing
  static std::string decrypt(const std::string& nonce_hex, const std::string& ciphertext_hex,
                             const std::string& hex_key);


  // ---- NONCE GENERATION ----
  static std::array<uint8_t, NONCE_SIZE> generate_nonce();


  // ---- HEX SUPPORT ----
  static std::string to_hex(const uint8_t* data, size_t length);
  static std::vector<uint8_t> from_hex(const std::string& hex);

private:
  // Decodes and validates the key, throws before any cipher work is done
  static std::vector<uint8_t> decode_key(const std::string& hex_key);
};

} // namespace peerchunks::crypto

#endif // PEERCHUNKS_MESSAGE_CIPHER_HPP
