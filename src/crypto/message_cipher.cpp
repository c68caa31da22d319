#include "crypto/message_cipher.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <iterator>
#include <boost/algorithm/hex.hpp>
#include <boost/log/trivial.hpp>

namespace peerchunks::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

namespace {

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw AesGcmError("Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

} // namespace

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

EncryptedMessage MessageCipher::encrypt(const std::string& plaintext, const std::string& hex_key) {
  BOOST_LOG_TRIVIAL(debug) << "Message cipher: Encrypting " << plaintext.size() << " bytes";

  std::vector<uint8_t> key = decode_key(hex_key);
  std::array<uint8_t, NONCE_SIZE> nonce = generate_nonce();

  CipherContext context;
  if (EVP_EncryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
      EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    throw AesGcmError("Failed to initialize encryption context");
  }

  // GCM is a stream mode, output is never longer than the input
  std::vector<uint8_t> output(plaintext.size() + TAG_SIZE);
  int outlen = 0;
  if (EVP_EncryptUpdate(context.get(), output.data(), &outlen,
                        reinterpret_cast<const uint8_t*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    throw AesGcmError("Failed to encrypt data");
  }

  int final_len = 0;
  if (EVP_EncryptFinal_ex(context.get(), output.data() + outlen, &final_len) != 1) {
    throw AesGcmError("Failed to finalize encryption");
  }
  size_t ciphertext_len = static_cast<size_t>(outlen + final_len);

  // Append the tag after the ciphertext
  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                          output.data() + ciphertext_len) != 1) {
    throw AesGcmError("Failed to read authentication tag");
  }

  EncryptedMessage message;
  message.nonce_hex = to_hex(nonce.data(), nonce.size());
  message.ciphertext_hex = to_hex(output.data(), ciphertext_len + TAG_SIZE);

  BOOST_LOG_TRIVIAL(trace) << "Message cipher: Encryption complete";
  return message;
}

std::string MessageCipher::decrypt(const std::string& nonce_hex, const std::string& ciphertext_hex,
                                   const std::string& hex_key) {
  // Every input is decoded before any length checks
  std::vector<uint8_t> key = from_hex(hex_key);
  std::vector<uint8_t> nonce = from_hex(nonce_hex);
  std::vector<uint8_t> sealed = from_hex(ciphertext_hex);

  if (key.size() != KEY_SIZE || nonce.size() != NONCE_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Message cipher: Invalid key or nonce length: key " << key.size()
                             << " bytes, nonce " << nonce.size() << " bytes";
    throw InvalidKeyLengthError("key " + std::to_string(key.size()) + " bytes, nonce " +
                                std::to_string(nonce.size()) + " bytes");
  }

  if (sealed.size() < TAG_SIZE) {
    throw AesGcmError("Ciphertext shorter than authentication tag");
  }

  size_t ciphertext_len = sealed.size() - TAG_SIZE;

  CipherContext context;
  if (EVP_DecryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
      EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    throw AesGcmError("Failed to initialize decryption context");
  }

  std::vector<uint8_t> output(ciphertext_len + TAG_SIZE);
  int outlen = 0;
  if (EVP_DecryptUpdate(context.get(), output.data(), &outlen, sealed.data(),
                        static_cast<int>(ciphertext_len)) != 1) {
    throw AesGcmError("Failed to decrypt data");
  }

  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                          sealed.data() + ciphertext_len) != 1) {
    throw AesGcmError("Failed to set authentication tag");
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(context.get(), output.data() + outlen, &final_len) <= 0) {
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(warning) << "Message cipher: Authentication failed";
    throw AesGcmError("Authentication failed");
  }

  return std::string(reinterpret_cast<const char*>(output.data()),
                     static_cast<size_t>(outlen + final_len));
}

//==============================================
// NONCE GENERATION
//==============================================

std::array<uint8_t, MessageCipher::NONCE_SIZE> MessageCipher::generate_nonce() {
  std::array<uint8_t, NONCE_SIZE> nonce;
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw AesGcmError("Failed to generate random nonce");
  }
  return nonce;
}

//==============================================
// HEX SUPPORT
//==============================================

std::string MessageCipher::to_hex(const uint8_t* data, size_t length) {
  std::string result;
  result.reserve(length * 2);
  boost::algorithm::hex_lower(data, data + length, std::back_inserter(result));
  return result;
}

std::vector<uint8_t> MessageCipher::from_hex(const std::string& hex) {
  std::vector<uint8_t> result;
  result.reserve(hex.size() / 2);
  try {
    boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(result));
  } catch (const boost::algorithm::hex_decode_error&) {
    throw HexDecodeError("invalid hex input of length " + std::to_string(hex.size()));
  }
  return result;
}

std::vector<uint8_t> MessageCipher::decode_key(const std::string& hex_key) {
  std::vector<uint8_t> key = from_hex(hex_key);
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Message cipher: Invalid key size: " << key.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InvalidKeyLengthError("expected " + std::to_string(KEY_SIZE) + " bytes, got " +
                                std::to_string(key.size()) + " bytes");
  }
  return key;
}

} // namespace peerchunks::crypto
