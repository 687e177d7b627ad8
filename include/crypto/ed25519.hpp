#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;

namespace parley {
namespace crypto {

class CryptoError : public std::runtime_error {
public:
  explicit CryptoError(const std::string &what) : std::runtime_error(what) {}
};

constexpr size_t PUBLIC_KEY_SIZE = 32;
constexpr size_t SIGNATURE_SIZE = 64;

/**
 * Ed25519 identity key (OpenSSL EVP)
 *
 * The raw 32-byte public key is the peer identity on the wire. Private keys
 * are stored as unencrypted PKCS#8 PEM, readable by the owner only.
 */
class KeyPair {
public:
  // Fresh random key. Throws CryptoError.
  static KeyPair Generate();

  // Load from PEM. Throws CryptoError if the file is missing, unreadable or
  // not an Ed25519 key.
  static KeyPair Load(const std::filesystem::path &path);

  // Load path if it exists, otherwise generate and save a new key there
  static KeyPair LoadOrCreate(const std::filesystem::path &path);

  KeyPair(KeyPair &&) noexcept;
  KeyPair &operator=(KeyPair &&) noexcept;
  ~KeyPair();

  KeyPair(const KeyPair &) = delete;
  KeyPair &operator=(const KeyPair &) = delete;

  // Write PEM with 0600 permissions. Returns false on I/O failure.
  bool Save(const std::filesystem::path &path) const;

  const std::vector<uint8_t> &public_key() const { return public_key_; }

  // 64-byte signature over message
  std::vector<uint8_t> Sign(const std::vector<uint8_t> &message) const;

private:
  struct PkeyDeleter {
    void operator()(EVP_PKEY *p) const;
  };
  using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

  explicit KeyPair(PkeyPtr pkey);

  PkeyPtr pkey_;
  std::vector<uint8_t> public_key_;
};

// Check an Ed25519 signature. Malformed keys or signatures verify false.
bool Verify(const std::vector<uint8_t> &public_key,
            const std::vector<uint8_t> &message,
            const std::vector<uint8_t> &signature);

// Cryptographically secure random bytes. Throws CryptoError.
std::vector<uint8_t> RandomBytes(size_t count);

// Random 64-bit value from the same source (ping nonces, message guids)
uint64_t RandomUint64();

} // namespace crypto
} // namespace parley
