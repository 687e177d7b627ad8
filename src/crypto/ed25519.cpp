#include "crypto/ed25519.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <cstring>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>

namespace parley {
namespace crypto {

namespace {

std::string LastOpenSslError() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct BioDeleter {
  void operator()(BIO *bio) const { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

} // namespace

void KeyPair::PkeyDeleter::operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }

KeyPair::KeyPair(PkeyPtr pkey) : pkey_(std::move(pkey)) {
  if (EVP_PKEY_id(pkey_.get()) != EVP_PKEY_ED25519) {
    throw CryptoError("key is not Ed25519");
  }
  size_t len = PUBLIC_KEY_SIZE;
  public_key_.resize(PUBLIC_KEY_SIZE);
  if (EVP_PKEY_get_raw_public_key(pkey_.get(), public_key_.data(), &len) != 1 ||
      len != PUBLIC_KEY_SIZE) {
    throw CryptoError("cannot export public key: " + LastOpenSslError());
  }
}

KeyPair::KeyPair(KeyPair &&) noexcept = default;
KeyPair &KeyPair::operator=(KeyPair &&) noexcept = default;
KeyPair::~KeyPair() = default;

KeyPair KeyPair::Generate() {
  EVP_PKEY_CTX *ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  if (!ctx) {
    throw CryptoError("EVP_PKEY_CTX_new_id failed: " + LastOpenSslError());
  }
  EVP_PKEY *raw = nullptr;
  int ok = EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_keygen(ctx, &raw) == 1;
  EVP_PKEY_CTX_free(ctx);
  if (!ok || !raw) {
    throw CryptoError("Ed25519 key generation failed: " + LastOpenSslError());
  }
  return KeyPair(PkeyPtr(raw));
}

KeyPair KeyPair::Load(const std::filesystem::path &path) {
  std::string pem = util::read_file_string(path);
  if (pem.empty()) {
    throw CryptoError("cannot read key file " + path.string());
  }
  BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    throw CryptoError("BIO_new_mem_buf failed");
  }
  EVP_PKEY *raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!raw) {
    throw CryptoError("invalid key file " + path.string() + ": " +
                      LastOpenSslError());
  }
  return KeyPair(PkeyPtr(raw));
}

KeyPair KeyPair::LoadOrCreate(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return Load(path);
  }
  KeyPair key = Generate();
  if (!key.Save(path)) {
    throw CryptoError("cannot write key file " + path.string());
  }
  LOG_INFO("Generated new identity key at {}", path.string());
  return key;
}

bool KeyPair::Save(const std::filesystem::path &path) const {
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey_.get(), nullptr,
                                       nullptr, 0, nullptr, nullptr) != 1) {
    LOG_ERROR("PEM encoding failed: {}", LastOpenSslError());
    return false;
  }
  char *data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  if (len <= 0 || !data) {
    return false;
  }
  return util::atomic_write_file(path, std::string(data, static_cast<size_t>(len)),
                                 0600);
}

std::vector<uint8_t> KeyPair::Sign(const std::vector<uint8_t> &message) const {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw CryptoError("EVP_MD_CTX_new failed");
  }
  std::vector<uint8_t> sig(SIGNATURE_SIZE);
  size_t siglen = sig.size();
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) != 1 ||
      EVP_DigestSign(ctx.get(), sig.data(), &siglen, message.data(),
                     message.size()) != 1) {
    throw CryptoError("Ed25519 signing failed: " + LastOpenSslError());
  }
  sig.resize(siglen);
  return sig;
}

bool Verify(const std::vector<uint8_t> &public_key,
            const std::vector<uint8_t> &message,
            const std::vector<uint8_t> &signature) {
  if (public_key.size() != PUBLIC_KEY_SIZE ||
      signature.size() != SIGNATURE_SIZE) {
    return false;
  }
  std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY *)> pkey(
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free);
  if (!pkey) {
    ERR_clear_error();
    return false;
  }
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return false;
  }
  bool ok =
      EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) == 1 &&
      EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                       message.data(), message.size()) == 1;
  if (!ok) {
    ERR_clear_error();
  }
  return ok;
}

std::vector<uint8_t> RandomBytes(size_t count) {
  std::vector<uint8_t> out(count);
  if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    throw CryptoError("RAND_bytes failed: " + LastOpenSslError());
  }
  return out;
}

uint64_t RandomUint64() {
  auto bytes = RandomBytes(sizeof(uint64_t));
  uint64_t value;
  std::memcpy(&value, bytes.data(), sizeof(value));
  return value;
}

} // namespace crypto
} // namespace parley
