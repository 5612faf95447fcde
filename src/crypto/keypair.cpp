// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/keypair.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace peernet {
namespace crypto {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); }
};

struct BnDeleter {
  void operator()(BIGNUM* b) const { BN_free(b); }
};

struct BnCtxDeleter {
  void operator()(BN_CTX* c) const { BN_CTX_free(c); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

std::string LastOpenSSLError() {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return "unknown error";
  }
  char buf[256];
  ERR_error_string_n(err, buf, sizeof(buf));
  return buf;
}

// Field prime 2^255 - 19 and curve constant d = -121665/121666 mod p
constexpr const char* ED25519_P_HEX = "7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffed";
constexpr const char* ED25519_D_HEX = "52036cee2b6ffe738cc740797779e89800700a4d4141d8ab75eb4dca135978a3";

// y coordinates of the eight small-order points (orders 1, 2, 4 and 8).
// Keys on these points verify forged signatures under some verifiers.
constexpr const char* SMALL_ORDER_Y_HEX[] = {
    "0",
    "1",
    "7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffec",
    "05fc536d880238b13933c6d305acdfd5f098eff289f4c345b027b2c28f95e826",
    "7a03ac9277fdc74ec6cc392cfa53202a0f67100d760b3cba4fd84d3d706a17c7",
};

BnPtr BnFromHex(const char* hex) {
  BIGNUM* bn = nullptr;
  if (BN_hex2bn(&bn, hex) == 0) {
    return nullptr;
  }
  return BnPtr(bn);
}

// RFC 8032 section 5.1.3 point decoding, minus the square root: the encoding
// is a point iff y is canonical and (y^2 - 1) / (d y^2 + 1) is a square mod p.
bool DecodesToCurvePoint(std::span<const uint8_t> encoded) {
  std::array<uint8_t, PUBLIC_KEY_SIZE> y_bytes{};
  std::copy(encoded.begin(), encoded.end(), y_bytes.begin());
  const bool x_sign = (y_bytes[PUBLIC_KEY_SIZE - 1] & 0x80) != 0;
  y_bytes[PUBLIC_KEY_SIZE - 1] &= 0x7f;

  BnCtxPtr ctx(BN_CTX_new());
  BnPtr p = BnFromHex(ED25519_P_HEX);
  BnPtr d = BnFromHex(ED25519_D_HEX);
  BnPtr y(BN_lebin2bn(y_bytes.data(), static_cast<int>(y_bytes.size()), nullptr));
  BnPtr y2(BN_new());
  BnPtr u(BN_new());
  BnPtr v(BN_new());
  BnPtr x2(BN_new());
  BnPtr exponent(BN_new());
  BnPtr legendre(BN_new());
  if (!ctx || !p || !d || !y || !y2 || !u || !v || !x2 || !exponent || !legendre) {
    LOG_CRYPTO_ERROR("Ed25519 point decode: allocation failed");
    ERR_clear_error();
    return false;
  }

  // Non-canonical: y must be reduced mod p
  if (BN_cmp(y.get(), p.get()) >= 0) {
    return false;
  }

  for (const char* hex : SMALL_ORDER_Y_HEX) {
    BnPtr small = BnFromHex(hex);
    if (small && BN_cmp(y.get(), small.get()) == 0) {
      return false;
    }
  }

  bool ok = BN_mod_sqr(y2.get(), y.get(), p.get(), ctx.get()) == 1 &&
            BN_mod_sub(u.get(), y2.get(), BN_value_one(), p.get(), ctx.get()) == 1 &&
            BN_mod_mul(v.get(), d.get(), y2.get(), p.get(), ctx.get()) == 1 &&
            BN_mod_add(v.get(), v.get(), BN_value_one(), p.get(), ctx.get()) == 1 &&
            BN_mod_inverse(v.get(), v.get(), p.get(), ctx.get()) != nullptr &&
            BN_mod_mul(x2.get(), u.get(), v.get(), p.get(), ctx.get()) == 1;
  if (!ok) {
    LOG_CRYPTO_ERROR("Ed25519 point decode failed: {}", LastOpenSSLError());
    ERR_clear_error();
    return false;
  }

  if (BN_is_zero(x2.get())) {
    // x = 0 has no negative; a set sign bit is a non-canonical encoding
    return !x_sign;
  }

  // Euler's criterion: x2^((p-1)/2) == 1 iff x2 is a non-zero square
  ok = BN_sub(exponent.get(), p.get(), BN_value_one()) == 1 && BN_rshift1(exponent.get(), exponent.get()) == 1 &&
       BN_mod_exp(legendre.get(), x2.get(), exponent.get(), p.get(), ctx.get()) == 1;
  if (!ok) {
    LOG_CRYPTO_ERROR("Ed25519 point decode failed: {}", LastOpenSSLError());
    ERR_clear_error();
    return false;
  }
  return BN_is_one(legendre.get());
}

}  // namespace

KeyPair::KeyPair(std::shared_ptr<evp_pkey_st> pkey) : pkey_(std::move(pkey)) {
  size_t len = public_key_.size();
  if (EVP_PKEY_get_raw_public_key(pkey_.get(), public_key_.data(), &len) != 1 || len != public_key_.size()) {
    throw std::runtime_error("failed to extract Ed25519 public key: " + LastOpenSSLError());
  }
}

KeyPair KeyPair::Generate() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx) {
    throw std::runtime_error("EVP_PKEY_CTX_new_id failed: " + LastOpenSSLError());
  }
  EVP_PKEY* key = nullptr;
  if (EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &key) != 1 || !key) {
    throw std::runtime_error("Ed25519 keygen failed: " + LastOpenSSLError());
  }
  return KeyPair(std::shared_ptr<EVP_PKEY>(key, PkeyDeleter{}));
}

std::optional<KeyPair> KeyPair::FromPrivateKey(std::span<const uint8_t> private_key) {
  if (private_key.size() != PRIVATE_KEY_SIZE) {
    return std::nullopt;
  }
  EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size());
  if (!key) {
    LOG_CRYPTO_DEBUG("rejected Ed25519 private key: {}", LastOpenSSLError());
    return std::nullopt;
  }
  return KeyPair(std::shared_ptr<EVP_PKEY>(key, PkeyDeleter{}));
}

Signature KeyPair::Sign(std::span<const uint8_t> message) const {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  Signature sig{};
  size_t sig_len = sig.size();
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) != 1 ||
      EVP_DigestSign(ctx.get(), sig.data(), &sig_len, message.data(), message.size()) != 1 ||
      sig_len != sig.size()) {
    throw std::runtime_error("Ed25519 sign failed: " + LastOpenSSLError());
  }
  return sig;
}

bool KeyPair::Verify(const PublicKey& public_key, std::span<const uint8_t> message, const Signature& signature) {
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!key) {
    ERR_clear_error();
    return false;
  }
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ERR_clear_error();
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    LOG_CRYPTO_DEBUG("EVP_DigestVerifyInit failed: {}", LastOpenSSLError());
    ERR_clear_error();
    return false;
  }
  int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size());
  if (rc != 1) {
    // Leave no stale entries on the thread's error queue
    ERR_clear_error();
    return false;
  }
  return true;
}

bool KeyPair::IsValidPublicKey(std::span<const uint8_t> public_key) {
  if (public_key.size() != PUBLIC_KEY_SIZE) {
    return false;
  }
  // Raw-key import takes any 32 bytes; decode the point first
  if (!DecodesToCurvePoint(public_key)) {
    return false;
  }
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!key) {
    ERR_clear_error();
    return false;
  }
  return true;
}

}  // namespace crypto
}  // namespace peernet
