#include <notary/crypto/ed25519.hpp>

#include <openssl/evp.h>

#include <memory>

namespace notary::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::optional<ed25519_key_pair> extract_key_pair(EVP_PKEY* pkey) {
  auto pair = ed25519_key_pair{};
  auto seed_length = pair.seed.size();
  if (EVP_PKEY_get_raw_private_key(pkey, pair.seed.data(), &seed_length) !=
          1 ||
      seed_length != pair.seed.size()) {
    return std::nullopt;
  }
  auto public_length = pair.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, pair.public_key.data(),
                                  &public_length) != 1 ||
      public_length != pair.public_key.size()) {
    return std::nullopt;
  }
  return pair;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                                EVP_PKEY_CTX_free};
    return ctx != nullptr;
  }();
  return available_now;
}

std::optional<ed25519_key_pair> generate_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
  return extract_key_pair(pkey.get());
}

std::optional<ed25519_key_pair> ed25519_from_seed(
    const notary::schema::ed25519_seed_t& seed) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(),
                                   seed.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  return extract_key_pair(pkey.get());
}

std::optional<notary::schema::ed25519_signature_t> sign_ed25519(
    const notary::schema::bytes_view_t& message,
    const notary::schema::ed25519_seed_t& seed) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(),
                                   seed.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }

  auto signature = notary::schema::ed25519_signature_t{};
  auto signature_length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_length,
                     message.data(), message.size()) != 1 ||
      signature_length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

bool verify_ed25519(const notary::schema::bytes_view_t& message,
                    const notary::schema::public_key_t& public_key,
                    const notary::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               public_key.data(),
                                               public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

}  // namespace notary::crypto
