#include <notary/common/critical.hpp>
#include <notary/crypto/digest.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace notary::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

notary::schema::hash32_t digest(const EVP_MD* md,
                                const notary::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    notary::common::critical("failed to allocate digest context");
  }
  auto output = notary::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    notary::common::critical("digest computation failed");
  }
  return output;
}

}  // namespace

notary::schema::hash32_t sha256(const notary::schema::bytes_view_t& bytes) {
  return digest(EVP_sha256(), bytes);
}

notary::schema::hash32_t sha256(const std::string_view& str) {
  return digest(EVP_sha256(), notary::schema::make_bytes_view(str));
}

notary::schema::hash32_t sha512_256(const notary::schema::bytes_view_t& bytes) {
  return digest(EVP_sha512_256(), bytes);
}

std::optional<notary::schema::bytes_t> random_bytes(const std::size_t size) {
  auto out = notary::schema::bytes_t(size);
  if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
    return std::nullopt;
  }
  return out;
}

}  // namespace notary::crypto
