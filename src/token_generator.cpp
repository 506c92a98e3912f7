/**
 *
 *  @file token_generator.cpp
 *
 *  CsrfBlock
 */
#include <csrfblock/security/token_generator.hpp>
#include <csrfblock/core/result.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace csrfblock::security
{
  namespace
  {
    using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    template <class T>
    bool digest_update(EVP_MD_CTX *ctx, const T &value)
    {
      return EVP_DigestUpdate(ctx, &value, sizeof(value)) == 1;
    }

    std::string hex_encode(const unsigned char *data, std::size_t len)
    {
      static const char *hex = "0123456789abcdef";

      std::string s;
      s.resize(len * 2);
      for (std::size_t i = 0; i < len; ++i)
      {
        s[i * 2] = hex[(data[i] >> 4) & 0xF];
        s[i * 2 + 1] = hex[data[i] & 0xF];
      }
      return s;
    }
  } // namespace

  TokenGenerator::TokenGenerator(std::size_t length)
      : length_(length)
  {
    if (length_ == 0 || length_ > kMaxTokenLength)
      throw ConfigurationError("csrf: token_length must be between 1 and 40");
  }

  std::string TokenGenerator::generate() const
  {
    unsigned char seed[32];
    if (RAND_bytes(seed, sizeof(seed)) != 1)
      throw std::runtime_error("csrf: entropy source failed");

    const auto pid = static_cast<std::int64_t>(::getpid());
    const auto wall = std::chrono::system_clock::now().time_since_epoch().count();
    const auto mono = std::chrono::steady_clock::now().time_since_epoch().count();
    const void *self = this;

    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1)
      throw std::runtime_error("csrf: SHA-1 digest unavailable");

    const bool updated =
        EVP_DigestUpdate(ctx.get(), seed, sizeof(seed)) == 1 &&
        digest_update(ctx.get(), pid) &&
        digest_update(ctx.get(), wall) &&
        digest_update(ctx.get(), mono) &&
        digest_update(ctx.get(), self);

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (!updated || EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1)
      throw std::runtime_error("csrf: SHA-1 digest failed");

    std::string token = hex_encode(md, md_len);
    token.resize(length_);
    return token;
  }

} // namespace csrfblock::security
