/**
 *
 *  @file token_generator.hpp
 *
 *  CsrfBlock
 */
#ifndef CSRFBLOCK_SECURITY_TOKEN_GENERATOR_HPP
#define CSRFBLOCK_SECURITY_TOKEN_GENERATOR_HPP

#include <cstddef>
#include <functional>
#include <string>

namespace csrfblock::security
{
  constexpr std::size_t kDefaultTokenLength = 16;

  /** SHA-1 hex digest length. */
  constexpr std::size_t kMaxTokenLength = 40;

  /**
   * @brief Token generation strategy; anything returning a fresh token.
   */
  using TokenGeneratorFn = std::function<std::string()>;

  /**
   * @brief Default strategy: SHA-1 over fresh entropy, hex encoded and truncated.
   *
   * The seed mixes OpenSSL random bytes with the process id and the current
   * time. Tokens are not reproducible across processes.
   */
  class TokenGenerator
  {
  public:
    /**
     * @throws ConfigurationError if length is not within 1..kMaxTokenLength
     */
    explicit TokenGenerator(std::size_t length = kDefaultTokenLength);

    /**
     * @throws std::runtime_error if the entropy source or digest fails
     */
    std::string generate() const;

    std::string operator()() const { return generate(); }

    std::size_t length() const noexcept { return length_; }

  private:
    std::size_t length_;
  };

} // namespace csrfblock::security

#endif // CSRFBLOCK_SECURITY_TOKEN_GENERATOR_HPP
