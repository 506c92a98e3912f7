#ifndef CSRFBLOCK_SECURITY_TOKEN_STORE_HPP
#define CSRFBLOCK_SECURITY_TOKEN_STORE_HPP

#include <optional>
#include <string>
#include <utility>

#include <csrfblock/auth/session.hpp>
#include <csrfblock/security/token_generator.hpp>

namespace csrfblock::security
{
  /**
   * @brief The session slot holding the CSRF token.
   *
   * Persistence, locking and expiry belong to the session layer.
   */
  class TokenStore
  {
  public:
    explicit TokenStore(std::string session_key)
        : key_(std::move(session_key))
    {
    }

    /** @brief Stored token; an empty value counts as no token. */
    std::optional<std::string> get(const auth::Session &s) const
    {
      auto v = s.get(key_);
      if (!v || v->empty())
        return std::nullopt;
      return v;
    }

    void set(auth::Session &s, std::string token) const
    {
      s.set(key_, std::move(token));
    }

    void clear(auth::Session &s) const
    {
      s.erase(key_);
    }

    /** @brief Stored token, generating and storing one first if needed. */
    std::string ensure(auth::Session &s, const TokenGeneratorFn &generate) const
    {
      if (auto existing = get(s))
        return *existing;

      std::string token = generate();
      set(s, token);
      return token;
    }

    const std::string &key() const noexcept { return key_; }

  private:
    std::string key_;
  };

} // namespace csrfblock::security

#endif // CSRFBLOCK_SECURITY_TOKEN_STORE_HPP
