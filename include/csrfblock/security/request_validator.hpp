/**
 *
 *  @file request_validator.hpp
 *
 *  CsrfBlock
 */
#ifndef CSRFBLOCK_SECURITY_REQUEST_VALIDATOR_HPP
#define CSRFBLOCK_SECURITY_REQUEST_VALIDATOR_HPP

#include <string>
#include <string_view>

#include <csrfblock/auth/session.hpp>
#include <csrfblock/http/request.hpp>
#include <csrfblock/security/token_store.hpp>

namespace csrfblock::security
{
  enum class Verdict
  {
    Accepted,
    Rejected
  };

  struct ValidatorOptions
  {
    std::string parameter_name{"SEC"};
    std::string header_name{"X-CSRF-Token"};
    bool onetime{false};
  };

  /**
   * @brief Header name as looked up on the wire.
   *
   * Lowercase, '_' mapped to '-', and a CGI style "HTTP_" prefix removed, so
   * "X-CSRF-Token", "x-csrf-token" and "HTTP_X_CSRF_TOKEN" are equivalent.
   */
  std::string transport_header_name(std::string_view configured);

  /** @brief POST, case-insensitive. */
  bool is_state_changing(std::string_view method) noexcept;

  class RequestValidator
  {
  public:
    RequestValidator(ValidatorOptions opt, TokenStore store);

    /**
     * @brief Check the token presented by a state-changing request.
     *
     * The header is tried first, then the merged body/query parameter.
     * In one-time mode an accepted token is removed from the session; a
     * rejection never touches the stored token.
     */
    Verdict validate(const http::Request &req, auth::Session &session) const;

    const std::string &header_name() const noexcept { return header_name_; }
    const std::string &parameter_name() const noexcept { return parameter_name_; }

  private:
    std::string parameter_name_;
    std::string header_name_;
    bool onetime_;
    TokenStore store_;
  };

} // namespace csrfblock::security

#endif // CSRFBLOCK_SECURITY_REQUEST_VALIDATOR_HPP
