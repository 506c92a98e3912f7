/**
 *
 *  @file csrf_block.hpp
 *
 *  CsrfBlock
 */
#ifndef CSRFBLOCK_SECURITY_CSRF_BLOCK_HPP
#define CSRFBLOCK_SECURITY_CSRF_BLOCK_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include <csrfblock/middleware.hpp>
#include <csrfblock/security/token_generator.hpp>

namespace csrfblock::security
{
  struct CsrfBlockOptions
  {
    /** form field carrying the token */
    std::string parameter_name{"SEC"};

    /** request header carrying the token, checked before the parameter */
    std::string header_name{"X-CSRF-Token"};

    std::size_t token_length{kDefaultTokenLength};
    std::string session_key{"csrfblock.token"};

    /** also inject <meta name="meta_name" content="TOKEN"/> after <head> */
    bool add_meta{false};
    std::string meta_name{"csrftoken"};

    /** runs instead of the default 403 response on rejection */
    Handler blocked{};

    /** drop the token after each accepted POST */
    bool onetime{false};

    /** replaces the default SHA-1 generator when set */
    TokenGeneratorFn token_generator{};
  };

  /**
   * @brief Read options from a JSON object.
   *
   * Recognized keys: parameter_name, header_name, token_length, session_key,
   * add_meta, meta_name, onetime. Unknown keys are ignored.
   *
   * @throws ConfigurationError on a non-object document or a mistyped value
   */
  CsrfBlockOptions csrf_block_options_from_json(const nlohmann::json &j);

  /** @brief 403, text/plain, "CSRF detected". */
  void send_csrf_detected(http::Response &res);

  /**
   * @brief CSRF protection middleware.
   *
   * Must run after auth::attach_session. POST requests must present the
   * session token in the configured header or parameter; HTML responses get
   * the token injected into their same-origin POST forms.
   *
   * @throws ConfigurationError on invalid options, and per request when no
   * session is attached
   */
  MiddlewareFn csrf_block(CsrfBlockOptions opt = {});

} // namespace csrfblock::security

#endif // CSRFBLOCK_SECURITY_CSRF_BLOCK_HPP
