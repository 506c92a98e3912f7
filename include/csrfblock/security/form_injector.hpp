/**
 *
 *  @file form_injector.hpp
 *
 *  CsrfBlock
 */
#ifndef CSRFBLOCK_SECURITY_FORM_INJECTOR_HPP
#define CSRFBLOCK_SECURITY_FORM_INJECTOR_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <csrfblock/html/tokenizer.hpp>
#include <csrfblock/http/request.hpp>
#include <csrfblock/http/response.hpp>

namespace csrfblock::security
{
  struct InjectorOptions
  {
    std::string parameter_name{"SEC"};
    bool add_meta{false};
    std::string meta_name{"csrftoken"};
  };

  /** @brief Supplies the token for one response; called at most once. */
  using TokenSource = std::function<std::string()>;

  /** @brief text/html or application/xhtml+xml, prefix match, any case. */
  bool is_html_content_type(std::string_view content_type) noexcept;

  /** @brief Lowercase host with userinfo and port removed. */
  std::string normalize_host(std::string_view authority);

  /** @brief Host header if present, else the server name; normalized. */
  std::string effective_host(const http::Request &req);

  /**
   * @brief Host named by an absolute form action.
   *
   * Recognizes http://, https:// (any case) and protocol-relative //host.
   * Returns std::nullopt for relative actions.
   */
  std::optional<std::string> action_host(std::string_view action);

  bool is_cross_origin_action(std::string_view action, std::string_view host);

  /** @brief Escape for a double-quoted attribute value. */
  std::string escape_attribute(std::string_view value);

  std::string hidden_input(std::string_view name, std::string_view token);
  std::string meta_tag(std::string_view name, std::string_view token);

  /**
   * @brief Streaming rewriter adding the token to POST forms of one response.
   *
   * Chunks may be split anywhere. Only an unterminated tag is held back
   * between feed() calls; everything else is returned immediately and
   * unchanged, apart from the injected markup after a matching start tag.
   */
  class FormInjector final : private html::TokenHandler
  {
  public:
    FormInjector(InjectorOptions opt, std::string host, TokenSource token);

    std::string feed(std::string_view chunk);

    /** @brief End of body; flushes any partial markup as text. */
    std::string finish();

    bool finished() const noexcept { return finished_; }

  private:
    void on_text(std::string_view raw) override;
    void on_start_tag(const html::StartTag &tag, std::string_view raw) override;

    bool wants_token(const html::StartTag &tag) const;
    const std::string &token();

    InjectorOptions opt_;
    std::string host_;
    TokenSource source_;
    std::optional<std::string> token_{};

    html::Tokenizer tokenizer_{};
    std::string out_{};
    bool finished_{false};
  };

  /**
   * @brief Body producer piping @p upstream through @p injector.
   *
   * Upstream chunks that produce no output (a tag still open) are pulled
   * through until something can be emitted or the body ends.
   */
  http::BodyProducer inject_forms(http::BodyProducer upstream,
                                  std::shared_ptr<FormInjector> injector);

} // namespace csrfblock::security

#endif // CSRFBLOCK_SECURITY_FORM_INJECTOR_HPP
