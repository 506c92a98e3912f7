/**
 *
 *  @file request.hpp
 *
 *  CsrfBlock
 */
#ifndef CSRFBLOCK_HTTP_REQUEST_HPP
#define CSRFBLOCK_HTTP_REQUEST_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/beast/http.hpp>

#include <csrfblock/parsers/form.hpp>

namespace csrfblock::auth
{
  struct Session;
}

namespace csrfblock::http
{
  using RawRequest = boost::beast::http::request<boost::beast::http::string_body>;

  /**
   * @brief Read-mostly facade over a Beast request.
   *
   * Header lookup is case-insensitive. Query string and body parameters are
   * parsed on first use; body parameters are understood for
   * application/x-www-form-urlencoded and multipart/form-data only.
   */
  class Request
  {
  public:
    explicit Request(RawRequest &raw, std::string server_name = {});

    std::string method() const;
    std::string target() const;

    /** @brief Target without the query string. */
    std::string path() const;

    std::string header(std::string_view name) const;
    bool has_header(std::string_view name) const;

    const std::string &body() const noexcept;
    const std::string &server_name() const noexcept { return server_name_; }

    const parsers::Params &query() const;
    const parsers::Params &body_params() const;

    /**
     * @brief Merged parameter lookup: body first, then query string.
     */
    std::optional<std::string> param(std::string_view name) const;

    /** @brief Session attached by the session layer, or nullptr. */
    auth::Session *session() const noexcept { return session_.get(); }
    void set_session(std::shared_ptr<auth::Session> s) noexcept { session_ = std::move(s); }

    RawRequest &raw() noexcept { return *raw_; }
    const RawRequest &raw() const noexcept { return *raw_; }

  private:
    RawRequest *raw_{nullptr};
    std::string server_name_;
    std::shared_ptr<auth::Session> session_{};

    mutable std::optional<parsers::Params> query_{};
    mutable std::optional<parsers::Params> body_params_{};
  };

} // namespace csrfblock::http

#endif // CSRFBLOCK_HTTP_REQUEST_HPP
