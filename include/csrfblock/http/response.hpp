#ifndef CSRFBLOCK_HTTP_RESPONSE_HPP
#define CSRFBLOCK_HTTP_RESPONSE_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http.hpp>

namespace csrfblock::http
{
  /**
   * @brief Lazy body: each call yields the next chunk, std::nullopt ends the body.
   */
  using BodyProducer = std::function<std::optional<std::string>()>;

  /** @brief Producer yielding the given chunks in order, unchanged. */
  BodyProducer chunks(std::vector<std::string> parts);

  /**
   * @brief Response under construction: status, headers and a lazy body.
   *
   * Setters are fluent, like the handler-side API of the pipeline. The body
   * is pulled with next_chunk() (or collect()) once the chain has run.
   */
  class Response
  {
  public:
    Response() = default;

    Response &status(int code) noexcept
    {
      status_ = code;
      return *this;
    }

    Response &ok() noexcept { return status(200); }

    int status_code() const noexcept { return status_; }

    /** @brief Set (replace) a header. */
    Response &header(std::string_view name, std::string_view value);

    /** @brief Add a header line, keeping existing ones (Set-Cookie). */
    Response &append(std::string_view name, std::string_view value);

    Response &erase(std::string_view name);

    std::string header(std::string_view name) const;
    bool has_header(std::string_view name) const;

    /** @brief Single-chunk body with a matching Content-Length. */
    Response &send(std::string body);

    Response &text(std::string_view body);
    Response &html(std::string_view body);

    /**
     * @brief Streamed body of unknown length; drops any Content-Length.
     */
    Response &stream(BodyProducer producer);

    bool has_body() const noexcept { return static_cast<bool>(body_); }

    /** @brief Detach the body producer (for wrapping). */
    BodyProducer take_body();

    std::optional<std::string> next_chunk();

    /** @brief Drain the remaining body. */
    std::string collect();

    boost::beast::http::fields &fields() noexcept { return fields_; }
    const boost::beast::http::fields &fields() const noexcept { return fields_; }

    /**
     * @brief Materialize into a Beast message for writing on a connection.
     */
    boost::beast::http::response<boost::beast::http::string_body> to_beast(unsigned version = 11);

  private:
    int status_{200};
    boost::beast::http::fields fields_{};
    BodyProducer body_{};
  };

} // namespace csrfblock::http

#endif // CSRFBLOCK_HTTP_RESPONSE_HPP
