#include <csrfblock/http/request.hpp>
#include <csrfblock/helpers/strings/strings.hpp>
#include <csrfblock/parsers/multipart.hpp>

namespace csrfblock::http
{
  namespace
  {
    boost::beast::string_view to_bsv(std::string_view s)
    {
      return {s.data(), s.size()};
    }

    std::string to_std(boost::beast::string_view s)
    {
      return std::string(s.data(), s.size());
    }
  } // namespace

  Request::Request(RawRequest &raw, std::string server_name)
      : raw_(&raw), server_name_(std::move(server_name))
  {
  }

  std::string Request::method() const
  {
    return to_std(raw_->method_string());
  }

  std::string Request::target() const
  {
    return to_std(raw_->target());
  }

  std::string Request::path() const
  {
    std::string t = target();
    auto q = t.find('?');
    if (q != std::string::npos)
      t.resize(q);
    return t;
  }

  std::string Request::header(std::string_view name) const
  {
    auto it = raw_->find(to_bsv(name));
    if (it == raw_->end())
      return {};
    return to_std(it->value());
  }

  bool Request::has_header(std::string_view name) const
  {
    return raw_->find(to_bsv(name)) != raw_->end();
  }

  const std::string &Request::body() const noexcept
  {
    return raw_->body();
  }

  const parsers::Params &Request::query() const
  {
    if (!query_)
    {
      const std::string t = target();
      auto q = t.find('?');
      if (q == std::string::npos)
        query_.emplace();
      else
        query_ = parsers::parse_urlencoded(std::string_view(t).substr(q + 1));
    }
    return *query_;
  }

  const parsers::Params &Request::body_params() const
  {
    if (body_params_)
      return *body_params_;

    body_params_.emplace();

    const std::string ct = header("content-type");
    if (helpers::strings::starts_with_icase(ct, "application/x-www-form-urlencoded"))
    {
      body_params_ = parsers::parse_urlencoded(body());
    }
    else if (helpers::strings::starts_with_icase(ct, "multipart/form-data"))
    {
      // a malformed multipart body simply contributes no parameters
      auto parsed = parsers::parse_multipart(body(), ct);
      if (parsed)
        body_params_ = std::move(parsed.value().fields);
    }

    return *body_params_;
  }

  std::optional<std::string> Request::param(std::string_view name) const
  {
    const std::string key(name);

    const auto &bp = body_params();
    if (auto it = bp.find(key); it != bp.end())
      return it->second;

    const auto &qp = query();
    if (auto it = qp.find(key); it != qp.end())
      return it->second;

    return std::nullopt;
  }

} // namespace csrfblock::http
