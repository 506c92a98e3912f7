/**
 *
 *  @file form_injector.cpp
 *
 *  CsrfBlock
 */
#include <csrfblock/security/form_injector.hpp>
#include <csrfblock/helpers/strings/strings.hpp>

#include <utility>

namespace csrfblock::security
{
  namespace strings = csrfblock::helpers::strings;

  bool is_html_content_type(std::string_view content_type) noexcept
  {
    const std::string_view ct = strings::trim(content_type);
    return strings::starts_with_icase(ct, "text/html") ||
           strings::starts_with_icase(ct, "application/xhtml+xml");
  }

  std::string normalize_host(std::string_view authority)
  {
    std::string_view h = strings::trim(authority);

    const auto at = h.rfind('@');
    if (at != std::string_view::npos)
      h.remove_prefix(at + 1);

    if (!h.empty() && h.front() == '[')
    {
      // [v6]:port
      const auto close = h.find(']');
      if (close != std::string_view::npos)
        h = h.substr(0, close + 1);
    }
    else
    {
      const auto colon = h.find(':');
      if (colon != std::string_view::npos)
        h = h.substr(0, colon);
    }

    return strings::to_lower_ascii(h);
  }

  std::string effective_host(const http::Request &req)
  {
    const std::string host = req.header("host");
    if (!strings::trim(host).empty())
      return normalize_host(host);
    return normalize_host(req.server_name());
  }

  std::optional<std::string> action_host(std::string_view action)
  {
    std::string_view a = strings::trim(action);

    if (strings::starts_with_icase(a, "http://"))
      a.remove_prefix(7);
    else if (strings::starts_with_icase(a, "https://"))
      a.remove_prefix(8);
    else if (a.substr(0, 2) == "//")
      a.remove_prefix(2);
    else
      return std::nullopt;

    const auto end = a.find_first_of("/?#");
    if (end != std::string_view::npos)
      a = a.substr(0, end);

    return normalize_host(a);
  }

  bool is_cross_origin_action(std::string_view action, std::string_view host)
  {
    const auto target = action_host(action);
    return target && *target != host;
  }

  std::string escape_attribute(std::string_view value)
  {
    std::string out;
    out.reserve(value.size());

    for (char c : value)
    {
      switch (c)
      {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out.push_back(c);
      }
    }
    return out;
  }

  std::string hidden_input(std::string_view name, std::string_view token)
  {
    std::string s = "<input type=\"hidden\" name=\"";
    s += escape_attribute(name);
    s += "\" value=\"";
    s += escape_attribute(token);
    s += "\" />";
    return s;
  }

  std::string meta_tag(std::string_view name, std::string_view token)
  {
    std::string s = "<meta name=\"";
    s += escape_attribute(name);
    s += "\" content=\"";
    s += escape_attribute(token);
    s += "\"/>";
    return s;
  }

  FormInjector::FormInjector(InjectorOptions opt, std::string host, TokenSource token)
      : opt_(std::move(opt)),
        host_(std::move(host)),
        source_(std::move(token))
  {
  }

  std::string FormInjector::feed(std::string_view chunk)
  {
    if (finished_)
      return {};

    tokenizer_.feed(chunk, *this);
    return std::exchange(out_, std::string{});
  }

  std::string FormInjector::finish()
  {
    if (finished_)
      return {};

    tokenizer_.finish(*this);
    finished_ = true;
    return std::exchange(out_, std::string{});
  }

  void FormInjector::on_text(std::string_view raw)
  {
    out_.append(raw.data(), raw.size());
  }

  void FormInjector::on_start_tag(const html::StartTag &tag, std::string_view raw)
  {
    out_.append(raw.data(), raw.size());

    if (wants_token(tag))
      out_ += hidden_input(opt_.parameter_name, token());
    else if (opt_.add_meta && tag.is("head"))
      out_ += meta_tag(opt_.meta_name, token());
  }

  bool FormInjector::wants_token(const html::StartTag &tag) const
  {
    if (!tag.is("form"))
      return false;

    const auto method = tag.attribute("method");
    if (!method || !strings::iequals(strings::trim(*method), "post"))
      return false;

    const auto action = tag.attribute("action");
    return !action || !is_cross_origin_action(*action, host_);
  }

  const std::string &FormInjector::token()
  {
    if (!token_)
      token_ = source_();
    return *token_;
  }

  http::BodyProducer inject_forms(http::BodyProducer upstream,
                                  std::shared_ptr<FormInjector> injector)
  {
    return [upstream = std::move(upstream), injector = std::move(injector)]() mutable
           -> std::optional<std::string>
    {
      while (!injector->finished())
      {
        std::optional<std::string> chunk;
        if (upstream)
          chunk = upstream();

        std::string out = chunk ? injector->feed(*chunk) : injector->finish();
        if (!out.empty())
          return out;
      }
      return std::nullopt;
    };
  }

} // namespace csrfblock::security
