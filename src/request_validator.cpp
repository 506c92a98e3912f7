#include <csrfblock/security/request_validator.hpp>
#include <csrfblock/helpers/strings/strings.hpp>

#include <utility>

namespace csrfblock::security
{
  namespace strings = csrfblock::helpers::strings;

  std::string transport_header_name(std::string_view configured)
  {
    std::string_view name = strings::trim(configured);
    if (strings::starts_with_icase(name, "HTTP_"))
      name.remove_prefix(5);

    std::string out = strings::to_lower_ascii(name);
    for (char &c : out)
    {
      if (c == '_')
        c = '-';
    }
    return out;
  }

  bool is_state_changing(std::string_view method) noexcept
  {
    return strings::iequals(method, "POST");
  }

  RequestValidator::RequestValidator(ValidatorOptions opt, TokenStore store)
      : parameter_name_(std::move(opt.parameter_name)),
        header_name_(transport_header_name(opt.header_name)),
        onetime_(opt.onetime),
        store_(std::move(store))
  {
  }

  Verdict RequestValidator::validate(const http::Request &req, auth::Session &session) const
  {
    if (!is_state_changing(req.method()))
      return Verdict::Accepted;

    const auto token = store_.get(session);
    if (!token)
      return Verdict::Rejected;

    bool found = req.header(header_name_) == *token;

    if (!found)
    {
      const auto presented = req.param(parameter_name_);
      found = presented && *presented == *token;
    }

    if (!found)
      return Verdict::Rejected;

    if (onetime_)
      store_.clear(session);

    return Verdict::Accepted;
  }

} // namespace csrfblock::security
