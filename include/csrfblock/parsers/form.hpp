#ifndef CSRFBLOCK_PARSERS_FORM_HPP
#define CSRFBLOCK_PARSERS_FORM_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace csrfblock::parsers
{
  /** Decoded name/value pairs; a repeated name keeps its last value. */
  using Params = std::unordered_map<std::string, std::string>;

  namespace detail
  {
    inline int hex_digit(char c) noexcept
    {
      if (c >= '0' && c <= '9')
        return c - '0';
      if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
      if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
      return -1;
    }
  } // namespace detail

  /**
   * @brief Decode '+' and %XX escapes; a malformed escape is kept literally.
   */
  inline std::string url_decode(std::string_view in)
  {
    std::string out;
    out.reserve(in.size());

    std::size_t i = 0;
    while (i < in.size())
    {
      const char c = in[i];
      if (c == '+')
      {
        out += ' ';
        ++i;
        continue;
      }

      if (c == '%' && i + 2 < in.size())
      {
        const int hi = detail::hex_digit(in[i + 1]);
        const int lo = detail::hex_digit(in[i + 2]);
        if (hi >= 0 && lo >= 0)
        {
          out += static_cast<char>(hi * 16 + lo);
          i += 3;
          continue;
        }
      }

      out += c;
      ++i;
    }
    return out;
  }

  /**
   * @brief Parse "a=1&b=x+y" (query strings and urlencoded bodies).
   *
   * Pairs are separated by '&' or ';'. Pairs with an empty name are dropped;
   * a name without '=' maps to "".
   */
  inline Params parse_urlencoded(std::string_view qs)
  {
    Params out;

    while (!qs.empty())
    {
      const std::size_t sep = qs.find_first_of("&;");
      const std::string_view pair = qs.substr(0, sep);
      qs = sep == std::string_view::npos ? std::string_view{} : qs.substr(sep + 1);

      const std::size_t eq = pair.find('=');
      std::string name = url_decode(pair.substr(0, eq));
      if (name.empty())
        continue;

      out[std::move(name)] = eq == std::string_view::npos
                                 ? std::string()
                                 : url_decode(pair.substr(eq + 1));
    }
    return out;
  }

} // namespace csrfblock::parsers

#endif // CSRFBLOCK_PARSERS_FORM_HPP
