#ifndef CSRFBLOCK_HELPERS_STRINGS_HPP
#define CSRFBLOCK_HELPERS_STRINGS_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace csrfblock::helpers::strings
{
  inline char to_lower_ascii(char c) noexcept
  {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
  }

  /**
   * @brief ASCII-only lowercase copy (header names, tag names).
   */
  inline std::string to_lower_ascii(std::string_view s)
  {
    std::string out(s);
    for (char &c : out)
      c = to_lower_ascii(c);
    return out;
  }

  inline bool iequals(std::string_view a, std::string_view b) noexcept
  {
    if (a.size() != b.size())
      return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
      if (to_lower_ascii(a[i]) != to_lower_ascii(b[i]))
        return false;
    }
    return true;
  }

  inline bool starts_with_icase(std::string_view s, std::string_view prefix) noexcept
  {
    if (s.size() < prefix.size())
      return false;
    return iequals(s.substr(0, prefix.size()), prefix);
  }

  inline bool is_space(char c) noexcept
  {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
  }

  inline std::string_view trim(std::string_view s) noexcept
  {
    while (!s.empty() && is_space(s.front()))
      s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
      s.remove_suffix(1);
    return s;
  }

  /**
   * @brief Boundary parameter of a multipart Content-Type, or "".
   *
   * Parameter names compare case-insensitively; the value may be quoted.
   */
  inline std::string extract_boundary(std::string_view ct)
  {
    std::size_t pos = ct.find(';');
    while (pos != std::string_view::npos)
    {
      const std::string_view param = ct.substr(pos + 1);
      const std::size_t end = param.find(';');
      const std::size_t eq = param.find('=');

      if (eq < end && iequals(trim(param.substr(0, eq)), "boundary"))
      {
        std::string_view value = trim(param.substr(eq + 1));
        if (!value.empty() && value.front() == '"')
        {
          value.remove_prefix(1);
          return std::string(value.substr(0, value.find('"')));
        }
        return std::string(trim(value.substr(0, value.find(';'))));
      }

      pos = end == std::string_view::npos ? end : pos + 1 + end;
    }
    return {};
  }

} // namespace csrfblock::helpers::strings

#endif // CSRFBLOCK_HELPERS_STRINGS_HPP
