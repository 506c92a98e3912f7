#ifndef CSRFBLOCK_PARSERS_MULTIPART_HPP
#define CSRFBLOCK_PARSERS_MULTIPART_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <csrfblock/core/result.hpp>
#include <csrfblock/helpers/strings/strings.hpp>
#include <csrfblock/parsers/form.hpp>

namespace csrfblock::parsers
{
  struct MultipartForm
  {
    Params fields{}; // last-wins for same key
    std::size_t files{0};
  };

  /**
   * @brief Value of one header inside a part header block ("K: v\r\n...").
   */
  inline std::string part_header_value(std::string_view headers, std::string_view key)
  {
    std::size_t pos = 0;
    while (pos < headers.size())
    {
      auto eol = headers.find("\r\n", pos);
      if (eol == std::string_view::npos)
        eol = headers.size();

      auto line = headers.substr(pos, eol - pos);
      pos = eol + 2;

      auto colon = line.find(':');
      if (colon == std::string_view::npos)
        continue;

      if (helpers::strings::iequals(helpers::strings::trim(line.substr(0, colon)), key))
        return std::string(helpers::strings::trim(line.substr(colon + 1)));
    }
    return {};
  }

  /**
   * @brief Parameter of a Content-Disposition value, e.g. name="x".
   *
   * Matches whole parameter names only, so "name" never matches "filename".
   */
  inline std::string disposition_param(std::string_view cd, std::string_view name)
  {
    std::size_t pos = 0;
    while (pos < cd.size())
    {
      // parameters are ';' separated; quoted values may contain ';'
      std::size_t semi = pos;
      bool quoted = false;
      while (semi < cd.size() && (quoted || cd[semi] != ';'))
      {
        if (cd[semi] == '"')
          quoted = !quoted;
        ++semi;
      }

      auto part = helpers::strings::trim(cd.substr(pos, semi - pos));
      pos = semi + 1;

      auto eq = part.find('=');
      if (eq == std::string_view::npos)
        continue;
      if (!helpers::strings::iequals(helpers::strings::trim(part.substr(0, eq)), name))
        continue;

      auto v = helpers::strings::trim(part.substr(eq + 1));
      if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
        v = v.substr(1, v.size() - 2);
      return std::string(v);
    }
    return {};
  }

  /**
   * @brief Collect the text fields of a multipart/form-data body.
   *
   * File parts (those carrying a filename) are counted but not kept.
   * Fails only when the content type carries no boundary.
   */
  inline Result<MultipartForm> parse_multipart(std::string_view body, std::string_view content_type)
  {
    const std::string boundary = helpers::strings::extract_boundary(content_type);
    if (boundary.empty())
      return Error{"missing_boundary", "multipart/form-data boundary is missing"};

    MultipartForm form;

    const std::string sep = "--" + boundary;
    std::size_t pos = 0;

    while (true)
    {
      std::size_t b = body.find(sep, pos);
      if (b == std::string_view::npos)
        break;

      b += sep.size();

      // end marker
      if (body.substr(b, 2) == "--")
        break;

      if (body.substr(b, 2) == "\r\n")
        b += 2;

      std::size_t h_end = body.find("\r\n\r\n", b);
      if (h_end == std::string_view::npos)
        break;

      std::string_view headers = body.substr(b, h_end - b);
      std::size_t data_start = h_end + 4;

      std::size_t nb = body.find(sep, data_start);
      if (nb == std::string_view::npos)
        break;

      std::size_t data_end = nb;
      if (data_end >= data_start + 2 && body.substr(data_end - 2, 2) == "\r\n")
        data_end -= 2;

      pos = nb;

      const std::string cd = part_header_value(headers, "Content-Disposition");
      if (cd.empty())
        continue;

      if (!disposition_param(cd, "filename").empty())
      {
        ++form.files;
        continue;
      }

      std::string field = disposition_param(cd, "name");
      if (!field.empty())
        form.fields[std::move(field)] = std::string(body.substr(data_start, data_end - data_start));
    }

    return form;
  }

} // namespace csrfblock::parsers

#endif // CSRFBLOCK_PARSERS_MULTIPART_HPP
