/**
 *
 *  @file tokenizer.cpp
 *
 *  CsrfBlock
 */
#include <csrfblock/html/tokenizer.hpp>
#include <csrfblock/helpers/strings/strings.hpp>

#include <cstdint>
#include <utility>

namespace csrfblock::html
{
  namespace strings = csrfblock::helpers::strings;

  namespace
  {
    bool is_alpha(char c) noexcept
    {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    void append_utf8(std::string &out, std::uint32_t cp)
    {
      if (cp < 0x80)
      {
        out.push_back(static_cast<char>(cp));
      }
      else if (cp < 0x800)
      {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
      else if (cp < 0x10000)
      {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
      else
      {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
    }

    bool decode_numeric(std::string_view ref, std::uint32_t &cp) noexcept
    {
      // ref is what follows '#'
      int base = 10;
      if (!ref.empty() && (ref.front() == 'x' || ref.front() == 'X'))
      {
        base = 16;
        ref.remove_prefix(1);
      }
      if (ref.empty() || ref.size() > 8)
        return false;

      std::uint32_t v = 0;
      for (char c : ref)
      {
        int d;
        if (c >= '0' && c <= '9')
          d = c - '0';
        else if (base == 16 && c >= 'a' && c <= 'f')
          d = 10 + (c - 'a');
        else if (base == 16 && c >= 'A' && c <= 'F')
          d = 10 + (c - 'A');
        else
          return false;
        v = v * static_cast<std::uint32_t>(base) + static_cast<std::uint32_t>(d);
      }

      if (v == 0 || v > 0x10FFFF || (v >= 0xD800 && v <= 0xDFFF))
        return false;

      cp = v;
      return true;
    }
  } // namespace

  bool StartTag::is(std::string_view tag_name) const noexcept
  {
    return strings::iequals(name, tag_name);
  }

  const Attribute *StartTag::find(std::string_view attr_name) const noexcept
  {
    for (const auto &a : attributes)
    {
      if (strings::iequals(a.name, attr_name))
        return &a;
    }
    return nullptr;
  }

  std::optional<std::string> StartTag::attribute(std::string_view attr_name) const
  {
    if (const Attribute *a = find(attr_name))
      return a->value;
    return std::nullopt;
  }

  std::string decode_entities(std::string_view in)
  {
    std::string out;
    out.reserve(in.size());

    std::size_t i = 0;
    while (i < in.size())
    {
      const char c = in[i];
      if (c != '&')
      {
        out.push_back(c);
        ++i;
        continue;
      }

      const std::size_t semi = in.find(';', i + 1);
      if (semi == std::string_view::npos || semi - i > 12)
      {
        out.push_back(c);
        ++i;
        continue;
      }

      const std::string_view ref = in.substr(i + 1, semi - i - 1);
      std::uint32_t cp = 0;

      if (ref == "amp")
        out.push_back('&');
      else if (ref == "lt")
        out.push_back('<');
      else if (ref == "gt")
        out.push_back('>');
      else if (ref == "quot")
        out.push_back('"');
      else if (ref == "apos")
        out.push_back('\'');
      else if (ref == "nbsp")
        append_utf8(out, 0xA0);
      else if (!ref.empty() && ref.front() == '#' && decode_numeric(ref.substr(1), cp))
        append_utf8(out, cp);
      else
      {
        out.push_back(c);
        ++i;
        continue;
      }

      i = semi + 1;
    }

    return out;
  }

  void Tokenizer::feed(std::string_view chunk, TokenHandler &handler)
  {
    std::size_t i = 0;
    const std::size_t n = chunk.size();

    while (i < n)
    {
      if (state_ == State::TEXT || state_ == State::RAW_TEXT)
      {
        /* find first character */
        const std::size_t lt = chunk.find('<', i);
        if (lt == std::string_view::npos)
        {
          handler.on_text(chunk.substr(i));
          return;
        }

        if (lt > i)
          handler.on_text(chunk.substr(i, lt - i));

        pending_.assign(1, '<');
        if (state_ == State::TEXT)
        {
          state_ = State::TAG_OPEN;
        }
        else
        {
          state_ = State::RAW_TEXT_END;
          end_match_ = 0;
        }

        i = lt + 1;
        continue;
      }

      if (step(chunk[i], handler))
        ++i;
    }
  }

  void Tokenizer::finish(TokenHandler &handler)
  {
    // permissive recovery: unterminated markup is plain text
    if (!pending_.empty())
      handler.on_text(pending_);

    state_ = State::TEXT;
    pending_.clear();
    tag_ = StartTag{};
    attr_name_.clear();
    attr_value_.clear();
    dashes_ = 0;
    raw_text_end_.clear();
    end_match_ = 0;
  }

  void Tokenizer::emit_markup(TokenHandler &handler)
  {
    handler.on_text(pending_);
    pending_.clear();
    state_ = State::TEXT;
  }

  void Tokenizer::push_attribute()
  {
    if (!attr_name_.empty())
      tag_.attributes.push_back(Attribute{std::move(attr_name_), decode_entities(attr_value_)});

    attr_name_.clear();
    attr_value_.clear();
  }

  void Tokenizer::finish_start_tag(TokenHandler &handler)
  {
    handler.on_start_tag(tag_, pending_);
    pending_.clear();

    if (!tag_.self_closing && (tag_.name == "script" || tag_.name == "style"))
    {
      raw_text_end_ = tag_.name;
      state_ = State::RAW_TEXT;
    }
    else
    {
      state_ = State::TEXT;
    }
  }

  bool Tokenizer::step(char c, TokenHandler &handler)
  {
    switch (state_)
    {
    case State::TEXT:
    case State::RAW_TEXT:
      // handled by feed()
      return false;

    case State::TAG_OPEN:
      if (is_alpha(c))
      {
        tag_ = StartTag{};
        tag_.name.push_back(strings::to_lower_ascii(c));
        state_ = State::TAG_NAME;
      }
      else if (c == '/')
        state_ = State::END_TAG;
      else if (c == '!')
        state_ = State::MARKUP_DECLARATION;
      else if (c == '?')
        state_ = State::BOGUS;
      else
      {
        /* a lone '<' is text */
        emit_markup(handler);
        return false;
      }

      pending_.push_back(c);
      return true;

    case State::TAG_NAME:
      pending_.push_back(c);
      if (strings::is_space(c))
        state_ = State::BEFORE_ATTR_NAME;
      else if (c == '/')
        state_ = State::SELF_CLOSING;
      else if (c == '>')
        finish_start_tag(handler);
      else
        tag_.name.push_back(strings::to_lower_ascii(c));
      return true;

    case State::BEFORE_ATTR_NAME:
      pending_.push_back(c);
      if (strings::is_space(c))
        break;
      if (c == '/')
        state_ = State::SELF_CLOSING;
      else if (c == '>')
        finish_start_tag(handler);
      else
      {
        attr_name_.assign(1, strings::to_lower_ascii(c));
        attr_value_.clear();
        state_ = State::ATTR_NAME;
      }
      return true;

    case State::ATTR_NAME:
      pending_.push_back(c);
      if (strings::is_space(c))
        state_ = State::AFTER_ATTR_NAME;
      else if (c == '=')
        state_ = State::BEFORE_ATTR_VALUE;
      else if (c == '/')
      {
        push_attribute();
        state_ = State::SELF_CLOSING;
      }
      else if (c == '>')
      {
        push_attribute();
        finish_start_tag(handler);
      }
      else
        attr_name_.push_back(strings::to_lower_ascii(c));
      return true;

    case State::AFTER_ATTR_NAME:
      pending_.push_back(c);
      if (strings::is_space(c))
        break;
      if (c == '=')
        state_ = State::BEFORE_ATTR_VALUE;
      else if (c == '/')
      {
        push_attribute();
        state_ = State::SELF_CLOSING;
      }
      else if (c == '>')
      {
        push_attribute();
        finish_start_tag(handler);
      }
      else
      {
        /* attribute without value, another one starts */
        push_attribute();
        attr_name_.assign(1, strings::to_lower_ascii(c));
        state_ = State::ATTR_NAME;
      }
      return true;

    case State::BEFORE_ATTR_VALUE:
      pending_.push_back(c);
      if (strings::is_space(c))
        break;
      if (c == '"' || c == '\'')
      {
        quote_ = c;
        state_ = State::ATTR_VALUE_QUOTED;
      }
      else if (c == '>')
      {
        push_attribute();
        finish_start_tag(handler);
      }
      else
      {
        attr_value_.assign(1, c);
        state_ = State::ATTR_VALUE_UNQUOTED;
      }
      return true;

    case State::ATTR_VALUE_QUOTED:
      pending_.push_back(c);
      if (c == quote_)
      {
        push_attribute();
        state_ = State::BEFORE_ATTR_NAME;
      }
      else
        attr_value_.push_back(c);
      return true;

    case State::ATTR_VALUE_UNQUOTED:
      pending_.push_back(c);
      if (strings::is_space(c))
      {
        push_attribute();
        state_ = State::BEFORE_ATTR_NAME;
      }
      else if (c == '>')
      {
        push_attribute();
        finish_start_tag(handler);
      }
      else
        attr_value_.push_back(c);
      return true;

    case State::SELF_CLOSING:
      if (c == '>')
      {
        pending_.push_back(c);
        tag_.self_closing = true;
        finish_start_tag(handler);
        return true;
      }

      /* stray slash; read attributes again */
      state_ = State::BEFORE_ATTR_NAME;
      return false;

    case State::END_TAG:
    case State::BOGUS:
      pending_.push_back(c);
      if (c == '>')
        emit_markup(handler);
      return true;

    case State::MARKUP_DECLARATION:
      pending_.push_back(c);
      if (c == '-')
        state_ = State::MARKUP_DECLARATION_DASH;
      else if (c == '>')
        emit_markup(handler);
      else
        state_ = State::BOGUS;
      return true;

    case State::MARKUP_DECLARATION_DASH:
      pending_.push_back(c);
      if (c == '-')
      {
        dashes_ = 0;
        state_ = State::COMMENT;
      }
      else if (c == '>')
        emit_markup(handler);
      else
        state_ = State::BOGUS;
      return true;

    case State::COMMENT:
      pending_.push_back(c);
      if (c == '-')
        ++dashes_;
      else if (c == '>' && dashes_ >= 2)
        emit_markup(handler);
      else
        dashes_ = 0;
      return true;

    case State::RAW_TEXT_END:
      {
        bool match;
        if (end_match_ == 0)
          match = c == '/';
        else if (end_match_ <= raw_text_end_.size())
          match = strings::to_lower_ascii(c) == raw_text_end_[end_match_ - 1];
        else
          match = strings::is_space(c) || c == '/' || c == '>';

        if (!match)
        {
          /* not the closing tag; still raw text */
          handler.on_text(pending_);
          pending_.clear();
          state_ = State::RAW_TEXT;
          return false;
        }

        pending_.push_back(c);

        if (end_match_ <= raw_text_end_.size())
        {
          ++end_match_;
          return true;
        }

        raw_text_end_.clear();
        end_match_ = 0;
        if (c == '>')
          emit_markup(handler);
        else
          state_ = State::END_TAG;
        return true;
      }
    }

    return true;
  }

} // namespace csrfblock::html
