/**
 *
 *  @file tokenizer.hpp
 *
 *  CsrfBlock
 */
#ifndef CSRFBLOCK_HTML_TOKENIZER_HPP
#define CSRFBLOCK_HTML_TOKENIZER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csrfblock::html
{
  struct Attribute
  {
    std::string name; // lowercase
    std::string value; // character references decoded
  };

  /**
   * @brief A complete start tag: lowercase name plus attributes in source order.
   */
  struct StartTag
  {
    std::string name;
    std::vector<Attribute> attributes;
    bool self_closing{false};

    /** @brief Case-insensitive tag name test. */
    bool is(std::string_view tag_name) const noexcept;

    /** @brief First attribute with that name (case-insensitive), or nullptr. */
    const Attribute *find(std::string_view attr_name) const noexcept;

    std::optional<std::string> attribute(std::string_view attr_name) const;
  };

  /**
   * @brief Receives the tokenizer output. Raw text is always the exact source bytes.
   */
  class TokenHandler
  {
  public:
    virtual ~TokenHandler() = default;

    /**
     * Character data and every markup that is not a start tag (end tags,
     * comments, declarations, processing instructions, unterminated
     * markup at end of input).
     */
    virtual void on_text(std::string_view raw) = 0;

    virtual void on_start_tag(const StartTag &tag, std::string_view raw) = 0;
  };

  /**
   * @brief Permissive, incremental HTML tag scanner.
   *
   * Input may be split anywhere. The only state kept between feed() calls is
   * the markup currently being read; text is reported as soon as it is seen.
   * The contents of script and style elements are never scanned for tags.
   */
  class Tokenizer
  {
  public:
    void feed(std::string_view chunk, TokenHandler &handler);

    /**
     * @brief End of input: buffered partial markup is reported as text.
     *
     * The tokenizer is reset and may be reused afterwards.
     */
    void finish(TokenHandler &handler);

    /** @brief Number of bytes held back waiting for more input. */
    std::size_t pending() const noexcept { return pending_.size(); }

  private:
    enum class State
    {
      TEXT,

      /** inside a script/style element; only "</name" ends it */
      RAW_TEXT,

      /** found '<' inside RAW_TEXT */
      RAW_TEXT_END,

      /** found '<' */
      TAG_OPEN,

      TAG_NAME,
      BEFORE_ATTR_NAME,
      ATTR_NAME,
      AFTER_ATTR_NAME,
      BEFORE_ATTR_VALUE,
      ATTR_VALUE_QUOTED,

      /** compatibility with older and broken HTML */
      ATTR_VALUE_UNQUOTED,

      /** found a slash inside a start tag */
      SELF_CLOSING,

      END_TAG,

      /** "<!" */
      MARKUP_DECLARATION,

      /** "<!-" */
      MARKUP_DECLARATION_DASH,

      COMMENT,

      /** declarations and processing instructions, up to '>' */
      BOGUS,
    };

    /**
     * @return false if @p c was not consumed and must be looked at again
     * in the new state
     */
    bool step(char c, TokenHandler &handler);

    void push_attribute();
    void finish_start_tag(TokenHandler &handler);
    void emit_markup(TokenHandler &handler);

    State state_{State::TEXT};
    std::string pending_{};

    StartTag tag_{};
    std::string attr_name_{};
    std::string attr_value_{};
    char quote_{'"'};

    /** consecutive '-' seen inside a comment */
    unsigned dashes_{0};

    /** element whose end tag closes RAW_TEXT */
    std::string raw_text_end_{};

    /** characters of "/name" matched in RAW_TEXT_END */
    std::size_t end_match_{0};
  };

  /**
   * @brief Decode the common named references and numeric references.
   *
   * Unknown or malformed references are kept literally.
   */
  std::string decode_entities(std::string_view in);

} // namespace csrfblock::html

#endif // CSRFBLOCK_HTML_TOKENIZER_HPP
