#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace livepatch::html {

struct Attribute {
    std::string name;
    std::string value;
};

struct Token {
    enum Type { DOCTYPE, StartTag, EndTag, Character, Comment, EndOfFile };
    Type type = EndOfFile;
    std::string name;
    std::vector<Attribute> attributes;
    bool self_closing = false;
    std::string data;  // Character run or comment body
    std::size_t offset = 0;  // Byte offset where the token started
};

enum class TokenizerState {
    Data, TagOpen, EndTagOpen, TagName,
    BeforeAttributeName, AttributeName, AfterAttributeName,
    BeforeAttributeValue, AttributeValueDoubleQuoted, AttributeValueSingleQuoted,
    AttributeValueUnquoted, AfterAttributeValueQuoted,
    SelfClosingStartTag, BogusComment,
    MarkupDeclarationOpen, CommentStart, CommentStartDash, Comment,
    CommentEndDash, CommentEnd, CommentEndBang,
    DOCTYPE,
    RAWTEXT, RAWTEXTLessThanSign, RAWTEXTEndTagOpen, RAWTEXTEndTagName,
    RCDATA, RCDATALessThanSign, RCDATAEndTagOpen, RCDATAEndTagName,
    CDATASection
};

// Permissive HTML tokenizer. Never fails: malformed markup degrades to
// character data or bogus comments. Consecutive characters in the data,
// RAWTEXT and RCDATA states are emitted as one Character token.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next_token();
    void set_state(TokenizerState state);
    TokenizerState state() const { return state_; }
    void set_last_start_tag(const std::string& tag) { last_start_tag_ = tag; }

    std::size_t position() const { return pos_; }

private:
    std::string_view input_;
    std::size_t pos_ = 0;
    TokenizerState state_ = TokenizerState::Data;
    std::string last_start_tag_;
    std::size_t markup_start_ = 0;
    Token current_token_;
    std::string temp_buffer_;

    char consume();
    char peek() const;
    bool at_end() const;
    void reconsume();
    bool is_appropriate_end_tag() const;
    void begin_token(Token::Type type, std::size_t offset);

    Token emit_string(std::string s, std::size_t offset);
    Token emit_eof();

    // Reads a run of text up to the next '<'; decodes references when
    // `decode_entities` is set.
    Token emit_text_run(bool decode_entities);

    // Called after '&'. Returns the decoded text, or "&" when the reference
    // is not recognised.
    std::string try_consume_entity();
};

// Offset of the first byte that is not part of well-formed UTF-8 (or is
// NUL), if any.
std::optional<std::size_t> find_invalid_utf8(std::string_view input);

} // namespace livepatch::html
