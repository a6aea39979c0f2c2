#include <livepatch/html/tokenizer.h>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <unordered_map>

namespace livepatch::html {

namespace {

bool is_space(char c) {
    return c == '\t' || c == '\n' || c == '\f' || c == ' ' || c == '\r';
}

char to_lower(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c + 32);
    return c;
}

std::string encode_utf8(unsigned long codepoint) {
    std::string result;
    if (codepoint < 0x80) {
        result += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        result += static_cast<char>(0xC0 | (codepoint >> 6));
        result += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        result += static_cast<char>(0xE0 | (codepoint >> 12));
        result += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        result += static_cast<char>(0xF0 | (codepoint >> 18));
        result += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
    return result;
}

const std::unordered_map<std::string, std::string>& named_entities() {
    static const std::unordered_map<std::string, std::string> entities = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", "\xC2\xA0"},
        {"copy", "\xC2\xA9"},
        {"reg", "\xC2\xAE"},
        {"trade", "\xE2\x84\xA2"},
        {"deg", "\xC2\xB0"},
        {"plusmn", "\xC2\xB1"},
        {"times", "\xC3\x97"},
        {"divide", "\xC3\xB7"},
        {"middot", "\xC2\xB7"},
        {"para", "\xC2\xB6"},
        {"sect", "\xC2\xA7"},
        {"cent", "\xC2\xA2"},
        {"pound", "\xC2\xA3"},
        {"yen", "\xC2\xA5"},
        {"euro", "\xE2\x82\xAC"},
        {"laquo", "\xC2\xAB"},
        {"raquo", "\xC2\xBB"},
        {"lsquo", "\xE2\x80\x98"},
        {"rsquo", "\xE2\x80\x99"},
        {"ldquo", "\xE2\x80\x9C"},
        {"rdquo", "\xE2\x80\x9D"},
        {"ndash", "\xE2\x80\x93"},
        {"mdash", "\xE2\x80\x94"},
        {"hellip", "\xE2\x80\xA6"},
        {"bull", "\xE2\x80\xA2"},
        {"larr", "\xE2\x86\x90"},
        {"rarr", "\xE2\x86\x92"},
        {"uarr", "\xE2\x86\x91"},
        {"darr", "\xE2\x86\x93"},
        {"check", "\xE2\x9C\x93"},
        {"ensp", "\xE2\x80\x82"},
        {"emsp", "\xE2\x80\x83"},
        {"thinsp", "\xE2\x80\x89"},
        {"zwnj", "\xE2\x80\x8C"},
        {"zwj", "\xE2\x80\x8D"},
    };
    return entities;
}

} // namespace

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

char Tokenizer::consume() {
    if (pos_ < input_.size()) {
        return input_[pos_++];
    }
    return '\0';
}

char Tokenizer::peek() const {
    if (pos_ < input_.size()) {
        return input_[pos_];
    }
    return '\0';
}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

void Tokenizer::reconsume() {
    if (pos_ > 0) {
        --pos_;
    }
}

bool Tokenizer::is_appropriate_end_tag() const {
    return !last_start_tag_.empty() && current_token_.name == last_start_tag_;
}

void Tokenizer::begin_token(Token::Type type, std::size_t offset) {
    current_token_ = Token{};
    current_token_.type = type;
    current_token_.offset = offset;
}

void Tokenizer::set_state(TokenizerState state) {
    state_ = state;
}

Token Tokenizer::emit_string(std::string s, std::size_t offset) {
    Token t;
    t.type = Token::Character;
    t.data = std::move(s);
    t.offset = offset;
    return t;
}

Token Tokenizer::emit_eof() {
    Token t;
    t.type = Token::EndOfFile;
    t.offset = pos_;
    return t;
}

Token Tokenizer::emit_text_run(bool decode_entities) {
    const std::size_t start = pos_;
    std::string run;
    while (!at_end() && peek() != '<') {
        char c = consume();
        if (c == '&' && decode_entities) {
            run += try_consume_entity();
        } else {
            run += c;
        }
    }
    return emit_string(std::move(run), start);
}

std::string Tokenizer::try_consume_entity() {
    const std::size_t start = pos_;

    if (at_end()) return "&";

    // Numeric character reference: &#...;
    if (peek() == '#') {
        consume();
        bool hex = false;
        if (peek() == 'x' || peek() == 'X') {
            hex = true;
            consume();
        }

        std::string digits;
        while (!at_end()) {
            const auto uc = static_cast<unsigned char>(peek());
            if (hex ? !std::isxdigit(uc) : !std::isdigit(uc)) break;
            digits += consume();
        }

        if (digits.empty()) { pos_ = start; return "&"; }

        if (!at_end() && peek() == ';') consume();

        if (digits.size() > 8) return "\xEF\xBF\xBD";
        unsigned long codepoint = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
        if (codepoint == 0 || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return "\xEF\xBF\xBD";
        }
        return encode_utf8(codepoint);
    }

    // Named character reference: &name;
    std::string name;
    while (!at_end() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == ';')) {
        char c = consume();
        name += c;
        if (c == ';') break;
    }

    const bool has_semicolon = !name.empty() && name.back() == ';';
    std::string lookup = name;
    if (has_semicolon) {
        lookup.pop_back();
    }

    const auto& entities = named_entities();
    auto it = entities.find(lookup);
    if (it != entities.end()) {
        // Without ';' only the XML five resolve, so query strings such as
        // "?a=1&copy=2" survive untouched.
        if (has_semicolon ||
            lookup == "amp" || lookup == "lt" || lookup == "gt" ||
            lookup == "quot" || lookup == "apos") {
            return it->second;
        }
    }

    pos_ = start;
    return "&";
}

Token Tokenizer::next_token() {
    while (true) {
        switch (state_) {

        // ====================================================================
        // Data state
        // ====================================================================
        case TokenizerState::Data: {
            if (at_end()) return emit_eof();
            if (peek() == '<') {
                markup_start_ = pos_;
                consume();
                state_ = TokenizerState::TagOpen;
                continue;
            }
            return emit_text_run(true);
        }

        // ====================================================================
        // Tag Open state
        // ====================================================================
        case TokenizerState::TagOpen: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_string("<", markup_start_);
            }
            char c = consume();
            if (c == '!') {
                state_ = TokenizerState::MarkupDeclarationOpen;
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::EndTagOpen;
                continue;
            }
            if (std::isalpha(static_cast<unsigned char>(c))) {
                begin_token(Token::StartTag, markup_start_);
                reconsume();
                state_ = TokenizerState::TagName;
                continue;
            }
            if (c == '?') {
                begin_token(Token::Comment, markup_start_);
                reconsume();
                state_ = TokenizerState::BogusComment;
                continue;
            }
            // "<" not followed by a tag: literal text
            state_ = TokenizerState::Data;
            reconsume();
            return emit_string("<", markup_start_);
        }

        // ====================================================================
        // End Tag Open state
        // ====================================================================
        case TokenizerState::EndTagOpen: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_string("</", markup_start_);
            }
            char c = consume();
            if (std::isalpha(static_cast<unsigned char>(c))) {
                begin_token(Token::EndTag, markup_start_);
                reconsume();
                state_ = TokenizerState::TagName;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                continue;
            }
            begin_token(Token::Comment, markup_start_);
            reconsume();
            state_ = TokenizerState::BogusComment;
            continue;
        }

        // ====================================================================
        // Tag Name state
        // ====================================================================
        case TokenizerState::TagName: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_space(c)) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            current_token_.name += to_lower(c);
            continue;
        }

        // ====================================================================
        // Before Attribute Name state
        // ====================================================================
        case TokenizerState::BeforeAttributeName: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_space(c)) {
                continue;
            }
            if (c == '/' || c == '>') {
                reconsume();
                state_ = TokenizerState::AfterAttributeName;
                continue;
            }
            current_token_.attributes.push_back(Attribute{});
            if (c == '=') {
                current_token_.attributes.back().name = "=";
            } else {
                reconsume();
            }
            state_ = TokenizerState::AttributeName;
            continue;
        }

        // ====================================================================
        // Attribute Name state
        // ====================================================================
        case TokenizerState::AttributeName: {
            if (at_end()) {
                state_ = TokenizerState::AfterAttributeName;
                continue;
            }
            char c = consume();
            if (is_space(c) || c == '/' || c == '>') {
                reconsume();
                state_ = TokenizerState::AfterAttributeName;
                continue;
            }
            if (c == '=') {
                state_ = TokenizerState::BeforeAttributeValue;
                continue;
            }
            current_token_.attributes.back().name += to_lower(c);
            continue;
        }

        // ====================================================================
        // After Attribute Name state
        // ====================================================================
        case TokenizerState::AfterAttributeName: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_space(c)) {
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '=') {
                state_ = TokenizerState::BeforeAttributeValue;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            current_token_.attributes.push_back(Attribute{});
            reconsume();
            state_ = TokenizerState::AttributeName;
            continue;
        }

        // ====================================================================
        // Before Attribute Value state
        // ====================================================================
        case TokenizerState::BeforeAttributeValue: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_space(c)) {
                continue;
            }
            if (c == '"') {
                state_ = TokenizerState::AttributeValueDoubleQuoted;
                continue;
            }
            if (c == '\'') {
                state_ = TokenizerState::AttributeValueSingleQuoted;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            reconsume();
            state_ = TokenizerState::AttributeValueUnquoted;
            continue;
        }

        // ====================================================================
        // Attribute Value (Quoted) states
        // ====================================================================
        case TokenizerState::AttributeValueDoubleQuoted:
        case TokenizerState::AttributeValueSingleQuoted: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            const char quote =
                state_ == TokenizerState::AttributeValueDoubleQuoted ? '"' : '\'';
            char c = consume();
            if (c == quote) {
                state_ = TokenizerState::AfterAttributeValueQuoted;
                continue;
            }
            if (c == '&') {
                current_token_.attributes.back().value += try_consume_entity();
                continue;
            }
            current_token_.attributes.back().value += c;
            continue;
        }

        // ====================================================================
        // Attribute Value (Unquoted) state
        // ====================================================================
        case TokenizerState::AttributeValueUnquoted: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_space(c)) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '&') {
                current_token_.attributes.back().value += try_consume_entity();
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            current_token_.attributes.back().value += c;
            continue;
        }

        // ====================================================================
        // After Attribute Value (Quoted) state
        // ====================================================================
        case TokenizerState::AfterAttributeValueQuoted: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_space(c)) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            reconsume();
            state_ = TokenizerState::BeforeAttributeName;
            continue;
        }

        // ====================================================================
        // Self-Closing Start Tag state
        // ====================================================================
        case TokenizerState::SelfClosingStartTag: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (c == '>') {
                current_token_.self_closing = true;
                state_ = TokenizerState::Data;
                return current_token_;
            }
            reconsume();
            state_ = TokenizerState::BeforeAttributeName;
            continue;
        }

        // ====================================================================
        // Bogus Comment state
        // ====================================================================
        case TokenizerState::BogusComment: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            char c = consume();
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            current_token_.data += c;
            continue;
        }

        // ====================================================================
        // Markup Declaration Open state
        // ====================================================================
        case TokenizerState::MarkupDeclarationOpen: {
            if (input_.substr(pos_, 2) == "--") {
                pos_ += 2;
                begin_token(Token::Comment, markup_start_);
                state_ = TokenizerState::CommentStart;
                continue;
            }
            if (pos_ + 6 < input_.size()) {
                std::string next7;
                for (std::size_t i = 0; i < 7; ++i) {
                    next7 += static_cast<char>(std::toupper(
                        static_cast<unsigned char>(input_[pos_ + i])));
                }
                if (next7 == "DOCTYPE") {
                    pos_ += 7;
                    begin_token(Token::DOCTYPE, markup_start_);
                    state_ = TokenizerState::DOCTYPE;
                    continue;
                }
            }
            if (input_.substr(pos_, 7) == "[CDATA[") {
                pos_ += 7;
                state_ = TokenizerState::CDATASection;
                continue;
            }
            begin_token(Token::Comment, markup_start_);
            state_ = TokenizerState::BogusComment;
            continue;
        }

        // ====================================================================
        // Comment states
        // ====================================================================
        case TokenizerState::CommentStart: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            char c = consume();
            if (c == '-') {
                state_ = TokenizerState::CommentStartDash;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            reconsume();
            state_ = TokenizerState::Comment;
            continue;
        }

        case TokenizerState::CommentStartDash: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            char c = consume();
            if (c == '-') {
                state_ = TokenizerState::CommentEnd;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            current_token_.data += '-';
            reconsume();
            state_ = TokenizerState::Comment;
            continue;
        }

        case TokenizerState::Comment: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            char c = consume();
            if (c == '-') {
                state_ = TokenizerState::CommentEndDash;
                continue;
            }
            current_token_.data += c;
            continue;
        }

        case TokenizerState::CommentEndDash: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            char c = consume();
            if (c == '-') {
                state_ = TokenizerState::CommentEnd;
                continue;
            }
            current_token_.data += '-';
            reconsume();
            state_ = TokenizerState::Comment;
            continue;
        }

        case TokenizerState::CommentEnd: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            char c = consume();
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            if (c == '!') {
                state_ = TokenizerState::CommentEndBang;
                continue;
            }
            if (c == '-') {
                current_token_.data += '-';
                continue;
            }
            current_token_.data += "--";
            reconsume();
            state_ = TokenizerState::Comment;
            continue;
        }

        case TokenizerState::CommentEndBang: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            char c = consume();
            if (c == '-') {
                current_token_.data += "--!";
                state_ = TokenizerState::CommentEndDash;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            current_token_.data += "--!";
            reconsume();
            state_ = TokenizerState::Comment;
            continue;
        }

        // ====================================================================
        // DOCTYPE state: name only, public/system identifiers are skipped
        // ====================================================================
        case TokenizerState::DOCTYPE: {
            while (!at_end() && is_space(peek())) consume();
            while (!at_end() && !is_space(peek()) && peek() != '>') {
                current_token_.name += to_lower(consume());
            }
            while (!at_end() && consume() != '>') {}
            state_ = TokenizerState::Data;
            return current_token_;
        }

        // ====================================================================
        // RAWTEXT states
        // ====================================================================
        case TokenizerState::RAWTEXT: {
            if (at_end()) return emit_eof();
            if (peek() == '<') {
                markup_start_ = pos_;
                consume();
                state_ = TokenizerState::RAWTEXTLessThanSign;
                continue;
            }
            return emit_text_run(false);
        }

        case TokenizerState::RAWTEXTLessThanSign: {
            if (!at_end() && peek() == '/') {
                consume();
                temp_buffer_.clear();
                state_ = TokenizerState::RAWTEXTEndTagOpen;
                continue;
            }
            state_ = TokenizerState::RAWTEXT;
            return emit_string("<", markup_start_);
        }

        case TokenizerState::RAWTEXTEndTagOpen: {
            if (!at_end() && std::isalpha(static_cast<unsigned char>(peek()))) {
                begin_token(Token::EndTag, markup_start_);
                state_ = TokenizerState::RAWTEXTEndTagName;
                continue;
            }
            state_ = TokenizerState::RAWTEXT;
            return emit_string("</", markup_start_);
        }

        case TokenizerState::RAWTEXTEndTagName: {
            if (at_end()) {
                state_ = TokenizerState::RAWTEXT;
                return emit_string("</" + temp_buffer_, markup_start_);
            }
            char c = consume();
            if (is_space(c) && is_appropriate_end_tag()) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/' && is_appropriate_end_tag()) {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>' && is_appropriate_end_tag()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            if (std::isalpha(static_cast<unsigned char>(c))) {
                current_token_.name += to_lower(c);
                temp_buffer_ += c;
                continue;
            }
            state_ = TokenizerState::RAWTEXT;
            reconsume();
            return emit_string("</" + temp_buffer_, markup_start_);
        }

        // ====================================================================
        // RCDATA states
        // ====================================================================
        case TokenizerState::RCDATA: {
            if (at_end()) return emit_eof();
            if (peek() == '<') {
                markup_start_ = pos_;
                consume();
                state_ = TokenizerState::RCDATALessThanSign;
                continue;
            }
            return emit_text_run(true);
        }

        case TokenizerState::RCDATALessThanSign: {
            if (!at_end() && peek() == '/') {
                consume();
                temp_buffer_.clear();
                state_ = TokenizerState::RCDATAEndTagOpen;
                continue;
            }
            state_ = TokenizerState::RCDATA;
            return emit_string("<", markup_start_);
        }

        case TokenizerState::RCDATAEndTagOpen: {
            if (!at_end() && std::isalpha(static_cast<unsigned char>(peek()))) {
                begin_token(Token::EndTag, markup_start_);
                state_ = TokenizerState::RCDATAEndTagName;
                continue;
            }
            state_ = TokenizerState::RCDATA;
            return emit_string("</", markup_start_);
        }

        case TokenizerState::RCDATAEndTagName: {
            if (at_end()) {
                state_ = TokenizerState::RCDATA;
                return emit_string("</" + temp_buffer_, markup_start_);
            }
            char c = consume();
            if (is_space(c) && is_appropriate_end_tag()) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/' && is_appropriate_end_tag()) {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>' && is_appropriate_end_tag()) {
                state_ = TokenizerState::Data;
                return current_token_;
            }
            if (std::isalpha(static_cast<unsigned char>(c))) {
                current_token_.name += to_lower(c);
                temp_buffer_ += c;
                continue;
            }
            state_ = TokenizerState::RCDATA;
            reconsume();
            return emit_string("</" + temp_buffer_, markup_start_);
        }

        // ====================================================================
        // CDATA Section state: contents become character data
        // ====================================================================
        case TokenizerState::CDATASection: {
            const std::size_t start = pos_;
            const std::size_t end = input_.find("]]>", pos_);
            state_ = TokenizerState::Data;
            if (end == std::string_view::npos) {
                pos_ = input_.size();
                return emit_string(std::string(input_.substr(start)), start);
            }
            pos_ = end + 3;
            return emit_string(std::string(input_.substr(start, end - start)), start);
        }

        } // end switch
    } // end while
}

std::optional<std::size_t> find_invalid_utf8(std::string_view input) {
    std::size_t i = 0;
    while (i < input.size()) {
        const auto b = static_cast<unsigned char>(input[i]);
        if (b == 0) return i;
        if (b < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        std::uint32_t codepoint = 0;
        if ((b & 0xE0) == 0xC0) {
            length = 2;
            codepoint = b & 0x1F;
        } else if ((b & 0xF0) == 0xE0) {
            length = 3;
            codepoint = b & 0x0F;
        } else if ((b & 0xF8) == 0xF0) {
            length = 4;
            codepoint = b & 0x07;
        } else {
            return i;
        }
        if (i + length > input.size()) return i;

        for (std::size_t k = 1; k < length; ++k) {
            const auto cb = static_cast<unsigned char>(input[i + k]);
            if ((cb & 0xC0) != 0x80) return i;
            codepoint = (codepoint << 6) | (cb & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if ((length == 2 && codepoint < 0x80) ||
            (length == 3 && codepoint < 0x800) ||
            (length == 4 && codepoint < 0x10000) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF) ||
            codepoint > 0x10FFFF) {
            return i;
        }
        i += length;
    }
    return std::nullopt;
}

} // namespace livepatch::html
