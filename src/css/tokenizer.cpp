#include <colorkit/css/tokenizer.h>
#include <cctype>
#include <cstdlib>

namespace colorkit::css {

// ---------------------------------------------------------------------------
// CSSToken
// ---------------------------------------------------------------------------

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value &&
           numeric_value == other.numeric_value && unit == other.unit &&
           is_integer == other.is_integer;
}

// ---------------------------------------------------------------------------
// CSSTokenizer
// ---------------------------------------------------------------------------

CSSTokenizer::CSSTokenizer(std::string_view input) : input_(input), pos_(0) {}

char CSSTokenizer::consume() {
    if (pos_ < input_.size()) {
        return input_[pos_++];
    }
    return '\0';
}

char CSSTokenizer::peek() const {
    return peek(0);
}

char CSSTokenizer::peek(size_t offset) const {
    size_t idx = pos_ + offset;
    if (idx < input_.size()) {
        return input_[idx];
    }
    return '\0';
}

bool CSSTokenizer::at_end() const {
    return pos_ >= input_.size();
}

void CSSTokenizer::reconsume() {
    if (pos_ > 0) {
        --pos_;
    }
}

void CSSTokenizer::consume_whitespace() {
    while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\n' ||
                         peek() == '\r' || peek() == '\f')) {
        consume();
    }
}

void CSSTokenizer::consume_comment() {
    // '/' and '*' already consumed; an unterminated comment runs to the end
    while (!at_end()) {
        char c = consume();
        if (c == '*' && peek() == '/') {
            consume();
            return;
        }
    }
}

bool CSSTokenizer::is_name_start_char(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           (static_cast<unsigned char>(c) >= 0x80);
}

bool CSSTokenizer::is_name_char(char c) {
    return is_name_start_char(c) || std::isdigit(static_cast<unsigned char>(c)) ||
           c == '-';
}

bool CSSTokenizer::starts_identifier() const {
    char c = peek();
    if (is_name_start_char(c)) return true;
    if (c == '-') {
        char next = peek(1);
        return is_name_start_char(next) || next == '-';
    }
    return false;
}

bool CSSTokenizer::starts_number() const {
    char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c))) return true;
    if (c == '.') {
        return std::isdigit(static_cast<unsigned char>(peek(1)));
    }
    if (c == '+' || c == '-') {
        char next = peek(1);
        if (std::isdigit(static_cast<unsigned char>(next))) return true;
        if (next == '.' && std::isdigit(static_cast<unsigned char>(peek(2))))
            return true;
    }
    return false;
}

std::string CSSTokenizer::consume_name() {
    std::string result;
    while (!at_end() && is_name_char(peek())) {
        result += consume();
    }
    return result;
}

double CSSTokenizer::consume_number_value() {
    std::string repr;

    if (peek() == '+' || peek() == '-') {
        repr += consume();
    }

    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
        repr += consume();
    }

    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        repr += consume(); // '.'
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            repr += consume();
        }
    }

    // Exponent only when digits follow, so "1em" stays a dimension
    if (peek() == 'e' || peek() == 'E') {
        char after_e = peek(1);
        bool signed_exp = (after_e == '+' || after_e == '-') &&
                          std::isdigit(static_cast<unsigned char>(peek(2)));
        if (std::isdigit(static_cast<unsigned char>(after_e)) || signed_exp) {
            repr += consume();
            if (peek() == '+' || peek() == '-') {
                repr += consume();
            }
            while (!at_end() &&
                   std::isdigit(static_cast<unsigned char>(peek()))) {
                repr += consume();
            }
        }
    }

    return std::strtod(repr.c_str(), nullptr);
}

CSSToken CSSTokenizer::consume_numeric() {
    CSSToken token;

    size_t start = pos_;
    double value = consume_number_value();
    std::string_view num_str = input_.substr(start, pos_ - start);

    bool is_int = true;
    for (char c : num_str) {
        if (c == '.' || c == 'e' || c == 'E') {
            is_int = false;
            break;
        }
    }

    token.numeric_value = value;
    token.is_integer = is_int;

    if (starts_identifier()) {
        token.type = CSSToken::Dimension;
        token.unit = consume_name();
        token.value = std::string(num_str) + token.unit;
        return token;
    }

    if (peek() == '%') {
        consume();
        token.type = CSSToken::Percentage;
        token.value = std::string(num_str) + "%";
        return token;
    }

    token.type = CSSToken::Number;
    token.value = std::string(num_str);
    return token;
}

CSSToken CSSTokenizer::consume_ident_like() {
    CSSToken token;
    token.value = consume_name();
    if (peek() == '(') {
        consume();
        token.type = CSSToken::Function;
    } else {
        token.type = CSSToken::Ident;
    }
    return token;
}

CSSToken CSSTokenizer::consume_hash() {
    // '#' has already been consumed
    CSSToken token;
    if (!at_end() && is_name_char(peek())) {
        token.type = CSSToken::Hash;
        token.value = consume_name();
    } else {
        token.type = CSSToken::Delim;
        token.value = "#";
    }
    return token;
}

CSSToken CSSTokenizer::next_token() {
    while (peek() == '/' && peek(1) == '*') {
        consume();
        consume();
        consume_comment();
    }

    if (at_end()) {
        return CSSToken{CSSToken::EndOfFile, "", 0, "", false};
    }

    char c = consume();

    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
        consume_whitespace();
        return CSSToken{CSSToken::Whitespace, " ", 0, "", false};
    }

    if (c == '#') {
        return consume_hash();
    }

    if (c == '(') {
        return CSSToken{CSSToken::LeftParen, "(", 0, "", false};
    }
    if (c == ')') {
        return CSSToken{CSSToken::RightParen, ")", 0, "", false};
    }
    if (c == ',') {
        return CSSToken{CSSToken::Comma, ",", 0, "", false};
    }

    if (c == '+' || c == '.') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        consume();
        return CSSToken{CSSToken::Delim, std::string(1, c), 0, "", false};
    }

    // Hyphen-minus: number, ident (display-p3 never starts with it, but
    // vendor idents do), or a bare delim
    if (c == '-') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        if (starts_identifier()) {
            return consume_ident_like();
        }
        consume();
        return CSSToken{CSSToken::Delim, "-", 0, "", false};
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        reconsume();
        return consume_numeric();
    }

    if (is_name_start_char(c)) {
        reconsume();
        return consume_ident_like();
    }

    // '/', '%' and everything else
    return CSSToken{CSSToken::Delim, std::string(1, c), 0, "", false};
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;

    while (true) {
        CSSToken token = tokenizer.next_token();
        tokens.push_back(token);
        if (token.type == CSSToken::EndOfFile) {
            break;
        }
    }

    return tokens;
}

} // namespace colorkit::css
