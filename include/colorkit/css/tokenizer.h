#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace colorkit::css {

// Tokens of the CSS syntax subset that color values use.
struct CSSToken {
    enum Type {
        Ident, Function, Hash, Number, Percentage, Dimension,
        Whitespace, Comma, LeftParen, RightParen, Delim, EndOfFile
    };
    Type type;
    std::string value;
    double numeric_value = 0;
    std::string unit;
    bool is_integer = false;  // for numeric tokens

    bool operator==(const CSSToken& other) const;
};

class CSSTokenizer {
public:
    explicit CSSTokenizer(std::string_view input);
    CSSToken next_token();

    // Tokenize all at once; the last token is always EndOfFile.
    static std::vector<CSSToken> tokenize_all(std::string_view input);

private:
    std::string_view input_;
    size_t pos_ = 0;

    char consume();
    char peek() const;
    char peek(size_t offset) const;
    bool at_end() const;
    void reconsume();

    void consume_whitespace();
    void consume_comment();
    CSSToken consume_numeric();
    CSSToken consume_ident_like();
    CSSToken consume_hash();
    double consume_number_value();
    std::string consume_name();
    bool starts_identifier() const;
    bool starts_number() const;
    static bool is_name_start_char(char c);
    static bool is_name_char(char c);
};

} // namespace colorkit::css
