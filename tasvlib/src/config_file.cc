#include <cctype>
#include <fstream>
#include <sstream>
#include <tasvlib/config_file.hh>
#include <tasvlib/errmsg.hh>
#include <tasvlib/macros/throw.hh>

using std::string;
using std::string_view;

void ConfigFile::load_config_from_file(const string& pathname, bool load_all) {
    std::ifstream file{pathname, std::ios::binary};
    if (!file) {
        THROW("cannot open config file '", pathname, '\'', errmsg());
    }
    std::stringstream ss;
    ss << file.rdbuf();
    load_config_from_string(ss.str(), load_all);
}

namespace {

class Parser {
    string_view text_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t line_beg_ = 0;

public:
    explicit Parser(string_view text) : text_{text} {}

    [[nodiscard]] bool eof() const noexcept { return pos_ >= text_.size(); }

    [[nodiscard]] char peek() const noexcept { return eof() ? '\n' : text_[pos_]; }

    void advance() noexcept {
        if (peek() == '\n') {
            ++line_;
            line_beg_ = pos_ + 1;
        }
        ++pos_;
    }

    template <class... Args>
    [[noreturn]] void fail(Args&&... msg) const {
        throw ConfigFile::ParseError(line_, pos_ - line_beg_ + 1, std::forward<Args>(msg)...);
    }

    void skip_blanks() noexcept {
        while (!eof() and peek() != '\n' and std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    // Skips blanks, comments and empty lines
    void skip_empty_lines() noexcept {
        for (;;) {
            skip_blanks();
            if (peek() == '#') {
                while (!eof() and peek() != '\n') {
                    advance();
                }
            }
            if (eof() or peek() != '\n') {
                return;
            }
            advance();
        }
    }

    // Consumes the rest of the line that may only consist of blanks and a comment
    void expect_line_end() {
        skip_blanks();
        if (peek() == '#') {
            while (!eof() and peek() != '\n') {
                advance();
            }
        }
        if (!eof() and peek() != '\n') {
            fail("Unexpected character: `", peek(), '`');
        }
        if (!eof()) {
            advance();
        }
    }

    string name() {
        string res;
        while (!eof()) {
            char c = peek();
            if (std::isalnum(static_cast<unsigned char>(c)) or c == '-' or c == '_' or c == '.') {
                res += c;
                advance();
            } else {
                break;
            }
        }
        if (res.empty()) {
            fail("Missing variable name");
        }
        return res;
    }

    string value(bool in_array) {
        string res;
        if (peek() == '\'') {
            advance();
            for (;;) {
                if (eof() or peek() == '\n') {
                    fail("Missing terminating ' character");
                }
                char c = peek();
                advance();
                if (c == '\'') {
                    if (peek() != '\'') {
                        return res;
                    }
                    advance();
                }
                res += c;
            }
        }

        if (peek() == '"') {
            advance();
            for (;;) {
                if (eof() or peek() == '\n') {
                    fail("Missing terminating \" character");
                }
                char c = peek();
                advance();
                if (c == '"') {
                    return res;
                }
                if (c != '\\') {
                    res += c;
                    continue;
                }
                char esc = peek();
                advance();
                switch (esc) {
                case '\'': res += '\''; break;
                case '"': res += '"'; break;
                case '\\': res += '\\'; break;
                case 't': res += '\t'; break;
                case 'n': res += '\n'; break;
                case 'r': res += '\r'; break;
                case 'x': {
                    int val = 0;
                    for (int i = 0; i < 2; ++i) {
                        char h = peek();
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            fail("Invalid hexadecimal digit: `", h, '`');
                        }
                        val = val * 16 +
                            (std::isdigit(static_cast<unsigned char>(h))
                                 ? h - '0'
                                 : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                        advance();
                    }
                    res += static_cast<char>(val);
                    break;
                }
                default: fail("Unknown escape sequence: `\\", esc, '`');
                }
            }
        }

        // Unquoted literal, trailing blanks are not part of it
        if (peek() == '[' or (in_array and (peek() == ',' or peek() == ']'))) {
            fail("Invalid beginning of the string literal: `", peek(), '`');
        }
        while (!eof() and peek() != '\n' and peek() != '#' and
               !(in_array and (peek() == ',' or peek() == ']')))
        {
            res += peek();
            advance();
        }
        while (!res.empty() and std::isspace(static_cast<unsigned char>(res.back()))) {
            res.pop_back();
        }
        return res;
    }

    std::vector<string> array() {
        std::vector<string> res;
        advance(); // '['
        skip_empty_lines();
        if (peek() == ']') {
            advance();
            return res;
        }
        for (;;) {
            skip_empty_lines();
            if (eof()) {
                fail("Missing terminating ] character");
            }
            res.emplace_back(value(true));
            skip_empty_lines();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == ']') {
                advance();
                return res;
            }
            fail("Expected `,` or `]`, found: `", peek(), '`');
        }
    }
};

} // namespace

void ConfigFile::load_config_from_string(string_view config, bool load_all) {
    for (auto& [name, var] : vars_) {
        var.value_ = std::monostate{};
    }

    Parser parser{config};
    Variable ignored;
    for (;;) {
        parser.skip_empty_lines();
        if (parser.eof()) {
            break;
        }

        string name = parser.name();
        parser.skip_blanks();
        if (parser.peek() != ':') {
            parser.fail("Expected `:` after variable name");
        }
        parser.advance();
        parser.skip_blanks();

        Variable* var = &ignored;
        auto it = vars_.find(name);
        if (it != vars_.end()) {
            var = &it->second;
        } else if (load_all) {
            var = &vars_[name];
        }
        if (parser.peek() == '[') {
            var->value_ = parser.array();
        } else {
            var->value_ = parser.value(false);
        }
        parser.expect_line_end();
    }
}
