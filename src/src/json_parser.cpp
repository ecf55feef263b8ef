#include <cf/json.h>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <vector>

namespace cf {

namespace {
    struct JsonParseError : public std::runtime_error {
        size_t line, col;
        JsonParseError(const std::string& msg, size_t l, size_t c)
            : std::runtime_error(msg), line(l), col(c) {}
    };

    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener { char ch; size_t line, col; };
        std::vector<Opener> opener_stack;

        Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') { ++line; col = 1; }
            else ++col;
            return c;
        }

        void pop_opener() {
            if (opener_stack.empty()) return;
            opener_stack.pop_back();
        }

        [[noreturn]] void fail(const std::string& base) const {
            throw JsonParseError(format_error(base, line, col), line, col);
        }

        std::string format_error(const std::string& base, size_t err_line, size_t err_col) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < err_line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(pos, line_end - pos);
            // caret position counts bytes
            size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();
            std::string caret(caret_pos, ' ');
            caret.push_back('^');

            std::ostringstream ss;
            ss << base << " (line " << err_line << ", column " << err_col << ")" << "\n";
            ss << line_text << "\n" << caret;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) { get(); continue; }

                // line comment //...
                if (c == '/' and i + 1 < s.size() and s[i+1] == '/') {
                    get(); get();
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }

                // block comment /* ... */
                if (c == '/' and i + 1 < s.size() and s[i+1] == '*') {
                    get(); get();
                    bool closed = false;
                    while (i < s.size()) {
                        char a = get();
                        if (a == '*' and peek() == '/') { get(); closed = true; break; }
                    }
                    if (not closed) throw JsonParseError("unterminated block comment", line, col);
                    continue;
                }

                break;
            }
        }

        Value parse_value() {
            skip_ws();
            char c = peek();
            if (c == 'n') return parse_null();
            if (c == 't' or c == 'f') return parse_bool();
            if (c == '"') return parse_string();
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            // friendlier messages for Python-style literals and unquoted words
            if (std::isalpha(static_cast<unsigned char>(c))) {
                size_t j = i;
                while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_' or s[j] == '-')) ++j;
                std::string token = s.substr(i, j - i);
                if (token == "True" or token == "False") {
                    std::string sug = (token == "True") ? "true" : "false";
                    fail("unexpected token while parsing value; did you mean '" + sug + "' (lowercase)?");
                }
                if (token == "None") fail("unexpected token while parsing value; did you mean 'null'?");
                if (token == "NaN" or token == "Infinity") fail("'" + token + "' is not valid JSON");
                fail("unexpected token while parsing value; unquoted string '" + token + "'?");
            }
            if (c == '\0') fail("unexpected end of input while parsing value");
            fail("unexpected token while parsing value");
        }

        Value parse_null() {
            if (s.compare(i, 4, "null") == 0) { i += 4; col += 4; return Value(); }
            fail("invalid literal");
        }

        Value parse_bool() {
            if (s.compare(i, 4, "true") == 0) { i += 4; col += 4; return Value(true); }
            if (s.compare(i, 5, "false") == 0) { i += 5; col += 5; return Value(false); }
            fail("invalid literal");
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        // encode a Unicode code point as UTF-8 into out
        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                char h = get();
                if (h == '\0') throw JsonParseError("unterminated unicode escape", line, col);
                int hv = hex_val(h);
                if (hv < 0) throw JsonParseError(format_error("invalid unicode escape", line, col), line, col);
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_raw_string() {
            if (get() != '"') fail("expected '\"'");
            std::string out;
            while (true) {
                char c = get();
                if (c == '\0') fail("unexpected end in string");
                if (c == '"') break;
                if (c == '\n') fail("newline inside string; is there a missing closing quote?");
                if (c == '\\') {
                    char e = get();
                    if (e == '\0') fail("unexpected end in string escape");
                    switch (e) {
                        case '"': out.push_back('"'); break;
                        case '\\': out.push_back('\\'); break;
                        case '/': out.push_back('/'); break;
                        case 'b': out.push_back('\b'); break;
                        case 'f': out.push_back('\f'); break;
                        case 'n': out.push_back('\n'); break;
                        case 'r': out.push_back('\r'); break;
                        case 't': out.push_back('\t'); break;
                        case 'u': {
                            uint32_t cp = parse_hex4();
                            // surrogate pair
                            if (cp >= 0xD800 and cp <= 0xDBFF) {
                                if (get() != '\\' or get() != 'u') fail("unpaired surrogate in unicode escape");
                                uint32_t low = parse_hex4();
                                if (low < 0xDC00 or low > 0xDFFF) fail("invalid low surrogate in unicode escape");
                                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                            }
                            encode_utf8(cp, out);
                            break;
                        }
                        default:
                            fail(std::string("unsupported escape sequence '\\") + e + "'");
                    }
                } else {
                    out.push_back(c);
                }
            }
            return out;
        }

        Value parse_string() { return Value(parse_raw_string()); }

        Value parse_number() {
            size_t start = i;
            if (peek() == '-') { get(); }
            if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            if (peek() == '0' and i + 1 < s.size() and std::isdigit(static_cast<unsigned char>(s[i+1])))
                fail("invalid number; leading zeros are not allowed");
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            bool is_float = false;
            if (peek() == '.') {
                is_float = true; get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_float = true; get();
                if (peek() == '+' or peek() == '-') get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string token = s.substr(start, i - start);
            if (not is_float) {
                errno = 0;
                char* end = nullptr;
                long long v = std::strtoll(token.c_str(), &end, 10);
                if (errno != ERANGE) return Value(static_cast<int64_t>(v));
            }
            return Value(std::strtod(token.c_str(), nullptr));
        }

        Value parse_array() {
            opener_stack.push_back(Opener{'[', line, col});
            if (get() != '[') fail("expected '['");
            std::vector<Value> out_values;
            skip_ws();
            if (peek() == ']') { get(); pop_opener(); return Value(std::move(out_values)); }
            while (true) {
                out_values.push_back(parse_value());
                skip_ws();
                char c = peek();
                if (c == ']') { get(); pop_opener(); break; }
                if (c == ',') {
                    get(); skip_ws();
                    if (peek() == ']') fail("trailing ',' before ']'");
                    continue;
                }
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                if (c == '\0') fail("unexpected end of input; expected ',' or ']'");
                fail("expected ',' or ']'");
            }
            return Value(std::move(out_values));
        }

        Value parse_object() {
            opener_stack.push_back(Opener{'{', line, col});
            if (get() != '{') fail("expected '{'");
            Value d = Value::object();
            skip_ws();
            if (peek() == '}') { get(); pop_opener(); return d; }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                    std::string base = "expected string key";
                    if (j > i) base += "; are you missing quotes around '" + s.substr(i, j - i) + "'?";
                    fail(base);
                }
                std::string key = parse_raw_string();
                skip_ws();
                if (get() != ':') fail("expected ':' after object key");
                skip_ws();
                d.set(key, parse_value());
                skip_ws();
                char c = peek();
                if (c == '}') { get(); pop_opener(); break; }
                if (c == ',') {
                    get(); skip_ws();
                    if (peek() == '}') fail("trailing ',' before '}'");
                    continue;
                }
                if (c == '"') fail("expected ',' or '}'; is there a missing ',' between members?");
                if (c == '\0') fail("unexpected end of input; expected ',' or '}'");
                fail("expected ',' or '}'");
            }
            return d;
        }
    };
}

Value parse_json(const std::string& text) {
    Parser p(text);
    Value val = p.parse_value();
    p.skip_ws();
    if (p.peek() != '\0') p.fail("extra data after JSON value");
    return val;
}

} // namespace cf
