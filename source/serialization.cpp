// serialization.cpp - JSON reader (into Document) and JSON writer (from Value)

#include <semdiff/serialization.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ostream>

namespace semdiff {

// ============================================================
// JSON Writing
// ============================================================

void write_json_string(std::string& out, std::string_view text)
{
    out.reserve(out.size() + text.size() + 2);
    out += '"';
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void write_json_number(std::string& out, double number)
{
    if (!std::isfinite(number)) {
        out += "null";
        return;
    }

    // Integral values within the exactly representable range print as integers
    constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53
    if (number == std::trunc(number) && std::fabs(number) <= kMaxExactInteger) {
        if (number == 0.0 && std::signbit(number)) {
            out += "-0";
        } else {
            out += std::to_string(static_cast<std::int64_t>(number));
        }
        return;
    }

    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), number);
    if (ec != std::errc{}) {
        out += "null";
        return;
    }
    out.append(buf, end);
}

namespace {

void to_json_impl(const Value& val, std::string& out, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const char* newline = compact ? "" : "\n";
    const char* space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            write_json_number(out, arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            write_json_string(out, arg);
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (arg.empty()) {
                out += "{}";
            } else {
                out += '{';
                out += newline;
                bool first = true;
                for (const auto& entry : arg) {
                    if (!first) {
                        out += ',';
                        out += newline;
                    }
                    first = false;
                    out += child_indent;
                    write_json_string(out, entry.key);
                    out += ':';
                    out += space_after_colon;
                    to_json_impl(*entry.value, out, compact, indent_level + 1);
                }
                out += newline;
                out += indent;
                out += '}';
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                out += "[]";
            } else {
                out += '[';
                out += newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) {
                        out += ',';
                        out += newline;
                    }
                    first = false;
                    out += child_indent;
                    to_json_impl(*v, out, compact, indent_level + 1);
                }
                out += newline;
                out += indent;
                out += ']';
            }
        }
    }, val.data);
}

// ============================================================
// JSON Reader
// ============================================================

class JsonReader {
public:
    explicit JsonReader(std::string_view json) : json_(json) {}

    Document parse() {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail("empty JSON input");
        }
        doc_.set_root(parse_value(0));

        skip_whitespace();
        if (pos_ < json_.size()) {
            fail("unexpected content after JSON value");
        }
        return std::move(doc_);
    }

private:
    // Guards the recursive descent against stack exhaustion; the tree depth
    // limit proper is enforced by build_tree()
    static constexpr std::size_t kMaxNesting = 10000;

    std::string_view json_;
    std::size_t pos_ = 0;
    Document doc_;

    [[noreturn]] void fail(const std::string& message) const {
        fail_at(message, pos_);
    }

    [[noreturn]] void fail_at(const std::string& message, std::size_t offset) const {
        std::size_t line = 1;
        std::size_t column = 1;
        for (std::size_t i = 0; i < offset && i < json_.size(); ++i) {
            if (json_[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw ParseError("JSON: " + message, line, column);
    }

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size()) {
            const char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail(std::string("expected '") + c + "' but reached end of input");
        }
        if (json_[pos_] != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    NodeId parse_value(std::size_t depth) {
        skip_whitespace();
        const char c = peek();

        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return doc_.add_string(parse_string_raw());
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();

        if (pos_ >= json_.size()) {
            fail("unexpected end of input");
        }
        fail("unexpected character '" + std::string(1, c) + "'");
    }

    void check_nesting(std::size_t depth) const {
        if (depth >= kMaxNesting) {
            fail("nesting too deep");
        }
    }

    NodeId parse_object(std::size_t depth) {
        check_nesting(depth);
        expect('{');
        const NodeId object = doc_.add_object();
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return object;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("expected string key");
            }
            std::string key = parse_string_raw();
            expect(':');
            const NodeId child = parse_value(depth + 1);
            doc_.insert(object, std::move(key), child);

            skip_whitespace();
            const char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                fail("expected ',' or '}' in object");
            }
            consume();
        }

        return object;
    }

    NodeId parse_array(std::size_t depth) {
        check_nesting(depth);
        expect('[');
        const NodeId array = doc_.add_array();
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return array;
        }

        while (true) {
            const NodeId child = parse_value(depth + 1);
            doc_.append(array, child);

            skip_whitespace();
            const char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                fail("expected ',' or ']' in array");
            }
            consume();
        }

        return array;
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            fail("invalid unicode escape");
        }
        unsigned value = 0;
        auto [end, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || end != json_.data() + pos_ + 4) {
            fail("invalid unicode escape");
        }
        pos_ += 4;
        return value;
    }

    static void append_utf8(std::string& out, std::uint32_t codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        const std::size_t start = pos_;
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            const char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("unescaped control character in string");
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                break;
            }
            const char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    std::uint32_t codepoint = parse_hex4();
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                        // High surrogate: must be followed by \uDC00-\uDFFF
                        if (json_.substr(pos_, 2) != "\\u") {
                            fail("unpaired surrogate in unicode escape");
                        }
                        pos_ += 2;
                        const std::uint32_t low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("invalid low surrogate in unicode escape");
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                        fail("unpaired surrogate in unicode escape");
                    }
                    append_utf8(result, codepoint);
                    break;
                }
                default:
                    fail("invalid escape sequence '\\" + std::string(1, escaped) + "'");
            }
        }

        fail_at("unterminated string", start);
    }

    NodeId parse_number() {
        const std::size_t start = pos_;
        auto digits = [&] {
            const std::size_t from = pos_;
            while (pos_ < json_.size() && json_[pos_] >= '0' && json_[pos_] <= '9') ++pos_;
            return pos_ - from;
        };

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
        } else if (digits() == 0) {
            fail("invalid number");
        }

        if (peek() == '.') {
            consume();
            if (digits() == 0) fail("expected digits after decimal point");
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (digits() == 0) fail("expected digits in exponent");
        }

        double value = 0.0;
        auto [end, ec] = std::from_chars(json_.data() + start, json_.data() + pos_, value);
        if (ec == std::errc::result_out_of_range) {
            // Underflow rounds towards zero; overflow has no double form
            value = std::strtod(std::string{json_.substr(start, pos_ - start)}.c_str(), nullptr);
            if (std::isinf(value)) {
                fail_at("number out of range", start);
            }
            return doc_.add_number(value);
        }
        if (ec != std::errc{} || end != json_.data() + pos_) {
            fail_at("invalid number", start);
        }
        return doc_.add_number(value);
    }

    NodeId parse_bool() {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return doc_.add_bool(true);
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return doc_.add_bool(false);
        }
        fail("expected 'true' or 'false'");
    }

    NodeId parse_null() {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return doc_.add_null();
        }
        fail("expected 'null'");
    }
};

} // anonymous namespace

Document read_json(std::string_view text)
{
    JsonReader reader(text);
    return reader.parse();
}

Value from_json(std::string_view text)
{
    return build_tree(read_json(text));
}

std::string to_json(const Value& val, bool compact)
{
    std::string out;
    to_json_impl(val, out, compact, 0);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << to_json(val, true);
}

} // namespace semdiff
