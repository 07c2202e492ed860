// yaml_reader.cpp - yaml-cpp event handler building a Document

#include <semdiff/yaml_reader.h>
#include <semdiff/serialization.h>

#include <yaml-cpp/eventhandler.h>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/mark.h>
#include <yaml-cpp/parser.h>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <unordered_map>

namespace semdiff {

namespace {

// ============================================================
// Core schema scalar resolution
// ============================================================

enum class ScalarTag { Plain, Quoted, Str, Int, Float, Bool, Null };

ScalarTag classify_tag(const std::string& tag)
{
    if (tag.empty() || tag == "?") return ScalarTag::Plain;
    if (tag == "!") return ScalarTag::Quoted;

    constexpr std::string_view kCorePrefix = "tag:yaml.org,2002:";
    std::string_view name = tag;
    if (name.starts_with(kCorePrefix)) {
        name.remove_prefix(kCorePrefix.size());
    } else if (name.starts_with("!!")) {
        name.remove_prefix(2);
    } else {
        // Application tags carry no meaning here
        return ScalarTag::Plain;
    }

    if (name == "str") return ScalarTag::Str;
    if (name == "int") return ScalarTag::Int;
    if (name == "float") return ScalarTag::Float;
    if (name == "bool") return ScalarTag::Bool;
    if (name == "null") return ScalarTag::Null;
    return ScalarTag::Plain;
}

bool is_null_text(std::string_view text)
{
    return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

std::optional<bool> parse_bool_text(std::string_view text)
{
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;
    return std::nullopt;
}

bool is_digit(char c, int base)
{
    if (base == 8) return c >= '0' && c <= '7';
    if (base == 16) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }
    return c >= '0' && c <= '9';
}

std::size_t count_digits(std::string_view text, std::size_t pos, int base = 10)
{
    std::size_t n = 0;
    while (pos + n < text.size() && is_digit(text[pos + n], base)) ++n;
    return n;
}

double digits_value(std::string_view digits, int base)
{
    double value = 0.0;
    for (char c : digits) {
        int d = 0;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else d = c - 'A' + 10;
        value = value * base + d;
    }
    return value;
}

/// Decimal text already validated against the core schema patterns
double decimal_value(std::string_view text)
{
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);

    double value = 0.0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        // Overflow yields +-inf, underflow rounds towards zero
        value = std::strtod(std::string{text}.c_str(), nullptr);
    }
    (void)end;
    return value;
}

std::optional<double> parse_int_text(std::string_view text)
{
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'o' || text[1] == 'x')) {
        const int base = text[1] == 'o' ? 8 : 16;
        if (count_digits(text, 2, base) != text.size() - 2) return std::nullopt;
        return digits_value(text.substr(2), base);
    }

    std::size_t pos = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) ++pos;
    const std::size_t n = count_digits(text, pos);
    if (n == 0 || pos + n != text.size()) return std::nullopt;
    return decimal_value(text);
}

std::optional<double> parse_float_text(std::string_view text)
{
    std::size_t pos = 0;
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        ++pos;
    }

    const auto rest = text.substr(pos);
    if (rest == ".inf" || rest == ".Inf" || rest == ".INF") {
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    if (pos == 0 && (rest == ".nan" || rest == ".NaN" || rest == ".NAN")) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
    const std::size_t int_digits = count_digits(text, pos);
    pos += int_digits;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const std::size_t frac_digits = count_digits(text, pos);
        if (int_digits == 0 && frac_digits == 0) return std::nullopt;
        pos += frac_digits;
    } else if (int_digits == 0) {
        return std::nullopt;
    }

    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) ++pos;
        const std::size_t exp_digits = count_digits(text, pos);
        if (exp_digits == 0) return std::nullopt;
        pos += exp_digits;
    }

    if (pos != text.size()) return std::nullopt;
    return decimal_value(text);
}

// ============================================================
// DocumentBuilder - yaml-cpp events to Document nodes
// ============================================================

class DocumentBuilder : public YAML::EventHandler {
public:
    explicit DocumentBuilder(Document& doc) : doc_(doc) {}

    void OnDocumentStart(const YAML::Mark&) override {}
    void OnDocumentEnd() override {}

    void OnNull(const YAML::Mark&, YAML::anchor_t anchor) override {
        const NodeId id = doc_.add_null();
        register_anchor(anchor, id);
        emit(id, std::string{"null"});
    }

    void OnAlias(const YAML::Mark& mark, YAML::anchor_t anchor) override {
        auto it = anchors_.find(anchor);
        if (it == anchors_.end()) {
            throw YAML::ParserException(mark, "unknown anchor referenced by alias");
        }
        emit(it->second, std::nullopt);
    }

    void OnScalar(const YAML::Mark& mark, const std::string& tag,
                  YAML::anchor_t anchor, const std::string& value) override {
        const NodeId id = resolve_scalar(mark, tag, value);
        register_anchor(anchor, id);
        emit(id, value);
    }

    void OnSequenceStart(const YAML::Mark&, const std::string&,
                         YAML::anchor_t anchor, YAML::EmitterStyle::value) override {
        start_container(doc_.add_array(), anchor, false);
    }

    void OnSequenceEnd() override { end_container(); }

    void OnMapStart(const YAML::Mark&, const std::string&,
                    YAML::anchor_t anchor, YAML::EmitterStyle::value) override {
        start_container(doc_.add_object(), anchor, true);
    }

    void OnMapEnd() override { end_container(); }

private:
    struct Frame {
        NodeId id;
        bool is_map;
        bool is_key;                            // this container is itself a mapping key
        std::optional<std::string> pending_key; // map frames: key awaiting its value
    };

    NodeId resolve_scalar(const YAML::Mark& mark, const std::string& tag, const std::string& value) {
        switch (classify_tag(tag)) {
            case ScalarTag::Quoted:
            case ScalarTag::Str:
                return doc_.add_string(value);
            case ScalarTag::Null:
                return doc_.add_null();
            case ScalarTag::Bool:
                if (auto b = parse_bool_text(value)) return doc_.add_bool(*b);
                throw YAML::ParserException(mark, "invalid !!bool value '" + value + "'");
            case ScalarTag::Int:
                if (auto n = parse_int_text(value)) return doc_.add_number(*n);
                throw YAML::ParserException(mark, "invalid !!int value '" + value + "'");
            case ScalarTag::Float:
                if (auto n = parse_int_text(value)) return doc_.add_number(*n);
                if (auto n = parse_float_text(value)) return doc_.add_number(*n);
                throw YAML::ParserException(mark, "invalid !!float value '" + value + "'");
            case ScalarTag::Plain:
                break;
        }

        if (is_null_text(value)) return doc_.add_null();
        if (auto b = parse_bool_text(value)) return doc_.add_bool(*b);
        if (auto n = parse_int_text(value)) return doc_.add_number(*n);
        if (auto n = parse_float_text(value)) return doc_.add_number(*n);
        return doc_.add_string(value);
    }

    void register_anchor(YAML::anchor_t anchor, NodeId id) {
        if (anchor != YAML::NullAnchor) {
            anchors_[anchor] = id;
        }
    }

    [[nodiscard]] bool at_key_position() const {
        return !stack_.empty() && stack_.back().is_map && !stack_.back().pending_key;
    }

    /// Place a finished node: as the root, an array element, a mapping key
    /// (@p key_text, or the node's text form) or a mapping value
    void emit(NodeId id, std::optional<std::string> key_text) {
        if (stack_.empty()) {
            if (!root_set_) {
                doc_.set_root(id);
                root_set_ = true;
            }
            return;
        }

        auto& top = stack_.back();
        if (!top.is_map) {
            doc_.append(top.id, id);
        } else if (!top.pending_key) {
            top.pending_key = key_text ? std::move(*key_text) : key_string(id, 0);
        } else {
            doc_.insert(top.id, std::move(*top.pending_key), id);
            top.pending_key.reset();
        }
    }

    void start_container(NodeId id, YAML::anchor_t anchor, bool is_map) {
        // Registered before the children so a nested alias can refer back
        register_anchor(anchor, id);

        const bool is_key = at_key_position();
        if (!is_key) {
            emit(id, std::nullopt);
        }
        stack_.push_back(Frame{id, is_map, is_key, std::nullopt});
    }

    void end_container() {
        const Frame frame = std::move(stack_.back());
        stack_.pop_back();
        if (frame.is_key) {
            emit(frame.id, key_string(frame.id, 0));
        }
    }

    /// Text form of a non-scalar (or aliased) mapping key, in flow style
    std::string key_string(NodeId id, std::size_t depth) const {
        constexpr std::size_t kMaxKeyDepth = 32;
        if (depth > kMaxKeyDepth) return "...";

        const auto& node = doc_.node(id);
        std::string out;
        switch (node.kind) {
            case ValueKind::Null:   return "null";
            case ValueKind::Bool:   return node.boolean ? "true" : "false";
            case ValueKind::Number: write_json_number(out, node.number); return out;
            case ValueKind::String: return node.text;
            case ValueKind::Array:
                out += '[';
                for (std::size_t i = 0; i < node.items.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += key_string(node.items[i], depth + 1);
                }
                out += ']';
                return out;
            case ValueKind::Object:
                out += '{';
                for (std::size_t i = 0; i < node.members.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += node.members[i].first;
                    out += ": ";
                    out += key_string(node.members[i].second, depth + 1);
                }
                out += '}';
                return out;
        }
        return out;
    }

    Document& doc_;
    std::vector<Frame> stack_;
    std::unordered_map<YAML::anchor_t, NodeId> anchors_;
    bool root_set_ = false;
};

} // anonymous namespace

Document read_yaml(std::string_view text)
{
    Document doc;
    std::istringstream input{std::string{text}};

    try {
        YAML::Parser parser(input);
        DocumentBuilder builder(doc);
        parser.HandleNextDocument(builder);
    } catch (const YAML::Exception& e) {
        if (e.mark.is_null()) {
            throw ParseError("YAML: " + e.msg);
        }
        throw ParseError("YAML: " + e.msg,
                         static_cast<std::size_t>(e.mark.line) + 1,
                         static_cast<std::size_t>(e.mark.column) + 1);
    }

    return doc;
}

Value from_yaml(std::string_view text)
{
    return build_tree(read_yaml(text));
}

} // namespace semdiff
