// document_io.cpp - file/stdin loading and reader selection

#include <semdiff/document_io.h>
#include <semdiff/serialization.h>
#include <semdiff/yaml_reader.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace semdiff {

namespace {

std::string lower_ascii(std::string_view text)
{
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string read_stream(std::istream& in, std::string_view origin)
{
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw ParseError("cannot read " + std::string{origin});
    }
    return buffer.str();
}

std::string read_file(const std::string& path)
{
    // Directories open as empty streams; pipes such as /dev/fd/N stay readable
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw ParseError("'" + path + "' is a directory");
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw ParseError("cannot open file '" + path + "'");
    }
    return read_stream(file, "file '" + path + "'");
}

} // anonymous namespace

FormatHint parse_format_hint(std::string_view text)
{
    if (text == "auto") return FormatHint::Auto;
    if (text == "json") return FormatHint::Json;
    if (text == "yaml" || text == "yml") return FormatHint::Yaml;
    throw std::invalid_argument("unknown input format '" + std::string{text}
                                + "' (expected auto, json or yaml)");
}

std::string_view to_string(FormatHint hint)
{
    switch (hint) {
        case FormatHint::Auto: return "auto";
        case FormatHint::Json: return "json";
        case FormatHint::Yaml: return "yaml";
    }
    return "auto";
}

FormatHint format_from_extension(std::string_view source)
{
    const auto dot = source.rfind('.');
    const auto slash = source.find_last_of("/\\");
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return FormatHint::Auto;
    }

    const std::string ext = lower_ascii(source.substr(dot + 1));
    if (ext == "json") return FormatHint::Json;
    if (ext == "yaml" || ext == "yml") return FormatHint::Yaml;
    return FormatHint::Auto;
}

Document parse_document(std::string_view text, FormatHint hint, std::string_view origin)
{
    const std::string prefix = std::string{origin} + ": ";
    if (hint != FormatHint::Auto) {
        try {
            return hint == FormatHint::Json ? read_json(text) : read_yaml(text);
        } catch (const ParseError& e) {
            throw ParseError(prefix + e.what());
        }
    }

    // JSON is a near subset of YAML; try the strict reader first
    std::string json_error;
    try {
        return read_json(text);
    } catch (const ParseError& e) {
        json_error = e.what();
    }
    try {
        return read_yaml(text);
    } catch (const ParseError& e) {
        throw ParseError(prefix + "unable to detect format (" + json_error + "; " + e.what() + ")");
    }
}

Document load_document(const std::string& source, FormatHint hint, std::istream& input)
{
    if (source == "-") {
        return parse_document(read_stream(input, "standard input"), hint, "<stdin>");
    }

    if (hint == FormatHint::Auto) {
        hint = format_from_extension(source);
    }
    return parse_document(read_file(source), hint, source);
}

Document load_document(const std::string& source, FormatHint hint)
{
    return load_document(source, hint, std::cin);
}

Value load_value(const std::string& source, FormatHint hint, const TreeBuildOptions& options)
{
    return build_tree(load_document(source, hint), options);
}

Value load_value(const std::string& source, FormatHint hint, const TreeBuildOptions& options,
                 std::istream& input)
{
    return build_tree(load_document(source, hint, input), options);
}

} // namespace semdiff
