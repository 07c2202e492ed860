// render.cpp - ChangeSet rendering

#include <semdiff/render.h>
#include <semdiff/builders.h>
#include <semdiff/serialization.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace semdiff {

namespace {

namespace ansi {
constexpr std::string_view reset        = "\033[0m";
constexpr std::string_view green        = "\033[32m";
constexpr std::string_view red          = "\033[31m";
constexpr std::string_view yellow       = "\033[33m";
constexpr std::string_view dim          = "\033[2m";
constexpr std::string_view bright_green = "\033[92m";
constexpr std::string_view bright_red   = "\033[91m";
constexpr std::string_view bright_yellow = "\033[93m";
} // namespace ansi

std::string summarize_container(std::size_t count, std::string_view open, std::string_view close,
                                std::string_view noun)
{
    std::string out;
    out += open;
    if (count > 0) {
        out += ' ';
        out += std::to_string(count);
        out += ' ';
        out += noun;
        if (count != 1) out += 's';
        out += ' ';
    }
    out += close;
    return out;
}

std::string number_preview(double number)
{
    if (std::isnan(number)) return "NaN";
    if (std::isinf(number)) return number < 0 ? "-inf" : "inf";
    std::string out;
    write_json_number(out, number);
    return out;
}

/// Append text wrapped in a color, or bare when @p color is empty
void paint(std::string& out, std::string_view color, std::string_view text)
{
    if (color.empty()) {
        out += text;
        return;
    }
    out += color;
    out += text;
    out += ansi::reset;
}

void render_change_line(std::string& out, const Change& change, const OutputOptions& options,
                        bool colored)
{
    const std::string path = change.path.to_string();
    auto pick = [colored](std::string_view color) { return colored ? color : std::string_view{}; };

    switch (change.type) {
        case ChangeType::Added:
            paint(out, pick(ansi::bright_green), "+");
            out += ' ';
            paint(out, pick(ansi::green), path);
            out += ": ";
            paint(out, pick(ansi::green), value_preview(change.get_new(), options));
            break;
        case ChangeType::Removed:
            paint(out, pick(ansi::bright_red), "-");
            out += ' ';
            paint(out, pick(ansi::red), path);
            out += ": ";
            paint(out, pick(ansi::red), value_preview(change.get_old(), options));
            break;
        case ChangeType::Modified:
            paint(out, pick(ansi::bright_yellow), "~");
            out += ' ';
            paint(out, pick(ansi::yellow), path);
            out += ": ";
            paint(out, pick(ansi::yellow), value_preview(change.get_old(), options));
            out += ' ';
            paint(out, pick(ansi::bright_yellow), "->");
            out += ' ';
            paint(out, pick(ansi::yellow), value_preview(change.get_new(), options));
            break;
        case ChangeType::Unchanged:
            out += "  ";
            paint(out, pick(ansi::dim), path);
            out += ": ";
            paint(out, pick(ansi::dim), value_preview(change.get_old(), options));
            break;
    }
    out += '\n';
}

std::string render_text(const ChangeSet& changes, const OutputOptions& options, bool colored)
{
    std::string out;
    if (changes.size() == 0) {
        if (colored) {
            paint(out, ansi::dim, "No changes detected.");
        } else {
            out += "No changes detected.";
        }
        out += '\n';
        return out;
    }

    for (const auto& change : changes) {
        render_change_line(out, change, options, colored);
    }

    if (!options.quiet) {
        out += '\n';
        out += summary_line(changes.stats());
        out += '\n';
    }
    return out;
}

Value path_segments(const Path& path)
{
    ArrayBuilder segments;
    for (const auto& elem : path) {
        std::visit([&](const auto& seg) { segments.push_back(Value{seg}); }, elem);
    }
    return segments.finish();
}

std::string render_json(const ChangeSet& changes)
{
    ArrayBuilder list;
    for (const auto& change : changes) {
        list.push_back(ObjectBuilder()
            .set("path", path_segments(change.path))
            .set("pointer", change.path.to_json_pointer())
            .set("type", std::string{to_string(change.type)})
            .set_box("old_value", change.has_old() ? change.old_value : ValueBox{})
            .set_box("new_value", change.has_new() ? change.new_value : ValueBox{})
            .finish());
    }

    const auto& stats = changes.stats();
    Value document = ObjectBuilder()
        .set("changes", list.finish())
        .set("stats", ObjectBuilder()
            .set("added", stats.added)
            .set("removed", stats.removed)
            .set("modified", stats.modified)
            .set("unchanged", stats.unchanged)
            .finish())
        .finish();

    std::string out = to_json(document, false);
    out += '\n';
    return out;
}

} // anonymous namespace

OutputFormat parse_output_format(std::string_view text)
{
    if (text == "terminal") return OutputFormat::Terminal;
    if (text == "plain") return OutputFormat::Plain;
    if (text == "json") return OutputFormat::Json;
    throw std::invalid_argument("unknown output format '" + std::string{text}
                                + "' (expected terminal, plain or json)");
}

std::string_view to_string(OutputFormat format)
{
    switch (format) {
        case OutputFormat::Terminal: return "terminal";
        case OutputFormat::Plain:    return "plain";
        case OutputFormat::Json:     return "json";
    }
    return "terminal";
}

std::string truncate_preview(std::string text, std::size_t max_length)
{
    if (max_length == 0 || text.size() <= max_length) {
        return text;
    }

    std::size_t cut = max_length >= 3 ? max_length - 3 : 0;
    // Back up over UTF-8 continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    text.resize(cut);
    text += "...";
    return text;
}

std::string value_preview(const Value& val, const OutputOptions& options)
{
    std::string preview = std::visit([&](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return number_preview(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return '"' + arg + '"';
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (options.show_values) return to_json(val, true);
            return summarize_container(arg.size(), "{", "}", "key");
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (options.show_values) return to_json(val, true);
            return summarize_container(arg.size(), "[", "]", "item");
        }
    }, val.data);

    return truncate_preview(std::move(preview), options.max_value_length);
}

std::string summary_line(const DiffStats& stats)
{
    std::vector<std::string> parts;
    if (stats.added > 0) parts.push_back(std::to_string(stats.added) + " added");
    if (stats.removed > 0) parts.push_back(std::to_string(stats.removed) + " removed");
    if (stats.modified > 0) parts.push_back(std::to_string(stats.modified) + " modified");
    if (stats.unchanged > 0) parts.push_back(std::to_string(stats.unchanged) + " unchanged");

    if (parts.empty()) {
        return "Summary: No changes";
    }

    std::string out = "Summary: ";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

std::string render(const ChangeSet& changes, OutputFormat format, const OutputOptions& options)
{
    switch (format) {
        case OutputFormat::Terminal: return render_text(changes, options, true);
        case OutputFormat::Plain:    return render_text(changes, options, false);
        case OutputFormat::Json:     return render_json(changes);
    }
    return render_text(changes, options, false);
}

} // namespace semdiff
