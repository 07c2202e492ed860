// cli.cpp - Option parsing and the compare/filter/render pipeline

#include "cli.h"

#include <semdiff/document_io.h>
#include <semdiff/path_filter.h>
#include <semdiff/render.h>
#include <semdiff/value_diff.h>

#include <boost/program_options.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#ifndef SEMDIFF_VERSION
#define SEMDIFF_VERSION "0.1.0"
#endif

namespace po = boost::program_options;

namespace semdiff::cli {

namespace {

struct CliOptions {
    std::string old_file;
    std::string new_file;
    std::string format = "terminal";
    std::string array_strategy = "positional";
    std::string input_format = "auto";
    std::vector<std::string> ignore;
    std::vector<std::string> only;
    // Signed so that a negative argument is rejected instead of wrapping
    long long max_value_length = 80;
    long long max_depth = SEMDIFF_DEFAULT_MAX_DEPTH;
    bool compact = true;
    bool show_values = false;
    bool null_as_missing = false;
    bool ignore_whitespace = false;
    bool verbose = false;
    bool quiet = false;
};

po::options_description make_options(CliOptions& opts)
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this help and exit")
        ("version", "print the version and exit")
        ("format,f", po::value(&opts.format)->default_value(opts.format),
            "output format: terminal, plain or json")
        ("compact", po::value(&opts.compact)->default_value(true)->implicit_value(true),
            "hide unchanged values (false to list them)")
        ("show-values", po::bool_switch(&opts.show_values),
            "print containers as JSON instead of summaries")
        ("max-value-length", po::value(&opts.max_value_length)->default_value(opts.max_value_length),
            "longest value preview, 0 for unlimited")
        ("null-as-missing", po::bool_switch(&opts.null_as_missing),
            "treat null object members as absent")
        ("ignore-whitespace", po::bool_switch(&opts.ignore_whitespace),
            "collapse whitespace in strings before comparing")
        ("array-strategy", po::value(&opts.array_strategy)->default_value(opts.array_strategy),
            "array alignment: positional or lcs")
        ("ignore", po::value(&opts.ignore)->composing(),
            "skip changes whose path matches PATTERN (repeatable)")
        ("only", po::value(&opts.only)->composing(),
            "keep only changes whose path matches PATTERN (repeatable)")
        ("input-format", po::value(&opts.input_format)->default_value(opts.input_format),
            "input format: auto, json or yaml")
        ("max-depth", po::value(&opts.max_depth)->default_value(opts.max_depth),
            "deepest nesting accepted in a document")
        ("verbose,v", po::bool_switch(&opts.verbose), "report progress on stderr")
        ("quiet,q", po::bool_switch(&opts.quiet), "omit the summary line");
    return desc;
}

void print_usage(std::ostream& os, const po::options_description& desc)
{
    os << "Usage: semdiff [options] FILE1 FILE2\n"
       << "Compare two JSON or YAML documents. Use - to read one of them from stdin.\n\n"
       << desc << "\n";
}

void require_non_negative(long long value, const char* option)
{
    if (value < 0) {
        throw po::validation_error(po::validation_error::invalid_option_value,
                                   option, std::to_string(value));
    }
}

int compare(const CliOptions& opts, std::istream& in, std::ostream& out, std::ostream& err)
{
    require_non_negative(opts.max_value_length, "max-value-length");
    require_non_negative(opts.max_depth, "max-depth");

    const FormatHint hint = parse_format_hint(opts.input_format);
    const OutputFormat format = parse_output_format(opts.format);

    DiffConfig diff_config;
    diff_config.compact = opts.compact;
    diff_config.null_as_missing = opts.null_as_missing;
    diff_config.ignore_whitespace = opts.ignore_whitespace;
    diff_config.array_strategy = parse_array_strategy(opts.array_strategy);

    FilterConfig filter;
    for (const auto& pattern : opts.ignore) filter.ignore(pattern);
    for (const auto& pattern : opts.only) filter.only(pattern);

    TreeBuildOptions build_options;
    build_options.max_depth = static_cast<std::size_t>(opts.max_depth);

    if (opts.verbose) err << "Loading " << opts.old_file << "\n";
    const Value old_tree = load_value(opts.old_file, hint, build_options, in);

    if (opts.verbose) err << "Loading " << opts.new_file << "\n";
    const Value new_tree = load_value(opts.new_file, hint, build_options, in);

    if (opts.verbose) {
        err << "Comparing (arrays: " << to_string(diff_config.array_strategy) << ")\n";
    }
    ChangeSet changes = compute_diff(old_tree, new_tree, diff_config);

    if (filter.has_filters()) {
        const auto before = changes.size();
        changes = filter_changes(changes, filter);
        if (opts.verbose) {
            err << "Filtered " << (before - changes.size()) << " of " << before << " entries\n";
        }
    }

    OutputOptions output;
    output.max_value_length = static_cast<std::size_t>(opts.max_value_length);
    output.show_values = opts.show_values;
    output.quiet = opts.quiet;
    out << render(changes, format, output);

    return changes.is_empty() ? kExitSame : kExitDifferent;
}

} // anonymous namespace

int run(int argc, const char* const argv[], std::istream& in, std::ostream& out, std::ostream& err)
{
    CliOptions opts;
    auto desc = make_options(opts);

    po::options_description hidden;
    hidden.add_options()
        ("old-file", po::value(&opts.old_file))
        ("new-file", po::value(&opts.new_file));

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("old-file", 1).add("new-file", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);

        if (vm.count("help")) {
            print_usage(out, desc);
            return kExitSame;
        }
        if (vm.count("version")) {
            out << "semdiff " << SEMDIFF_VERSION << "\n";
            return kExitSame;
        }

        po::notify(vm);

        if (opts.old_file.empty() || opts.new_file.empty()) {
            err << "Error: two files are required\n\n";
            print_usage(err, desc);
            return kExitError;
        }
        if (opts.old_file == "-" && opts.new_file == "-") {
            err << "Error: only one input can be read from stdin\n";
            return kExitError;
        }

        return compare(opts, in, out, err);
    } catch (const po::error& e) {
        err << "Error: " << e.what() << " (see --help)\n";
        return kExitError;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return kExitError;
    }
}

} // namespace semdiff::cli
