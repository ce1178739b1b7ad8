/// @file src/main.cpp
/// @brief fdx CLI entry point.
///
/// Usage:
///   fdx --extract <file>                  Analyse one text document
///   fdx --stdin                           Analyse a document read from stdin
///   fdx --compare <reference> <proposal> [--in <CODE>]
///                                         Compare a terms of reference with
///                                         a commercial proposal, optionally
///                                         shown in one currency
///   fdx --help                            Print usage
///
/// `--verbose` may be given anywhere to print per-stage diagnostics to stderr.

#include "fdx/document_loader.hpp"
#include "fdx/engine.hpp"

#include <fmt/core.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  fdx --extract <file>                  Analyse a UTF-8 text document\n"
        "  fdx --stdin                           Analyse a document read from stdin\n"
        "  fdx --compare <reference> <proposal>  Compare a terms-of-reference budget\n"
        "                                        with a proposal budget\n"
        "        [--in <CODE>]                   Also show both budgets in CODE (e.g. RUB)\n"
        "  fdx --help                            Show this help\n"
        "\n"
        "Options:\n"
        "  --verbose                             Per-stage diagnostics on stderr\n"
    );
}

/// Analyse already-loaded content and print the report.
/// Returns 0 on success, 1 on error.
int run_analysis(const fdx::Engine& engine, const std::string& content,
                 const std::string& source) {
    if (const auto err = engine.validate_input(content)) {
        fmt::print(stderr, "Error: {}: {}\n", source, err->message);
        return 1;
    }
    const auto analysis = engine.analyze(content);
    if (!analysis) {
        fmt::print(stderr, "Error: {}: extraction failed\n", source);
        return 1;
    }
    fmt::print("{}", analysis->to_string());
    return 0;
}

int run_extract(const fdx::Engine& engine, const std::string& filepath) {
    const auto content = fdx::DocumentLoader::load_text(filepath);
    if (!content) {
        fmt::print(stderr, "Error: cannot read file '{}'\n", filepath);
        return 1;
    }
    return run_analysis(engine, *content, filepath);
}

int run_stdin(const fdx::Engine& engine) {
    const auto content = fdx::DocumentLoader::read_stream(std::cin);
    if (!content) {
        fmt::print(stderr, "Error: cannot read stdin\n");
        return 1;
    }
    return run_analysis(engine, *content, "<stdin>");
}

/// Load and extract one side of a comparison. Prints its own errors.
std::optional<fdx::ExtractedFinancials>
extract_file(const fdx::Engine& engine, const std::string& filepath, fdx::DocumentKind kind) {
    const auto content = fdx::DocumentLoader::load_text(filepath);
    if (!content) {
        fmt::print(stderr, "Error: cannot read file '{}'\n", filepath);
        return std::nullopt;
    }
    if (const auto err = engine.validate_input(*content)) {
        fmt::print(stderr, "Error: {}: {}\n", filepath, err->message);
        return std::nullopt;
    }
    return engine.extract(*content, kind);
}

int run_compare(const fdx::Engine& engine,
                const std::string& reference_path,
                const std::string& proposal_path,
                std::optional<fdx::CurrencyCode> display) {
    const auto reference = extract_file(engine, reference_path,
                                        fdx::DocumentKind::TermsOfReference);
    const auto proposal  = extract_file(engine, proposal_path, fdx::DocumentKind::Proposal);
    if (!reference || !proposal) {
        return 1;
    }

    const auto ref_budget  = reference->budget();
    const auto prop_budget = proposal->budget();
    fmt::print("Reference budget: {}\n",
               ref_budget ? fdx::stats::format_amount(ref_budget->amount, ref_budget->code)
                          : std::string("not found"));
    fmt::print("Proposal budget:  {}\n",
               prop_budget ? fdx::stats::format_amount(prop_budget->amount, prop_budget->code)
                           : std::string("not found"));

    const auto cmp = fdx::stats::compare_budgets(ref_budget, prop_budget);
    fmt::print("{}\n", cmp.to_string());

    if (display && cmp.comparable) {
        const auto in_display = [&](const fdx::CurrencyMention& m) {
            return fdx::stats::format_amount(
                fdx::stats::convert(m.amount, m.code, *display), *display);
        };
        fmt::print("In {}: reference {}, proposal {}\n", fdx::to_string(*display),
                   in_display(*ref_budget), in_display(*prop_budget));
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    fdx::EngineConfig config;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& mode = args[0];

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const fdx::Engine engine(config);

    if (mode == "--extract") {
        if (args.size() < 2) {
            fmt::print(stderr, "Error: --extract requires a file path\n");
            print_usage();
            return 1;
        }
        return run_extract(engine, args[1]);
    }

    if (mode == "--stdin") {
        return run_stdin(engine);
    }

    if (mode == "--compare") {
        if (args.size() < 3) {
            fmt::print(stderr, "Error: --compare requires two file paths\n");
            print_usage();
            return 1;
        }
        std::optional<fdx::CurrencyCode> display;
        if (args.size() >= 5 && args[3] == "--in") {
            display = fdx::parse_currency_code(args[4]);
            if (!display) {
                fmt::print(stderr, "Error: unknown currency code '{}'\n", args[4]);
                return 1;
            }
        } else if (args.size() > 3) {
            fmt::print(stderr, "Error: unexpected argument '{}'\n", args[3]);
            print_usage();
            return 1;
        }
        return run_compare(engine, args[1], args[2], display);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
