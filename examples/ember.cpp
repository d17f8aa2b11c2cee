#include <ember/diagnostics.hpp>
#include <ember/lexer.hpp>
#include <ember/parser.hpp>
#include <ember/printer.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace {

// sysexits.h values
constexpr int kExitUsage = 64;
constexpr int kExitDataErr = 65;
constexpr int kExitNoInput = 66;

struct Options {
    bool dump_tokens = false;
    bool help = false;
    std::optional<std::string> script;
};

void usage(const char* argv0) {
    fmt::print(stderr, "Usage: {} [--tokens] [--help] [script]\n", argv0);
}

std::optional<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--tokens") {
            opts.dump_tokens = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            fmt::print(stderr, "Unknown option '{}'\n", arg);
            return std::nullopt;
        } else if (opts.script) {
            fmt::print(stderr, "Only one script may be given\n");
            return std::nullopt;
        } else {
            opts.script = std::string(arg);
        }
    }
    return opts;
}

// One scan + parse + print cycle. Returns false if the source had lexical errors.
bool run(std::string_view source, const Options& opts) {
    ember::ScanResult scanned = ember::scan(source);

    for (const auto& err : scanned.errors) ember::report(stderr, ember::format_diagnostic(err));

    if (opts.dump_tokens) {
        for (const auto& tok : scanned.tokens) fmt::print("{}\n", ember::format_token(tok));
    }

    if (!scanned.errors.empty()) return false;

    try {
        ember::Ast ast = ember::parse(scanned.tokens);
        fmt::print("{}\n", ember::render(ast));
    } catch (const ember::ParseError& e) {
        ember::report(stderr, ember::format_diagnostic(e));
    }
    return true;
}

int run_file(const std::string& path, const Options& opts) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        fmt::print(stderr, "Cannot open '{}'\n", path);
        return kExitNoInput;
    }
    std::string source((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        fmt::print(stderr, "Failed to read '{}'\n", path);
        return kExitNoInput;
    }
    return run(source, opts) ? 0 : kExitDataErr;
}

int run_prompt(const Options& opts) {
    std::string line;
    for (;;) {
        fmt::print("> ");
        std::fflush(stdout);
        if (!std::getline(std::cin, line)) break;
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
        run(line, opts); // errors are reported per line; the session goes on
    }
    fmt::print("\n");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        usage(argv[0]);
        return kExitUsage;
    }
    if (opts->help) {
        usage(argv[0]);
        return 0;
    }

    if (opts->script) return run_file(*opts->script, *opts);
    return run_prompt(*opts);
}
