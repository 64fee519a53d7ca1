#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <builtin/console.hpp>
#include <eval/completion.hpp>
#include <eval/environment.hpp>
#include <eval/interpreter.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto prompt = ">> ";

struct options
{
    bool help {};
    bool debug {};
    std::string_view file;
};

void print_parse_errors(const std::vector<std::string>& errors)
{
    fmt::print(stderr, "Whoops! We ran into some parser errors:\n");
    for (const auto& error : errors) {
        fmt::print(stderr, "  {}\n", error);
    }
}

void print_eval_error(std::string_view message)
{
    fmt::print(stderr, "Whoops! We ran into some evaluation error:\n  {}\n", message);
}

[[noreturn]] void usage(std::string_view program, std::string_view error = {})
{
    if (!error.empty()) {
        fmt::print(stderr, "Error: {}\n", error);
    }
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program);
    fmt::print("  -d  dump the global bindings after each run\n");
    fmt::print("  -h  show this help\n");
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    std::exit(error.empty() ? EXIT_SUCCESS : EXIT_FAILURE);
}

auto parse_options(std::string_view program, std::span<char*> args) -> options
{
    options opts {};
    for (std::string_view arg : args) {
        if (arg == "-d") {
            opts.debug = true;
        } else if (arg == "-h") {
            opts.help = true;
        } else if (arg.starts_with('-')) {
            usage(program, fmt::format("invalid option {}", arg));
        } else if (opts.file.empty()) {
            opts.file = arg;
        } else {
            fmt::print(stderr, "ignoring extra file argument {}\n", arg);
        }
    }
    return opts;
}

/// parses and runs one chunk of source against `globals`, reporting any failure on stderr
auto interpret(const std::string& source, std::string_view filename, environment* globals)
    -> std::optional<completion>
{
    auto prsr = parser {lexer {source, filename}};
    auto* prgrm = prsr.parse_program();
    if (!prsr.errors().empty()) {
        print_parse_errors(prsr.errors());
        return std::nullopt;
    }
    try {
        return execute_program(prgrm, globals).result;
    } catch (const std::exception& e) {
        print_eval_error(e.what());
        return std::nullopt;
    }
}

auto run_file(const options& opts, environment* globals) -> int
{
    std::ifstream ifs {std::string {opts.file}};
    if (!ifs) {
        fmt::print(stderr, "ERROR: could not open file: {}\n", opts.file);
        return EXIT_FAILURE;
    }
    const std::string source {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    const auto result = interpret(source, opts.file, globals);
    if (opts.debug) {
        globals->debug();
    }
    return result.has_value() ? EXIT_SUCCESS : EXIT_FAILURE;
}

auto run_repl(const options& opts, environment* globals) -> int
{
    std::cout << "This is minijs. Type a statement, or end the input to quit.\n" << prompt << std::flush;
    std::string line;
    while (std::getline(std::cin, line)) {
        const auto result = interpret(line, "<stdin>", globals);
        if (result && result->val) {
            std::cout << result->val->inspect() << '\n';
        }
        if (opts.debug) {
            globals->debug();
        }
        std::cout << prompt << std::flush;
    }
    return EXIT_SUCCESS;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    const auto args = std::span(argv, static_cast<std::size_t>(argc));
    const std::string_view program = args.empty() ? "minijs" : args.front();
    const auto opts = parse_options(program, args.empty() ? args : args.subspan(1));
    if (opts.help) {
        usage(program);
    }
    try {
        auto* globals = make_global_environment({{"console", make_console(std::cout)}});
        return opts.file.empty() ? run_repl(opts, globals) : run_file(opts, globals);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Caught an exception: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
