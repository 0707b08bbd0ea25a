#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

#include <diagnostics/diagnostics.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <session.hpp>

namespace
{
constexpr auto prompt = ">> ";

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
};

auto get_logged_in_user() -> std::string
{
    // NOLINTBEGIN(concurrency-mt-unsafe)
    const char* username = getenv("USER");

    if (username == nullptr) {
        username = getenv("USERNAME");
    }
    // NOLINTEND(concurrency-mt-unsafe)

    return (username != nullptr) ? std::string(username) : "Unknown";
}

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program);
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<size_t>(argc))) {
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                default: {
                    show_usage(program, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (opts.file.empty()) {
                opts.file = arg;
            } else {
                fmt::print("ignoring file argument {}, already have one set.\n", arg);
            }
        }
    }
    return opts;
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        fmt::print(std::cerr, "ERROR: could not open file: {}\n", opts.file);
        return 1;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    auto diag = diagnostics {&std::cerr};
    auto sess = session {std::cout, diag, opts.debug};
    sess.run(contents);
    if (opts.debug) {
        sess.globals().debug();
    }
    return diag.empty() ? 0 : 1;
}

auto run_repl(const command_line_args& opts) -> int
{
    fmt::print("Hello {}. This is the Ritual programming language.\n", get_logged_in_user());
    fmt::print("Feel free to type in commands\n");
    auto diag = diagnostics {&std::cerr};
    auto sess = session {std::cout, diag, opts.debug};
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        sess.run(input);
        if (opts.debug) {
            sess.globals().debug();
        }
        diag.clear();
        show_prompt();
    }
    return 0;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    auto opts = parse_command_line(program, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);

    } catch (const std::exception& e) {
        fmt::print(std::cerr, "Caught an exception: {}\n", e.what());
        return 1;
    }
}
