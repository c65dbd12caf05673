//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the dwipa command-line tool.
// Loads one Pascal-S file, runs the lexer and parser, and prints the token
// listing, the syntax tree, and diagnostics.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the dwipa tool.
/// @details Listings go to stdout and diagnostics to stderr. The exit status
///          is 0 when no error was reported and 1 otherwise.

#include "frontends/pascal/AstPrinter.hpp"
#include "frontends/pascal/Frontend.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"
#include "usage.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace
{

/// @brief Configuration parsed from dwipa command-line arguments.
struct DwipaConfig
{
    std::string sourcePath;
    dwipa::support::Options options;
};

[[noreturn]] void usageError(const std::string &message)
{
    std::cerr << "error: " << message << "\n\n";
    dwipa::tools::printUsage();
    std::exit(1);
}

/// @brief Parse a non-negative error limit.
bool parseCount(std::string_view text, std::size_t &out)
{
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last && !text.empty();
}

/// @brief Parse dwipa arguments into a configuration.
/// @details Exits the process for --help, --version, and malformed input.
DwipaConfig parseArgs(int argc, char **argv)
{
    DwipaConfig config{};
    bool tokens = false;
    bool ast = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            dwipa::tools::printUsage();
            std::exit(0);
        }
        else if (arg == "--version")
        {
            dwipa::tools::printVersion();
            std::exit(0);
        }
        else if (arg == "--tokens")
        {
            tokens = true;
        }
        else if (arg == "--ast")
        {
            ast = true;
        }
        else if (arg == "--trace")
        {
            config.options.trace = true;
        }
        else if (arg == "--max-errors")
        {
            if (i + 1 >= argc)
                usageError("--max-errors requires a count");
            if (!parseCount(argv[++i], config.options.maxErrors))
                usageError(std::string("invalid error count: ") + argv[i]);
        }
        else if (arg.starts_with("-"))
        {
            usageError("unknown option: " + std::string(arg));
        }
        else if (arg.ends_with(".pas"))
        {
            if (!config.sourcePath.empty())
                usageError("multiple source files not supported");
            config.sourcePath = std::string(arg);
        }
        else
        {
            usageError("unknown argument or file type: " + std::string(arg) +
                       "\n       (expected .pas file)");
        }
    }

    if (config.sourcePath.empty())
        usageError("no input file specified");

    // Default: print both listings
    if (!tokens && !ast)
        tokens = ast = true;
    config.options.dumpTokens = tokens;
    config.options.dumpAst = ast;

    return config;
}

} // namespace

/// @brief Main entry point for the dwipa command-line tool.
/// @param argc Number of command-line arguments.
/// @param argv Array of argument strings.
/// @return 0 when the file lexes and parses cleanly, 1 otherwise.
int main(int argc, char **argv)
{
    using namespace dwipa::frontends::pascal;

    if (argc < 2)
    {
        dwipa::tools::printUsage();
        return 1;
    }

    DwipaConfig config = parseArgs(argc, argv);

    dwipa::support::SourceManager sm;
    auto loaded = dwipa::tools::common::loadSourceBuffer(config.sourcePath, sm);
    if (!loaded)
    {
        dwipa::support::printDiag(loaded.error(), std::cerr);
        return 1;
    }

    FrontendInput input{};
    input.source = loaded.value().buffer;
    input.path = config.sourcePath;
    input.fileId = loaded.value().fileId;

    FrontendResult result = runFrontend(input, config.options, sm);

    if (config.options.dumpTokens)
        std::cout << formatTokenListing(result.tokens);

    if (config.options.dumpAst && result.program)
    {
        if (config.options.dumpTokens)
            std::cout << '\n';
        AstPrinter printer;
        std::cout << printer.dump(*result.program);
    }

    result.diagnostics.printAll(std::cerr, &sm);

    return result.succeeded() ? 0 : 1;
}
