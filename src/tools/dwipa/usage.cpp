//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements help text and usage information for the dwipa command-line tool.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"
#include "dwipa/version.hpp"
#include <iostream>

namespace dwipa::tools
{

void printVersion()
{
    std::cout << "dwipa v" << DWIPA_VERSION_STR << "\n";
    std::cout << "Bilingual Pascal-S lexer and parser\n";
}

void printUsage()
{
    std::cerr << "dwipa v" << DWIPA_VERSION_STR << " - Bilingual Pascal-S Frontend\n"
              << "\n"
              << "Usage: dwipa [options] <file.pas>\n"
              << "\n"
              << "Options:\n"
              << "  --tokens                       Print the token listing\n"
              << "  --ast                          Print the syntax tree\n"
              << "  --max-errors N                 Stop recording syntax errors after N\n"
              << "                                 (0 = no limit, default 50)\n"
              << "  --trace                        Trace DFA runs and parser recovery\n"
              << "  -h, --help                     Show this help message\n"
              << "  --version                      Show version information\n"
              << "\n"
              << "With neither --tokens nor --ast, both listings are printed.\n"
              << "\n"
              << "Examples:\n"
              << "  dwipa hello.pas                  Tokens and syntax tree\n"
              << "  dwipa halo.pas --ast             Syntax tree only\n"
              << "  dwipa broken.pas --max-errors 5  Report at most five syntax errors\n"
              << "\n"
              << "Language Notes:\n"
              << "  - Every reserved word has an English and an Indonesian spelling\n"
              << "    (begin/mulai, end/selesai, if/jika, while/selama, ...)\n"
              << "  - Keywords and identifiers are case-insensitive\n"
              << "  - Comments are { ... } or (* ... *) and do not nest\n";
}

} // namespace dwipa::tools
