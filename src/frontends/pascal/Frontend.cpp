//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Pascal-S frontend driver that integrates the lexer and the
// parser, plus the tab-separated token listing used by the dwipa tool.
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/Frontend.hpp"
#include "frontends/pascal/Lexer.hpp"
#include "frontends/pascal/Parser.hpp"

#include <sstream>

namespace dwipa::frontends::pascal
{

bool FrontendResult::succeeded() const
{
    return program != nullptr && !diagnostics.hasErrors();
}

FrontendResult runFrontend(const FrontendInput &input,
                           const dwipa::support::Options &options,
                           dwipa::support::SourceManager &sm)
{
    FrontendResult result{};

    if (input.fileId.has_value())
    {
        result.fileId = *input.fileId;
    }
    else
    {
        std::string path = input.path.empty() ? std::string("<input>") : std::string(input.path);
        result.fileId = sm.addFile(std::move(path));
        if (result.fileId == 0)
        {
            result.diagnostics.error(
                {}, std::string(dwipa::support::kSourceManagerFileIdOverflowMessage));
        }
    }

    // Phase 1: Lexing
    result.tokens =
        tokenize(std::string(input.source), result.fileId, result.diagnostics, options.trace);

    // Phase 2: Parsing
    Parser parser(result.tokens, result.diagnostics, options);
    ParseResult parsed = parser.parse();
    result.program = std::move(parsed.program);
    result.syntaxErrors = std::move(parsed.errors);

    return result;
}

std::string formatTokenListing(const std::vector<Token> &tokens)
{
    std::ostringstream os;
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        const Token &tok = tokens[i];
        os << i << '\t' << tokenCategoryToString(tokenCategory(tok.kind)) << '\t'
           << tokenKindToString(tok.kind) << '\t' << tok.text << '\t' << tok.loc << '\n';
    }
    return os.str();
}

} // namespace dwipa::frontends::pascal
