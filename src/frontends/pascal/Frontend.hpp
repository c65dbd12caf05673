//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Pascal-S frontend driver, which runs the lexer and
// parser over one source buffer and keeps every result as data:
//   Source -> Lexer -> Tokens -> Parser -> AST
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pascal/AST.hpp"
#include "frontends/pascal/SyntaxError.hpp"
#include "frontends/pascal/Token.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"
#include "support/source_manager.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dwipa::frontends::pascal
{

/// @brief Input parameters describing the source to process.
struct FrontendInput
{
    /// @brief Pascal-S source text.
    std::string_view source;
    /// @brief Path used for diagnostics; defaults to "<input>" when empty.
    std::string_view path{"<input>"};
    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

/// @brief Aggregated result of one tokenize+parse pipeline.
struct FrontendResult
{
    /// @brief Lexical and syntax diagnostics in report order.
    dwipa::support::DiagnosticEngine diagnostics{};
    /// @brief File identifier used for the source.
    uint32_t fileId{0};
    /// @brief Every token up to and including Eof.
    std::vector<Token> tokens;
    /// @brief Best-effort syntax tree; nullptr after MissingProgram.
    std::unique_ptr<Program> program;
    /// @brief Syntax errors recorded by the parser.
    std::vector<SyntaxError> syntaxErrors;

    /// @brief True when a tree was built and no error was reported.
    [[nodiscard]] bool succeeded() const;
};

/// @brief Tokenize and parse Pascal-S source text.
/// @param input Source information describing the buffer.
/// @param options Error limit and tracing.
/// @param sm Source manager that receives the path unless a file id is given.
/// @return Tokens, tree, and diagnostics.
FrontendResult runFrontend(const FrontendInput &input,
                           const dwipa::support::Options &options,
                           dwipa::support::SourceManager &sm);

/// @brief Render tokens one per line as
///        "index<TAB>category<TAB>kind<TAB>lexeme<TAB>line:column".
std::string formatTokenListing(const std::vector<Token> &tokens);

} // namespace dwipa::frontends::pascal
