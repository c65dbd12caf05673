// File: tests/frontends/pascal/ParserTestUtil.hpp
// Purpose: Shared helpers that tokenize a snippet and run one parser entry
//          point over it.
// Key invariants: The token vector outlives the Parser that borrows it.
// Ownership/Lifetime: ParseHarness owns tokens and diagnostics; returned
//                     AST nodes are owned by the caller.
// Links: SPEC_FULL.md#45-parser

#pragma once

#include "frontends/pascal/Lexer.hpp"
#include "frontends/pascal/Parser.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dwipa::frontends::pascal::test
{

/// @brief Tokenizes a source snippet and keeps the tokens alive for a Parser.
struct ParseHarness
{
    dwipa::support::DiagnosticEngine diag;
    std::vector<Token> tokens;
    std::vector<SyntaxError> errors;

    ParseResult program(const std::string &src, dwipa::support::Options options = {})
    {
        tokens = tokenize(src, 1, diag);
        Parser parser(tokens, diag, options);
        ParseResult result = parser.parse();
        errors = result.errors;
        return result;
    }

    std::unique_ptr<Expr> expression(const std::string &src)
    {
        tokens = tokenize(src, 1, diag);
        Parser parser(tokens, diag);
        auto expr = parser.parseExpression();
        errors = parser.errors();
        return expr;
    }

    std::unique_ptr<Stmt> statement(const std::string &src)
    {
        tokens = tokenize(src, 1, diag);
        Parser parser(tokens, diag);
        auto stmt = parser.parseStatement();
        errors = parser.errors();
        return stmt;
    }

    std::unique_ptr<TypeNode> type(const std::string &src)
    {
        tokens = tokenize(src, 1, diag);
        Parser parser(tokens, diag);
        auto node = parser.parseType();
        errors = parser.errors();
        return node;
    }
};

template <class T, class Node> const T &as(const Node &node)
{
    return static_cast<const T &>(node);
}

} // namespace dwipa::frontends::pascal::test
