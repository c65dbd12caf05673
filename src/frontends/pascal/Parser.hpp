//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Parser.hpp
// Purpose: Declares the recursive descent parser for bilingual Pascal-S.
// Key invariants: Precedence climbing for expressions; one-token lookahead;
//                 syntax errors are recorded, never thrown.
// Ownership/Lifetime: Parser borrows the token vector and DiagnosticEngine;
//                     the returned Program is owned by the caller.
// Links: SPEC_FULL.md#45-parser
//
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/pascal/AST.hpp"
#include "frontends/pascal/SyntaxError.hpp"
#include "frontends/pascal/Token.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace dwipa::frontends::pascal
{

/// @brief Outcome of parsing a whole program.
struct ParseResult
{
    /// @brief Best-effort tree; nullptr only after MissingProgram.
    std::unique_ptr<Program> program;

    /// @brief Every recorded syntax error in source order.
    std::vector<SyntaxError> errors;

    [[nodiscard]] bool succeeded() const
    {
        return program != nullptr && errors.empty();
    }
};

/// @brief Recursive descent parser for bilingual Pascal-S.
/// @details Uses precedence climbing for expression parsing.
/// Operator precedence (highest to lowest):
///   1. not, unary -, unary +
///   2. *, /, div, mod
///   3. +, -
///   4. =, <>, <, >, <=, >= (non-associative)
///   5. and, or
/// Invalid tokens are skipped; the lexer has already reported them.
class Parser
{
  public:
    /// @brief Create a parser over a token vector ending in Eof.
    /// @param tokens Tokens to read; must outlive the parser.
    /// @param diag Diagnostic engine that receives every syntax error.
    /// @param options Error limit and tracing.
    Parser(const std::vector<Token> &tokens,
           dwipa::support::DiagnosticEngine &diag,
           dwipa::support::Options options = {});

    /// @brief Parse a complete program.
    ParseResult parse();

    /// @brief Parse a single expression (for testing).
    /// @return The parsed expression, or nullptr on error.
    std::unique_ptr<Expr> parseExpression();

    /// @brief Parse a single statement (for testing).
    /// @return The parsed statement, or nullptr on error.
    std::unique_ptr<Stmt> parseStatement();

    /// @brief Parse a type (for testing).
    /// @return The parsed type node, or nullptr on error.
    std::unique_ptr<TypeNode> parseType();

    /// @brief Errors recorded so far.
    [[nodiscard]] const std::vector<SyntaxError> &errors() const
    {
        return errors_;
    }

  private:
    //=========================================================================
    // Token Handling
    //=========================================================================

    /// @brief Current token (never Invalid).
    const Token &peek() const;

    /// @brief Consume and return the current token; Eof is never consumed.
    const Token &advance();

    /// @brief Check if current token matches the given kind.
    bool check(TokenKind kind) const;

    /// @brief If current token matches, consume it and return true.
    bool match(TokenKind kind);

    /// @brief Consume a token of @p kind or record an error.
    /// @param what Description for the message; derived from @p kind when null.
    /// @return True if the token was present and consumed.
    bool expect(TokenKind kind, const char *what = nullptr);

    /// @brief Step past Invalid tokens at the cursor.
    void skipInvalid();

    //=========================================================================
    // Error Handling
    //=========================================================================

    /// @brief Record an error of the current default kind at the current token.
    void error(const std::string &expected);

    /// @brief Record an error of @p kind at the current token.
    void errorAt(SyntaxErrorKind kind, const Token &tok, const std::string &expected);

    /// @brief Store an error, honoring the limit and suppressing duplicates.
    void record(SyntaxError err);

    /// @brief Skip tokens until a synchronization point.
    /// @details Stops before ';', 'end', 'else', '.', Eof, or a keyword that
    ///          starts a declaration section or a statement.
    void resyncAfterError();

    /// @brief True for tokens resyncAfterError() stops at.
    static bool isSyncToken(TokenKind kind);

    /// @brief True for 'const', 'type', 'var', 'procedure', 'function'.
    static bool isDeclarationStart(TokenKind kind);

    /// @brief True for tokens that can begin a non-empty statement.
    static bool isStatementStart(TokenKind kind);

    /// @brief Quoted spelling(s) of a token kind for messages, e.g.
    ///        "'begin' or 'mulai'".
    static std::string describe(TokenKind kind);

    /// @brief RAII helper that changes the kind used by error().
    class ErrorKindScope
    {
      public:
        ErrorKindScope(Parser &parser, SyntaxErrorKind kind)
            : parser_(parser), saved_(parser.defaultErrorKind_)
        {
            parser_.defaultErrorKind_ = kind;
        }

        ~ErrorKindScope()
        {
            parser_.defaultErrorKind_ = saved_;
        }

        ErrorKindScope(const ErrorKindScope &) = delete;
        ErrorKindScope &operator=(const ErrorKindScope &) = delete;

      private:
        Parser &parser_;
        SyntaxErrorKind saved_;
    };

    //=========================================================================
    // Expression Parsing
    //=========================================================================

    /// @brief Logical: relation { (and | or) relation }.
    std::unique_ptr<Expr> parseLogical();

    /// @brief Relation: simple [relop simple]; a second relop is an error.
    std::unique_ptr<Expr> parseRelation();

    /// @brief Simple: term { (+ | -) term }.
    std::unique_ptr<Expr> parseSimple();

    /// @brief Term: factor { (* | / | div | mod) factor }.
    std::unique_ptr<Expr> parseTerm();

    /// @brief Factor: (not | - | +) factor | primary.
    std::unique_ptr<Expr> parseFactor();

    /// @brief Primary: literal | name | call | "(" expr ")".
    std::unique_ptr<Expr> parsePrimary();

    /// @brief Argument list after '(' up to and including ')'.
    bool parseArguments(std::vector<std::unique_ptr<Expr>> &args);

    /// @brief Build a literal node from the current literal token.
    std::unique_ptr<Expr> parseLiteral();

    /// @brief Convert an integer literal token, recording overflow.
    int64_t integerValue(const Token &tok);

    //=========================================================================
    // Statement Parsing
    //=========================================================================

    /// @brief Parse begin...end.
    std::unique_ptr<BlockStmt> parseBlock();

    /// @brief Parse statements separated by ';' with local recovery.
    std::vector<std::unique_ptr<Stmt>> parseStatementList();

    std::unique_ptr<Stmt> parseIf();
    std::unique_ptr<Stmt> parseWhile();
    std::unique_ptr<Stmt> parseFor();

    /// @brief Assignment or procedure call starting with an identifier.
    std::unique_ptr<Stmt> parseAssignOrCall();

    //=========================================================================
    // Type Parsing
    //=========================================================================

    /// @brief array "[" subrange "]" of type.
    std::unique_ptr<TypeNode> parseArrayType();

    /// @brief bound ".." bound.
    bool parseSubrange(int64_t &low, int64_t &high);

    /// @brief ["+"|"-"] integer-literal.
    bool parseBound(int64_t &value);

    //=========================================================================
    // Declaration Parsing
    //=========================================================================

    /// @brief Any number of const/type/var sections and subprograms.
    std::vector<std::unique_ptr<Decl>> parseDeclarations();

    void parseConstSection(std::vector<std::unique_ptr<Decl>> &decls);
    void parseTypeSection(std::vector<std::unique_ptr<Decl>> &decls);
    void parseVarSection(std::vector<std::unique_ptr<Decl>> &decls);
    std::unique_ptr<Decl> parseProcedure();
    std::unique_ptr<Decl> parseFunction();

    /// @brief ["+"|"-"] number | string | char | identifier.
    std::unique_ptr<Expr> parseConstValue();

    /// @brief ident { "," ident }.
    bool parseIdentList(std::vector<std::string> &names);

    /// @brief "(" group { ";" group } ")".
    bool parseParams(std::vector<ParamDecl> &params);

    /// @brief Recover inside a declaration section: resync, then eat ';'.
    void recoverDeclaration();

    const std::vector<Token> &tokens_;
    dwipa::support::DiagnosticEngine &diag_;
    dwipa::support::Options options_;
    std::size_t pos_{0};
    Token eof_;
    std::vector<SyntaxError> errors_;
    SyntaxErrorKind defaultErrorKind_{SyntaxErrorKind::UnexpectedToken};
    bool limitReached_{false};
    bool trace_{false};
};

} // namespace dwipa::frontends::pascal
