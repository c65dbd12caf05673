//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Parser.cpp
// Purpose: Implements token handling, error recording, resynchronization,
//          and the program entry point of the Pascal-S parser.
// Key invariants: The cursor never rests on an Invalid token and never moves
//                 past Eof; every recovery loop consumes at least one token.
// Ownership/Lifetime: Parser borrows tokens and DiagnosticEngine.
// Links: SPEC_FULL.md#45-parser
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/Parser.hpp"
#include "frontends/pascal/DfaRules.hpp"
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <utility>

namespace dwipa::frontends::pascal
{

namespace
{

bool parseTraceFromEnv()
{
    static const bool enabled = std::getenv("DWIPA_PARSE_TRACE") != nullptr;
    return enabled;
}

} // namespace

//=============================================================================
// Constructor
//=============================================================================

Parser::Parser(const std::vector<Token> &tokens,
               dwipa::support::DiagnosticEngine &diag,
               dwipa::support::Options options)
    : tokens_(tokens), diag_(diag), options_(options)
{
    eof_.kind = TokenKind::Eof;
    if (!tokens_.empty())
        eof_.loc = tokens_.back().loc;
    trace_ = options_.trace || parseTraceFromEnv();
    skipInvalid();
}

//=============================================================================
// Token Handling
//=============================================================================

void Parser::skipInvalid()
{
    while (pos_ < tokens_.size() && tokens_[pos_].kind == TokenKind::Invalid)
        ++pos_;
}

const Token &Parser::peek() const
{
    if (pos_ >= tokens_.size())
        return eof_;
    return tokens_[pos_];
}

const Token &Parser::advance()
{
    const Token &result = peek();
    if (result.kind != TokenKind::Eof)
    {
        ++pos_;
        skipInvalid();
    }
    return result;
}

bool Parser::check(TokenKind kind) const
{
    return peek().kind == kind;
}

bool Parser::match(TokenKind kind)
{
    if (check(kind))
    {
        advance();
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what)
{
    if (check(kind))
    {
        advance();
        return true;
    }
    error(what ? std::string(what) : describe(kind));
    return false;
}

//=============================================================================
// Token Utilities
//=============================================================================

bool Parser::isDeclarationStart(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::KwConst:
        case TokenKind::KwType:
        case TokenKind::KwVar:
        case TokenKind::KwProcedure:
        case TokenKind::KwFunction:
            return true;
        default:
            return false;
    }
}

bool Parser::isStatementStart(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Identifier:
        case TokenKind::KwBegin:
        case TokenKind::KwIf:
        case TokenKind::KwWhile:
        case TokenKind::KwFor:
            return true;
        default:
            return false;
    }
}

bool Parser::isSyncToken(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Semicolon:
        case TokenKind::KwEnd:
        case TokenKind::KwElse:
        case TokenKind::Dot:
        case TokenKind::Eof:
        case TokenKind::KwBegin:
        case TokenKind::KwIf:
        case TokenKind::KwWhile:
        case TokenKind::KwFor:
            return true;
        default:
            return isDeclarationStart(kind);
    }
}

std::string Parser::describe(TokenKind kind)
{
    if (kind == TokenKind::Identifier)
        return "identifier";
    if (kind == TokenKind::Eof)
        return "end of file";

    std::string result = std::string("'") + tokenKindToString(kind) + "'";
    if (const char *alt = vernacularSpelling(kind))
    {
        if (std::string(alt) != tokenKindToString(kind))
            result += std::string(" or '") + alt + "'";
    }
    return result;
}

//=============================================================================
// Error Handling
//=============================================================================

void Parser::error(const std::string &expected)
{
    errorAt(defaultErrorKind_, peek(), expected);
}

void Parser::errorAt(SyntaxErrorKind kind, const Token &tok, const std::string &expected)
{
    record(SyntaxError{kind, tok.loc, expected, tok.text});
}

void Parser::record(SyntaxError err)
{
    if (limitReached_)
        return;

    // One report per token: a failed expectation is usually followed by
    // others at the same place while callers unwind.
    if (!errors_.empty() && errors_.back().loc.samePlace(err.loc))
        return;

    if (options_.maxErrors != 0 && errors_.size() >= options_.maxErrors)
    {
        limitReached_ = true;
        SyntaxError note{SyntaxErrorKind::TooManyErrors, err.loc, {}, {}};
        diag_.note(note.loc, note.message(), syntaxErrorCode(note.kind));
        errors_.push_back(std::move(note));
        return;
    }

    diag_.error(err.loc, err.message(), syntaxErrorCode(err.kind));
    errors_.push_back(std::move(err));
}

void Parser::resyncAfterError()
{
    const Token &start = peek();
    const dwipa::support::SourceLoc from = start.loc;
    std::size_t skipped = 0;

    // Skip tokens until we hit a synchronization point
    while (!isSyncToken(peek().kind))
    {
        advance();
        ++skipped;
    }

    if (trace_)
    {
        const Token &stop = peek();
        std::cerr << "[parse] resync at " << from << " skipped " << skipped
                  << " token(s), stopped at "
                  << (stop.kind == TokenKind::Eof ? std::string("end of file")
                                                  : "'" + stop.text + "'")
                  << '\n';
    }
}

int64_t Parser::integerValue(const Token &tok)
{
    int64_t value = 0;
    const char *first = tok.text.data();
    const char *last = first + tok.text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last)
    {
        errorAt(SyntaxErrorKind::UnexpectedToken, tok, "integer literal in range");
        return std::numeric_limits<int64_t>::max();
    }
    return value;
}

//=============================================================================
// Program
//=============================================================================

ParseResult Parser::parse()
{
    ParseResult result;

    if (!check(TokenKind::KwProgram))
    {
        bool hasBlock = false;
        for (std::size_t i = pos_; i < tokens_.size(); ++i)
        {
            if (tokens_[i].kind == TokenKind::KwBegin)
            {
                hasBlock = true;
                break;
            }
        }
        if (!hasBlock)
        {
            errorAt(SyntaxErrorKind::MissingProgram, peek(), describe(TokenKind::KwProgram));
            result.errors = errors_;
            return result;
        }
    }

    auto program = std::make_unique<Program>();
    program->loc = peek().loc;

    // Header
    if (match(TokenKind::KwProgram))
    {
        if (check(TokenKind::Identifier))
            program->name = advance().text;
        else
            error("program name");

        if (!expect(TokenKind::Semicolon))
        {
            resyncAfterError();
            match(TokenKind::Semicolon);
        }
    }
    else
    {
        error(describe(TokenKind::KwProgram));
        if (!check(TokenKind::KwBegin) && !isDeclarationStart(peek().kind))
        {
            resyncAfterError();
            match(TokenKind::Semicolon);
        }
    }

    // Declarations, then anything that is not a block up to 'begin'. A missing
    // block is reported once, at the first token that cannot precede it.
    program->decls = parseDeclarations();
    bool missingBlockReported = false;
    while (!check(TokenKind::KwBegin) && !check(TokenKind::Eof))
    {
        if (!missingBlockReported)
        {
            error(describe(TokenKind::KwBegin));
            missingBlockReported = true;
        }
        std::size_t before = pos_;
        resyncAfterError();
        if (pos_ == before)
            advance();
        match(TokenKind::Semicolon);
        for (auto &d : parseDeclarations())
            program->decls.push_back(std::move(d));
    }

    if (check(TokenKind::KwBegin))
    {
        program->body = parseBlock();
        if (program->body && expect(TokenKind::Dot, "'.'") && !check(TokenKind::Eof))
            error(describe(TokenKind::Eof));
    }
    else if (!missingBlockReported)
    {
        error(describe(TokenKind::KwBegin));
    }

    result.program = std::move(program);
    result.errors = errors_;
    return result;
}

} // namespace dwipa::frontends::pascal
