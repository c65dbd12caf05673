//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Lexer.cpp
// Purpose: Implements the Pascal-S lexer on top of the DFA engine.
// Key invariants: Every emitted token except Eof has a non-empty lexeme that
//                 equals the source slice at its offset.
// Ownership/Lifetime: Lexer owns copy of source; DiagnosticEngine borrowed.
// Links: SPEC_FULL.md#44-lexer
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/Lexer.hpp"
#include "frontends/common/CharUtils.hpp"
#include "frontends/pascal/DfaRules.hpp"
#include <utility>

namespace dwipa::frontends::pascal
{

using common::char_utils::isUtf8Continuation;
using common::char_utils::toLowercase;
using common::char_utils::utf8SequenceLength;

const char *lexErrorCode(LexError error)
{
    switch (error)
    {
        case LexError::UnterminatedString:
            return "L1001";
        case LexError::UnterminatedComment:
            return "L1002";
        case LexError::InvalidCharacter:
            return "L1003";
    }
    return "L1000";
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId, dwipa::support::DiagnosticEngine &diag, bool trace)
    : stream_(std::move(source), fileId), engine_(trace), diag_(diag)
{
}

void Lexer::reportError(dwipa::support::SourceLoc loc, LexError error, const std::string &lexeme)
{
    std::string message = lexErrorMessage(error);
    if (error == LexError::InvalidCharacter)
        message += " '" + lexeme + "'";
    diag_.error(loc, std::move(message), lexErrorCode(error));
}

Token Lexer::makeInvalid(const DfaRun &run)
{
    // Resynchronize: skip one character after an invalid one, taking a whole
    // UTF-8 sequence as one character; an unterminated construct already left
    // the stream after its partial lexeme.
    if (run.status == DfaStatus::NoTransition)
    {
        std::size_t rest = utf8SequenceLength(stream_.advance()) - 1;
        while (rest > 0 && !stream_.atEnd() && isUtf8Continuation(stream_.peek()))
        {
            stream_.advance();
            --rest;
        }
    }

    Token tok;
    tok.kind = TokenKind::Invalid;
    tok.loc = stream_.locAt(run.begin);
    tok.text = std::string(stream_.slice(run.begin.offset, stream_.position().offset));
    tok.canonical = tok.text;
    tok.lexError = run.error;
    reportError(tok.loc, *run.error, tok.text);
    return tok;
}

Token Lexer::lexToken()
{
    while (!stream_.atEnd())
    {
        DfaRun run = engine_.run(stream_);
        if (!run.accepted())
            return makeInvalid(run);

        if (isTrivia(run.kind))
            continue;

        Token tok;
        tok.kind = run.kind;
        tok.loc = stream_.locAt(run.begin);
        tok.text = std::string(stream_.slice(run.begin.offset, run.end.offset));

        if (tok.kind == TokenKind::Identifier)
        {
            tok.canonical = toLowercase(tok.text);
            if (auto kw = lookupKeyword(tok.canonical))
                tok.kind = *kw;
        }
        else
        {
            tok.canonical = tok.text;
        }
        return tok;
    }

    Token eof;
    eof.kind = TokenKind::Eof;
    eof.loc = stream_.locAt(stream_.position());
    eofEmitted_ = true;
    return eof;
}

Token Lexer::next()
{
    // Return cached token if available
    if (peeked_.has_value())
    {
        Token tok = std::move(*peeked_);
        peeked_.reset();
        return tok;
    }
    return lexToken();
}

const Token &Lexer::peek()
{
    if (!peeked_.has_value())
    {
        peeked_ = lexToken();
    }
    return *peeked_;
}

std::vector<Token> tokenize(std::string source,
                            uint32_t fileId,
                            dwipa::support::DiagnosticEngine &diag,
                            bool trace)
{
    Lexer lexer(std::move(source), fileId, diag, trace);
    std::vector<Token> tokens;
    while (true)
    {
        tokens.push_back(lexer.next());
        if (tokens.back().kind == TokenKind::Eof)
            break;
    }
    return tokens;
}

} // namespace dwipa::frontends::pascal
