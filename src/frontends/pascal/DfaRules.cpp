//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/DfaRules.cpp
// Purpose: Builds the Pascal-S transition table and the bilingual keyword
//          table.
// Key invariants: Keyword table entries are sorted by lexeme (checked at
//                 compile time); EndOfInput never has an outgoing edge.
// Ownership/Lifetime: The table is a function-local static.
// Links: SPEC_FULL.md#42-dfa-rule-set-dfarules
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/DfaRules.hpp"
#include "frontends/common/CharUtils.hpp"
#include "frontends/common/KeywordTable.hpp"
#include <algorithm>

namespace dwipa::frontends::pascal
{

using common::char_utils::isBlank;
using common::char_utils::isDigit;
using common::char_utils::isLetter;
using common::char_utils::isNewline;
using common::keyword_table::KeywordEntry;

namespace
{

constexpr std::size_t idx(DfaState s)
{
    return static_cast<std::size_t>(s);
}

constexpr std::size_t idx(CharClass c)
{
    return static_cast<std::size_t>(c);
}

/// @brief Both spellings of every reserved word, sorted by lexeme.
constexpr std::array<KeywordEntry<TokenKind>, 44> kKeywordTable = {{
    {"and", TokenKind::KwAnd},
    {"array", TokenKind::KwArray},
    {"atau", TokenKind::KwOr},
    {"bagi", TokenKind::KwDiv},
    {"begin", TokenKind::KwBegin},
    {"const", TokenKind::KwConst},
    {"dan", TokenKind::KwAnd},
    {"dari", TokenKind::KwOf},
    {"div", TokenKind::KwDiv},
    {"do", TokenKind::KwDo},
    {"downto", TokenKind::KwDownto},
    {"else", TokenKind::KwElse},
    {"end", TokenKind::KwEnd},
    {"for", TokenKind::KwFor},
    {"function", TokenKind::KwFunction},
    {"fungsi", TokenKind::KwFunction},
    {"if", TokenKind::KwIf},
    {"jika", TokenKind::KwIf},
    {"ke", TokenKind::KwTo},
    {"konstanta", TokenKind::KwConst},
    {"lakukan", TokenKind::KwDo},
    {"larik", TokenKind::KwArray},
    {"maka", TokenKind::KwThen},
    {"mod", TokenKind::KwMod},
    {"mulai", TokenKind::KwBegin},
    {"not", TokenKind::KwNot},
    {"of", TokenKind::KwOf},
    {"or", TokenKind::KwOr},
    {"procedure", TokenKind::KwProcedure},
    {"program", TokenKind::KwProgram},
    {"prosedur", TokenKind::KwProcedure},
    {"selain_itu", TokenKind::KwElse},
    {"selama", TokenKind::KwWhile},
    {"selesai", TokenKind::KwEnd},
    {"then", TokenKind::KwThen},
    {"tidak", TokenKind::KwNot},
    {"tipe", TokenKind::KwType},
    {"to", TokenKind::KwTo},
    {"turun_ke", TokenKind::KwDownto},
    {"type", TokenKind::KwType},
    {"untuk", TokenKind::KwFor},
    {"var", TokenKind::KwVar},
    {"variabel", TokenKind::KwVar},
    {"while", TokenKind::KwWhile},
}};

static_assert(common::keyword_table::isKeywordTableSorted(kKeywordTable),
              "keyword table must be sorted by lexeme");
static_assert(common::keyword_table::isKeywordTableFolded(kKeywordTable),
              "keyword spellings must be lowercase");

} // namespace

//===----------------------------------------------------------------------===//
// Table construction
//===----------------------------------------------------------------------===//

const DfaTable &DfaTable::get()
{
    static const DfaTable table;
    return table;
}

void DfaTable::edge(DfaState from, CharClass cls, DfaState to)
{
    edges_[idx(from)][idx(cls)] = static_cast<uint8_t>(to);
}

void DfaTable::edgeAllExcept(DfaState from, std::initializer_list<CharClass> excluded, DfaState to)
{
    for (std::size_t c = 0; c < kCharClassCount; ++c)
    {
        auto cls = static_cast<CharClass>(c);
        if (cls == CharClass::EndOfInput)
            continue;
        if (std::find(excluded.begin(), excluded.end(), cls) != excluded.end())
            continue;
        edges_[idx(from)][c] = static_cast<uint8_t>(to);
    }
}

void DfaTable::accept(DfaState state, TokenKind kind)
{
    states_[idx(state)].accepting = true;
    states_[idx(state)].kind = kind;
}

DfaTable::DfaTable()
{
    for (auto &row : edges_)
        row.fill(kNoEdge);

    // Whitespace runs
    edge(DfaState::Start, CharClass::Blank, DfaState::Whitespace);
    edge(DfaState::Start, CharClass::Newline, DfaState::Whitespace);
    edge(DfaState::Whitespace, CharClass::Blank, DfaState::Whitespace);
    edge(DfaState::Whitespace, CharClass::Newline, DfaState::Whitespace);
    accept(DfaState::Whitespace, TokenKind::Whitespace);

    // Identifiers: letter { letter | digit | '_' }
    edge(DfaState::Start, CharClass::Letter, DfaState::Ident);
    edge(DfaState::Start, CharClass::ExpLetter, DfaState::Ident);
    for (CharClass c : {CharClass::Letter, CharClass::ExpLetter, CharClass::Digit, CharClass::Underscore})
        edge(DfaState::Ident, c, DfaState::Ident);
    accept(DfaState::Ident, TokenKind::Identifier);

    // Numbers: digits [ '.' digits ] [ ('e'|'E') ['+'|'-'] digits ]
    edge(DfaState::Start, CharClass::Digit, DfaState::Int);
    edge(DfaState::Int, CharClass::Digit, DfaState::Int);
    edge(DfaState::Int, CharClass::Dot, DfaState::IntDot);
    edge(DfaState::Int, CharClass::ExpLetter, DfaState::Exp);
    edge(DfaState::IntDot, CharClass::Digit, DfaState::Real);
    edge(DfaState::Real, CharClass::Digit, DfaState::Real);
    edge(DfaState::Real, CharClass::ExpLetter, DfaState::Exp);
    edge(DfaState::Exp, CharClass::Plus, DfaState::ExpSign);
    edge(DfaState::Exp, CharClass::Minus, DfaState::ExpSign);
    edge(DfaState::Exp, CharClass::Digit, DfaState::RealExp);
    edge(DfaState::ExpSign, CharClass::Digit, DfaState::RealExp);
    edge(DfaState::RealExp, CharClass::Digit, DfaState::RealExp);
    accept(DfaState::Int, TokenKind::IntegerLiteral);
    accept(DfaState::Real, TokenKind::RealLiteral);
    accept(DfaState::RealExp, TokenKind::RealLiteral);

    // Quoted literals. A doubled quote inside the body stands for one quote,
    // so every closing state re-enters the body on another quote. The body
    // length (0, 1, more) decides between StringLiteral and CharLiteral.
    const std::initializer_list<CharClass> notBodyChar = {
        CharClass::Quote, CharClass::Newline, CharClass::EndOfInput};
    edge(DfaState::Start, CharClass::Quote, DfaState::StrOpen);
    edgeAllExcept(DfaState::StrOpen, notBodyChar, DfaState::StrOne);
    edge(DfaState::StrOpen, CharClass::Quote, DfaState::EmptyStrClose);
    edgeAllExcept(DfaState::StrOne, notBodyChar, DfaState::StrMany);
    edge(DfaState::StrOne, CharClass::Quote, DfaState::CharClose);
    edgeAllExcept(DfaState::StrMany, notBodyChar, DfaState::StrMany);
    edge(DfaState::StrMany, CharClass::Quote, DfaState::StrClose);
    edge(DfaState::EmptyStrClose, CharClass::Quote, DfaState::StrOne);
    edge(DfaState::CharClose, CharClass::Quote, DfaState::StrMany);
    edge(DfaState::StrClose, CharClass::Quote, DfaState::StrMany);
    accept(DfaState::EmptyStrClose, TokenKind::StringLiteral);
    accept(DfaState::CharClose, TokenKind::CharLiteral);
    accept(DfaState::StrClose, TokenKind::StringLiteral);
    for (DfaState s : {DfaState::StrOpen, DfaState::StrOne, DfaState::StrMany})
        states_[idx(s)].stallError = LexError::UnterminatedString;

    // Comments: '{' ... '}' and '(*' ... '*)', not nested
    edge(DfaState::Start, CharClass::LBrace, DfaState::BraceComment);
    edgeAllExcept(DfaState::BraceComment, {CharClass::RBrace}, DfaState::BraceComment);
    edge(DfaState::BraceComment, CharClass::RBrace, DfaState::CommentDone);

    edge(DfaState::LParen, CharClass::Star, DfaState::ParenComment);
    edgeAllExcept(DfaState::ParenComment, {CharClass::Star}, DfaState::ParenComment);
    edge(DfaState::ParenComment, CharClass::Star, DfaState::ParenCommentStar);
    edgeAllExcept(DfaState::ParenCommentStar, {CharClass::Star, CharClass::RParen}, DfaState::ParenComment);
    edge(DfaState::ParenCommentStar, CharClass::Star, DfaState::ParenCommentStar);
    edge(DfaState::ParenCommentStar, CharClass::RParen, DfaState::CommentDone);
    accept(DfaState::CommentDone, TokenKind::Comment);
    for (DfaState s : {DfaState::BraceComment, DfaState::ParenComment, DfaState::ParenCommentStar})
        states_[idx(s)].stallError = LexError::UnterminatedComment;

    // Two-character operators accept their one-character prefix
    edge(DfaState::Start, CharClass::Colon, DfaState::Colon);
    edge(DfaState::Colon, CharClass::Equal, DfaState::Assign);
    accept(DfaState::Colon, TokenKind::Colon);
    accept(DfaState::Assign, TokenKind::Assign);

    edge(DfaState::Start, CharClass::Less, DfaState::Less);
    edge(DfaState::Less, CharClass::Equal, DfaState::LessEqual);
    edge(DfaState::Less, CharClass::Greater, DfaState::NotEqual);
    accept(DfaState::Less, TokenKind::Less);
    accept(DfaState::LessEqual, TokenKind::LessEqual);
    accept(DfaState::NotEqual, TokenKind::NotEqual);

    edge(DfaState::Start, CharClass::Greater, DfaState::Greater);
    edge(DfaState::Greater, CharClass::Equal, DfaState::GreaterEqual);
    accept(DfaState::Greater, TokenKind::Greater);
    accept(DfaState::GreaterEqual, TokenKind::GreaterEqual);

    edge(DfaState::Start, CharClass::Dot, DfaState::Dot);
    edge(DfaState::Dot, CharClass::Dot, DfaState::DotDot);
    accept(DfaState::Dot, TokenKind::Dot);
    accept(DfaState::DotDot, TokenKind::DotDot);

    // Single-character tokens
    struct Single
    {
        CharClass cls;
        DfaState state;
        TokenKind kind;
    };
    static constexpr Single kSingles[] = {
        {CharClass::Plus, DfaState::Plus, TokenKind::Plus},
        {CharClass::Minus, DfaState::Minus, TokenKind::Minus},
        {CharClass::Star, DfaState::Star, TokenKind::Star},
        {CharClass::Slash, DfaState::Slash, TokenKind::Slash},
        {CharClass::Equal, DfaState::Equal, TokenKind::Equal},
        {CharClass::Semicolon, DfaState::Semicolon, TokenKind::Semicolon},
        {CharClass::Comma, DfaState::Comma, TokenKind::Comma},
        {CharClass::LParen, DfaState::LParen, TokenKind::LParen},
        {CharClass::RParen, DfaState::RParen, TokenKind::RParen},
        {CharClass::LBracket, DfaState::LBracket, TokenKind::LBracket},
        {CharClass::RBracket, DfaState::RBracket, TokenKind::RBracket},
    };
    for (const Single &s : kSingles)
    {
        edge(DfaState::Start, s.cls, s.state);
        accept(s.state, s.kind);
    }
}

//===----------------------------------------------------------------------===//
// Queries
//===----------------------------------------------------------------------===//

std::optional<DfaState> DfaTable::next(DfaState state, CharClass cls) const
{
    uint8_t to = edges_[idx(state)][idx(cls)];
    if (to == kNoEdge)
        return std::nullopt;
    return static_cast<DfaState>(to);
}

bool DfaTable::isAccepting(DfaState state) const
{
    return states_[idx(state)].accepting;
}

TokenKind DfaTable::acceptKind(DfaState state) const
{
    return states_[idx(state)].kind;
}

std::optional<LexError> DfaTable::stallError(DfaState state) const
{
    return states_[idx(state)].stallError;
}

CharClass DfaTable::classify(char c)
{
    if (c == 'e' || c == 'E')
        return CharClass::ExpLetter;
    if (isLetter(c))
        return CharClass::Letter;
    if (isDigit(c))
        return CharClass::Digit;
    if (isBlank(c))
        return CharClass::Blank;
    if (isNewline(c))
        return CharClass::Newline;

    switch (c)
    {
        case '_':
            return CharClass::Underscore;
        case '\'':
            return CharClass::Quote;
        case '+':
            return CharClass::Plus;
        case '-':
            return CharClass::Minus;
        case '*':
            return CharClass::Star;
        case '/':
            return CharClass::Slash;
        case '=':
            return CharClass::Equal;
        case '<':
            return CharClass::Less;
        case '>':
            return CharClass::Greater;
        case ':':
            return CharClass::Colon;
        case ';':
            return CharClass::Semicolon;
        case ',':
            return CharClass::Comma;
        case '.':
            return CharClass::Dot;
        case '(':
            return CharClass::LParen;
        case ')':
            return CharClass::RParen;
        case '[':
            return CharClass::LBracket;
        case ']':
            return CharClass::RBracket;
        case '{':
            return CharClass::LBrace;
        case '}':
            return CharClass::RBrace;
        default:
            return CharClass::Other;
    }
}

const char *dfaStateName(DfaState state)
{
    switch (state)
    {
        case DfaState::Start:
            return "Start";
        case DfaState::Whitespace:
            return "Whitespace";
        case DfaState::Ident:
            return "Ident";
        case DfaState::Int:
            return "Int";
        case DfaState::IntDot:
            return "IntDot";
        case DfaState::Real:
            return "Real";
        case DfaState::Exp:
            return "Exp";
        case DfaState::ExpSign:
            return "ExpSign";
        case DfaState::RealExp:
            return "RealExp";
        case DfaState::StrOpen:
            return "StrOpen";
        case DfaState::StrOne:
            return "StrOne";
        case DfaState::StrMany:
            return "StrMany";
        case DfaState::EmptyStrClose:
            return "EmptyStrClose";
        case DfaState::CharClose:
            return "CharClose";
        case DfaState::StrClose:
            return "StrClose";
        case DfaState::BraceComment:
            return "BraceComment";
        case DfaState::ParenComment:
            return "ParenComment";
        case DfaState::ParenCommentStar:
            return "ParenCommentStar";
        case DfaState::CommentDone:
            return "CommentDone";
        case DfaState::Colon:
            return "Colon";
        case DfaState::Assign:
            return "Assign";
        case DfaState::Less:
            return "Less";
        case DfaState::LessEqual:
            return "LessEqual";
        case DfaState::NotEqual:
            return "NotEqual";
        case DfaState::Greater:
            return "Greater";
        case DfaState::GreaterEqual:
            return "GreaterEqual";
        case DfaState::Dot:
            return "Dot";
        case DfaState::DotDot:
            return "DotDot";
        case DfaState::Plus:
            return "Plus";
        case DfaState::Minus:
            return "Minus";
        case DfaState::Star:
            return "Star";
        case DfaState::Slash:
            return "Slash";
        case DfaState::Equal:
            return "Equal";
        case DfaState::Semicolon:
            return "Semicolon";
        case DfaState::Comma:
            return "Comma";
        case DfaState::LParen:
            return "LParen";
        case DfaState::RParen:
            return "RParen";
        case DfaState::LBracket:
            return "LBracket";
        case DfaState::RBracket:
            return "RBracket";
        case DfaState::Count:
            break;
    }
    return "?";
}

//===----------------------------------------------------------------------===//
// Keywords
//===----------------------------------------------------------------------===//

std::optional<TokenKind> lookupKeyword(std::string_view canonical)
{
    return common::keyword_table::lookupKeywordBinary(kKeywordTable, canonical);
}

const char *vernacularSpelling(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::KwAnd:
            return "dan";
        case TokenKind::KwArray:
            return "larik";
        case TokenKind::KwBegin:
            return "mulai";
        case TokenKind::KwConst:
            return "konstanta";
        case TokenKind::KwDiv:
            return "bagi";
        case TokenKind::KwDo:
            return "lakukan";
        case TokenKind::KwDownto:
            return "turun_ke";
        case TokenKind::KwElse:
            return "selain_itu";
        case TokenKind::KwEnd:
            return "selesai";
        case TokenKind::KwFor:
            return "untuk";
        case TokenKind::KwFunction:
            return "fungsi";
        case TokenKind::KwIf:
            return "jika";
        case TokenKind::KwMod:
            return "mod";
        case TokenKind::KwNot:
            return "tidak";
        case TokenKind::KwOf:
            return "dari";
        case TokenKind::KwOr:
            return "atau";
        case TokenKind::KwProcedure:
            return "prosedur";
        case TokenKind::KwProgram:
            return "program";
        case TokenKind::KwThen:
            return "maka";
        case TokenKind::KwTo:
            return "ke";
        case TokenKind::KwType:
            return "tipe";
        case TokenKind::KwVar:
            return "variabel";
        case TokenKind::KwWhile:
            return "selama";
        default:
            return nullptr;
    }
}

} // namespace dwipa::frontends::pascal
