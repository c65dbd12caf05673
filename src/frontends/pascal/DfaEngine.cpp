//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/DfaEngine.cpp
// Purpose: Implements maximal munch with backtrack to the last accept.
// Key invariants: The stream is never advanced past the end of input.
// Ownership/Lifetime: Stateless apart from the borrowed table.
// Links: SPEC_FULL.md#43-dfa-engine-dfaengine
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/DfaEngine.hpp"
#include <cstdlib>
#include <iostream>

namespace dwipa::frontends::pascal
{

namespace
{

bool lexTraceFromEnv()
{
    static const bool enabled = std::getenv("DWIPA_LEX_TRACE") != nullptr;
    return enabled;
}

} // namespace

DfaEngine::DfaEngine(bool trace) : table_(DfaTable::get()), trace_(trace || lexTraceFromEnv()) {}

DfaRun DfaEngine::run(CharStream &stream) const
{
    DfaRun result;
    result.begin = stream.position();

    DfaState state = table_.start();
    std::optional<DfaState> lastAccept;
    Cursor acceptCursor = result.begin;

    while (true)
    {
        CharClass cls = DfaTable::classifyAt(stream.peek(), stream.atEnd());
        auto to = table_.next(state, cls);
        if (!to)
            break;
        stream.advance();
        state = *to;
        if (table_.isAccepting(state))
        {
            lastAccept = state;
            acceptCursor = stream.position();
        }
    }

    result.lastState = state;

    if (auto stall = table_.stallError(state))
    {
        result.status = DfaStatus::Stalled;
        result.error = *stall;
        result.end = stream.position();
    }
    else if (lastAccept)
    {
        stream.reset(acceptCursor);
        result.status = DfaStatus::Accepted;
        result.kind = table_.acceptKind(*lastAccept);
        result.lastState = *lastAccept;
        result.end = acceptCursor;
    }
    else
    {
        stream.reset(result.begin);
        result.status = DfaStatus::NoTransition;
        result.error = LexError::InvalidCharacter;
        result.end = result.begin;
    }

    if (trace_)
        traceRun(stream, result);
    return result;
}

void DfaEngine::traceRun(const CharStream &stream, const DfaRun &result) const
{
    std::cerr << "[dfa] " << stream.locAt(result.begin) << ' '
              << dfaStateName(result.lastState) << ' ';
    if (result.accepted())
        std::cerr << tokenKindToString(result.kind);
    else
        std::cerr << "error " << lexErrorToString(*result.error);
    std::cerr << " '" << stream.slice(result.begin.offset, result.end.offset) << "'\n";
}

} // namespace dwipa::frontends::pascal
