#pragma once

#include <string>
#include <variant>
#include <vector>
#include "policy/arg_matcher.hpp"
#include "protocol/exec_call.hpp"

namespace execpolicy::policy {

// The call ran out of arguments while `arg_patterns` still needed some.
struct NotEnoughArgs {
    std::string program;
    std::vector<protocol::PositionalArg> args;
    std::vector<ArgMatcher> arg_patterns;
};

// A vararg matcher was left with nothing after reserving trailing slots.
struct VarargMatcherDidNotMatchAnything {
    std::string program;
    ArgMatcher matcher;
};

struct LiteralValueDidNotMatch {
    std::string expected;
    std::string actual;
};

// Positional arguments left over once every pattern was satisfied.
struct UnexpectedArguments {
    std::string program;
    std::vector<protocol::PositionalArg> args;
};

// A file-typed slot received an empty string.
struct EmptyFileName {};

// A dash-prefixed argument that is not one of the program's flags.
struct UnknownOption {
    std::string program;
    std::string option;
};

// The program's pattern list holds more than one vararg matcher.
struct MultipleVarargPatterns {
    std::string program;
    ArgMatcher first;
    ArgMatcher second;
};

// No ProgramPolicy exists for the program. Never means "safe".
struct NoPolicyForProgram {
    std::string program;
};

using MatchError = std::variant<
    NotEnoughArgs,
    VarargMatcherDidNotMatchAnything,
    LiteralValueDidNotMatch,
    UnexpectedArguments,
    EmptyFileName,
    UnknownOption,
    MultipleVarargPatterns,
    NoPolicyForProgram
>;

inline bool is_unknown_program(const MatchError& error) {
    return std::holds_alternative<NoPolicyForProgram>(error);
}

// Stable snake_case name of the error kind, e.g. "not_enough_args".
std::string error_code(const MatchError& error);

// One-line human-readable explanation.
std::string describe(const MatchError& error);

inline bool operator==(const NotEnoughArgs& lhs, const NotEnoughArgs& rhs) {
    return lhs.program == rhs.program && lhs.args == rhs.args &&
           lhs.arg_patterns == rhs.arg_patterns;
}

inline bool operator==(const VarargMatcherDidNotMatchAnything& lhs,
                       const VarargMatcherDidNotMatchAnything& rhs) {
    return lhs.program == rhs.program && lhs.matcher == rhs.matcher;
}

inline bool operator==(const LiteralValueDidNotMatch& lhs,
                       const LiteralValueDidNotMatch& rhs) {
    return lhs.expected == rhs.expected && lhs.actual == rhs.actual;
}

inline bool operator==(const UnexpectedArguments& lhs, const UnexpectedArguments& rhs) {
    return lhs.program == rhs.program && lhs.args == rhs.args;
}

inline bool operator==(const EmptyFileName&, const EmptyFileName&) { return true; }

inline bool operator==(const UnknownOption& lhs, const UnknownOption& rhs) {
    return lhs.program == rhs.program && lhs.option == rhs.option;
}

inline bool operator==(const MultipleVarargPatterns& lhs, const MultipleVarargPatterns& rhs) {
    return lhs.program == rhs.program && lhs.first == rhs.first && lhs.second == rhs.second;
}

inline bool operator==(const NoPolicyForProgram& lhs, const NoPolicyForProgram& rhs) {
    return lhs.program == rhs.program;
}

}  // namespace execpolicy::policy
