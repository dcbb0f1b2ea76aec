#include "policy/match_errors.hpp"

#include <sstream>
#include "core/visit/overloaded.hpp"

namespace execpolicy::policy {

using core::overloaded;

namespace {

std::string join_patterns(const std::vector<ArgMatcher>& patterns) {
    std::ostringstream out;
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        if (i > 0) {
            out << " ";
        }
        out << to_string(patterns[i]);
    }
    return out.str();
}

std::string join_args(const std::vector<protocol::PositionalArg>& args) {
    std::ostringstream out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << "[" << args[i].index << "] \"" << args[i].value << "\"";
    }
    return out.str();
}

}  // namespace

std::string error_code(const MatchError& error) {
    return std::visit(
        overloaded{
            [](const NotEnoughArgs&) { return std::string("not_enough_args"); },
            [](const VarargMatcherDidNotMatchAnything&) {
                return std::string("vararg_matcher_did_not_match_anything");
            },
            [](const LiteralValueDidNotMatch&) {
                return std::string("literal_value_did_not_match");
            },
            [](const UnexpectedArguments&) { return std::string("unexpected_arguments"); },
            [](const EmptyFileName&) { return std::string("empty_file_name"); },
            [](const UnknownOption&) { return std::string("unknown_option"); },
            [](const MultipleVarargPatterns&) {
                return std::string("multiple_vararg_patterns");
            },
            [](const NoPolicyForProgram&) { return std::string("no_policy_for_program"); },
        },
        error);
}

std::string describe(const MatchError& error) {
    return std::visit(
        overloaded{
            [](const NotEnoughArgs& e) {
                return e.program + ": not enough arguments, still expected: " +
                       join_patterns(e.arg_patterns);
            },
            [](const VarargMatcherDidNotMatchAnything& e) {
                return e.program + ": " + to_string(e.matcher) +
                       " requires at least one argument";
            },
            [](const LiteralValueDidNotMatch& e) {
                return "expected \"" + e.expected + "\" but got \"" + e.actual + "\"";
            },
            [](const UnexpectedArguments& e) {
                return e.program + ": unexpected arguments " + join_args(e.args);
            },
            [](const EmptyFileName&) { return std::string("file argument is empty"); },
            [](const UnknownOption& e) {
                return e.program + ": unknown option \"" + e.option + "\"";
            },
            [](const MultipleVarargPatterns& e) {
                return e.program + ": policy declares more than one vararg pattern (" +
                       to_string(e.first) + ", " + to_string(e.second) + ")";
            },
            [](const NoPolicyForProgram& e) {
                return "no policy defined for program \"" + e.program + "\"";
            },
        },
        error);
}

}  // namespace execpolicy::policy
