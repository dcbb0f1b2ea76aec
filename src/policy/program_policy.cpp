#include "policy/program_policy.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace execpolicy::policy {

using protocol::ArgKind;
using protocol::ExecCall;
using protocol::MatchedArg;
using protocol::MatchedExec;
using protocol::MatchedFlag;
using protocol::PositionalArg;
using protocol::ValidExec;

namespace {

constexpr const char* kEndOfOptions = "--";

// Positional patterns split around the (optional) single vararg matcher.
struct PartitionedPatterns {
    std::vector<ArgMatcher> prefix;
    std::optional<ArgMatcher> vararg;
    std::vector<ArgMatcher> suffix;
};

core::errors::Result<PartitionedPatterns, MatchError> partition_patterns(
    const std::string& program, const std::vector<ArgMatcher>& patterns) {
    PartitionedPatterns partitioned;
    for (const auto& pattern : patterns) {
        if (is_vararg(pattern)) {
            if (partitioned.vararg.has_value()) {
                return MatchError{
                    MultipleVarargPatterns{program, *partitioned.vararg, pattern}};
            }
            partitioned.vararg = pattern;
        } else if (partitioned.vararg.has_value()) {
            partitioned.suffix.push_back(pattern);
        } else {
            partitioned.prefix.push_back(pattern);
        }
    }
    return partitioned;
}

// Binds one argument to one single-slot matcher.
std::optional<MatchError> bind_arg(const ArgMatcher& pattern,
                                   const PositionalArg& arg,
                                   std::vector<MatchedArg>& matched) {
    const auto type = arg_type(pattern);
    if (!type.has_value()) {
        return std::nullopt;
    }
    switch (type->kind) {
        case ArgKind::Literal:
            if (arg.value != type->literal) {
                return MatchError{LiteralValueDidNotMatch{type->literal, arg.value}};
            }
            break;
        case ArgKind::ReadableFile:
        case ArgKind::WriteableFile:
            if (arg.value.empty()) {
                return MatchError{EmptyFileName{}};
            }
            break;
    }
    matched.push_back(MatchedArg{arg.index, *type, arg.value});
    return std::nullopt;
}

std::vector<ArgMatcher> patterns_from(const PartitionedPatterns& partitioned,
                                      const std::size_t prefix_offset,
                                      const bool include_vararg,
                                      const std::size_t suffix_offset) {
    std::vector<ArgMatcher> remaining(partitioned.prefix.begin() + prefix_offset,
                                      partitioned.prefix.end());
    if (include_vararg && partitioned.vararg.has_value()) {
        remaining.push_back(*partitioned.vararg);
    }
    remaining.insert(remaining.end(), partitioned.suffix.begin() + suffix_offset,
                     partitioned.suffix.end());
    return remaining;
}

}  // namespace

ProgramPolicy::ProgramPolicy(std::string program,
                             const std::vector<ArgMatcher>& patterns,
                             std::vector<std::string> system_path)
    : program_(std::move(program)), system_path_(std::move(system_path)) {
    for (const auto& pattern : patterns) {
        if (const auto* flag = std::get_if<FlagMatcher>(&pattern)) {
            add_flag(flag->name);
        } else {
            arg_patterns_.push_back(pattern);
        }
    }
}

void ProgramPolicy::add_flag(const std::string& flag) {
    if (!has_flag(flag)) {
        flags_.push_back(flag);
    }
}

void ProgramPolicy::add_should_match(std::vector<std::string> args) {
    should_match_.push_back(std::move(args));
}

void ProgramPolicy::add_should_not_match(std::vector<std::string> args) {
    should_not_match_.push_back(std::move(args));
}

bool ProgramPolicy::has_flag(const std::string& flag) const {
    return std::find(flags_.begin(), flags_.end(), flag) != flags_.end();
}

core::errors::Result<MatchedExec, MatchError> ProgramPolicy::check(
    const ExecCall& call) const {
    ValidExec exec;
    exec.program = program_;
    exec.system_path = system_path_;

    // 1. Flags come out first, wherever they sit among the positionals. The
    //    first "--" is recorded as a flag and ends option processing.
    std::vector<PositionalArg> positional;
    bool options_ended = false;
    for (std::size_t i = 0; i < call.args.size(); ++i) {
        const std::string& arg = call.args[i];
        if (!options_ended && arg == kEndOfOptions) {
            options_ended = true;
            exec.flags.push_back(MatchedFlag{arg});
            continue;
        }
        if (!options_ended && has_flag(arg)) {
            exec.flags.push_back(MatchedFlag{arg});
            continue;
        }
        if (!options_ended && arg.size() > 1 && arg[0] == '-') {
            return MatchError{UnknownOption{program_, arg}};
        }
        positional.push_back(PositionalArg{i, arg});
    }

    // 2. Positional walk: prefix, vararg, suffix.
    auto partition_result = partition_patterns(program_, arg_patterns_);
    if (core::errors::is_error(partition_result)) {
        return core::errors::get_error(partition_result);
    }
    const auto& partitioned = core::errors::get_value(partition_result);

    std::size_t cursor = 0;
    for (std::size_t p = 0; p < partitioned.prefix.size(); ++p) {
        if (cursor >= positional.size()) {
            return MatchError{NotEnoughArgs{program_, positional,
                                            patterns_from(partitioned, p, true, 0)}};
        }
        if (auto error = bind_arg(partitioned.prefix[p], positional[cursor], exec.args)) {
            return *error;
        }
        ++cursor;
    }

    const std::size_t reserved_tail = partitioned.suffix.size();
    if (partitioned.vararg.has_value()) {
        const std::size_t available = positional.size() - cursor;
        if (available < reserved_tail) {
            return MatchError{NotEnoughArgs{
                program_, positional,
                patterns_from(partitioned, partitioned.prefix.size(), true, 0)}};
        }
        const std::size_t vararg_count = available - reserved_tail;
        if (vararg_count == 0) {
            return MatchError{
                VarargMatcherDidNotMatchAnything{program_, *partitioned.vararg}};
        }
        for (std::size_t n = 0; n < vararg_count; ++n) {
            if (auto error = bind_arg(*partitioned.vararg, positional[cursor], exec.args)) {
                return *error;
            }
            ++cursor;
        }
    }

    for (std::size_t s = 0; s < partitioned.suffix.size(); ++s) {
        if (cursor >= positional.size()) {
            return MatchError{NotEnoughArgs{
                program_, positional,
                patterns_from(partitioned, partitioned.prefix.size(), false, s)}};
        }
        if (auto error = bind_arg(partitioned.suffix[s], positional[cursor], exec.args)) {
            return *error;
        }
        ++cursor;
    }

    // 3. Nothing may be left unaccounted for.
    if (cursor < positional.size()) {
        return MatchError{UnexpectedArguments{
            program_, std::vector<PositionalArg>(positional.begin() + cursor,
                                                 positional.end())}};
    }

    return MatchedExec{std::move(exec)};
}

}  // namespace execpolicy::policy
