#pragma once

#include <optional>
#include <string>
#include <variant>
#include "protocol/exec_call.hpp"

namespace execpolicy::policy {

// Matches one argument equal to `value`, byte for byte.
struct LiteralMatcher {
    std::string value;
};

// Matches one non-empty argument that the program will read.
struct ReadableFileMatcher {};

// Matches one non-empty argument that the program will write.
struct WriteableFileMatcher {};

// Matches one or more consecutive readable files.
struct ReadableFilesMatcher {};

// A recognized flag. Never occupies a positional slot.
struct FlagMatcher {
    std::string name;
};

using ArgMatcher = std::variant<
    LiteralMatcher,
    ReadableFileMatcher,
    WriteableFileMatcher,
    ReadableFilesMatcher,
    FlagMatcher
>;

// How many positional arguments a matcher binds.
enum class Cardinality {
    None,
    One,
    AtLeastOne
};

Cardinality cardinality(const ArgMatcher& matcher);

inline bool is_vararg(const ArgMatcher& matcher) {
    return cardinality(matcher) == Cardinality::AtLeastOne;
}

// The type a positional argument receives when bound by `matcher`.
// Empty for FlagMatcher.
std::optional<protocol::ArgType> arg_type(const ArgMatcher& matcher);

// PDL spelling: ARG_RFILE, ARG_WFILE, ARG_RFILES, "literal", flag("-x").
std::string to_string(const ArgMatcher& matcher);

// Resolves a bare PDL identifier such as ARG_RFILES.
std::optional<ArgMatcher> matcher_from_identifier(const std::string& identifier);

inline bool operator==(const LiteralMatcher& lhs, const LiteralMatcher& rhs) {
    return lhs.value == rhs.value;
}
inline bool operator==(const ReadableFileMatcher&, const ReadableFileMatcher&) { return true; }
inline bool operator==(const WriteableFileMatcher&, const WriteableFileMatcher&) { return true; }
inline bool operator==(const ReadableFilesMatcher&, const ReadableFilesMatcher&) { return true; }
inline bool operator==(const FlagMatcher& lhs, const FlagMatcher& rhs) {
    return lhs.name == rhs.name;
}

}  // namespace execpolicy::policy
