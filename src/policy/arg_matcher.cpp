#include "policy/arg_matcher.hpp"

#include "core/visit/overloaded.hpp"

namespace execpolicy::policy {

using core::overloaded;
using protocol::ArgType;

namespace {

std::string quote(const std::string& value) {
    std::string quoted = "\"";
    for (const char c : value) {
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace

Cardinality cardinality(const ArgMatcher& matcher) {
    return std::visit(
        overloaded{
            [](const LiteralMatcher&) { return Cardinality::One; },
            [](const ReadableFileMatcher&) { return Cardinality::One; },
            [](const WriteableFileMatcher&) { return Cardinality::One; },
            [](const ReadableFilesMatcher&) { return Cardinality::AtLeastOne; },
            [](const FlagMatcher&) { return Cardinality::None; },
        },
        matcher);
}

std::optional<ArgType> arg_type(const ArgMatcher& matcher) {
    return std::visit(
        overloaded{
            [](const LiteralMatcher& m) -> std::optional<ArgType> {
                return ArgType::literal_value(m.value);
            },
            [](const ReadableFileMatcher&) -> std::optional<ArgType> {
                return ArgType::readable_file();
            },
            [](const WriteableFileMatcher&) -> std::optional<ArgType> {
                return ArgType::writeable_file();
            },
            [](const ReadableFilesMatcher&) -> std::optional<ArgType> {
                return ArgType::readable_file();
            },
            [](const FlagMatcher&) -> std::optional<ArgType> { return std::nullopt; },
        },
        matcher);
}

std::string to_string(const ArgMatcher& matcher) {
    return std::visit(
        overloaded{
            [](const LiteralMatcher& m) { return quote(m.value); },
            [](const ReadableFileMatcher&) { return std::string("ARG_RFILE"); },
            [](const WriteableFileMatcher&) { return std::string("ARG_WFILE"); },
            [](const ReadableFilesMatcher&) { return std::string("ARG_RFILES"); },
            [](const FlagMatcher& m) { return "flag(" + quote(m.name) + ")"; },
        },
        matcher);
}

std::optional<ArgMatcher> matcher_from_identifier(const std::string& identifier) {
    if (identifier == "ARG_RFILE") {
        return ArgMatcher{ReadableFileMatcher{}};
    }
    if (identifier == "ARG_WFILE") {
        return ArgMatcher{WriteableFileMatcher{}};
    }
    if (identifier == "ARG_RFILES") {
        return ArgMatcher{ReadableFilesMatcher{}};
    }
    return std::nullopt;
}

}  // namespace execpolicy::policy
