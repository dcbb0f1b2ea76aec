#include "policy/default_policy.hpp"

#include <stdexcept>
#include "core/logging/logger.hpp"

namespace execpolicy::policy {

namespace {

constexpr const char* kDefaultPolicy = R"PDL(
# Built-in policy for common low-risk utilities.
#
# ARG_RFILE   one file the program reads
# ARG_WFILE   one file the program writes
# ARG_RFILES  one or more files the program reads

define_program(
    program="pwd",
    options=[flag("-L"), flag("-P")],
    system_path=["/bin/pwd", "/usr/bin/pwd"],
    should_match=[[], ["-L"], ["-P"]],
    should_not_match=[["foo"], ["-x"]],
)

define_program(
    program="cp",
    options=[flag("-r"), flag("-R"), flag("--recursive")],
    args=[ARG_RFILES, ARG_WFILE],
    system_path=["/bin/cp", "/usr/bin/cp"],
    should_match=[["foo", "bar"], ["-r", "src", "dest"], ["a", "b", "dir"]],
    should_not_match=[[], ["foo"], ["-f", "foo", "bar"]],
)

define_program(
    program="cat",
    options=[flag("-b"), flag("-n"), flag("-s"), flag("-u"), flag("-v"),
             flag("-A"), flag("-E"), flag("-T")],
    args=[ARG_RFILES],
    system_path=["/bin/cat", "/usr/bin/cat"],
    should_match=[["README.md"], ["-n", "a.txt", "b.txt"]],
    should_not_match=[[]],
)

define_program(
    program="head",
    options=[flag("-q"), flag("-v")],
    args=[ARG_RFILES],
    system_path=["/usr/bin/head"],
    should_match=[["README.md"], ["-q", "a.txt", "b.txt"]],
    should_not_match=[[], ["-n", "5", "a.txt"]],
)

define_program(
    program="tail",
    options=[flag("-q"), flag("-v")],
    args=[ARG_RFILES],
    system_path=["/usr/bin/tail"],
    should_match=[["log.txt"]],
    should_not_match=[[], ["-f", "log.txt"]],
)

define_program(
    program="wc",
    options=[flag("-c"), flag("-l"), flag("-m"), flag("-w")],
    args=[ARG_RFILES],
    system_path=["/usr/bin/wc"],
    should_match=[["-l", "main.cpp"], ["a", "b"]],
    should_not_match=[[]],
)

define_program(
    program="cmp",
    options=[flag("-l"), flag("-s")],
    args=[ARG_RFILE, ARG_RFILE],
    system_path=["/usr/bin/cmp"],
    should_match=[["a", "b"], ["-s", "a", "b"]],
    should_not_match=[["a"], ["a", "b", "c"]],
)

define_program(
    program="true",
    system_path=["/bin/true", "/usr/bin/true"],
    should_match=[[]],
    should_not_match=[["x"]],
)

define_program(
    program="false",
    system_path=["/bin/false", "/usr/bin/false"],
    should_match=[[]],
    should_not_match=[["x"]],
)

define_program(
    program="whoami",
    system_path=["/usr/bin/whoami"],
    should_match=[[]],
    should_not_match=[["root"]],
)
)PDL";

}  // namespace

const std::string& default_policy_source() {
    static const std::string source(kDefaultPolicy);
    return source;
}

core::errors::Result<Policy, ParseError> load_default_policy() {
    return load_policy(kDefaultPolicySourceName, default_policy_source());
}

const Policy& default_policy() {
    static const Policy policy = [] {
        auto loaded = load_default_policy();
        if (core::errors::is_error(loaded)) {
            const auto& err = core::errors::get_error(loaded);
            EXECPOLICY_LOG_ERROR("Embedded policy failed to parse [" + err.code + "]: " +
                                 to_string(err));
            throw std::logic_error("Embedded default policy is malformed: " + to_string(err));
        }
        Policy parsed = core::errors::get_value(loaded);
        EXECPOLICY_LOG_DEBUG("Loaded default policy with " + std::to_string(parsed.size()) +
                             " programs");
        return parsed;
    }();
    return policy;
}

}  // namespace execpolicy::policy
