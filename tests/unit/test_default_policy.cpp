#include <future>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/engine_errors.hpp"
#include "policy/arg_matcher.hpp"
#include "policy/default_policy.hpp"
#include "policy/match_errors.hpp"
#include "protocol/exec_call.hpp"

namespace {

using execpolicy::core::errors::get_error;
using execpolicy::core::errors::get_value;
using execpolicy::core::errors::is_error;
using execpolicy::policy::ArgMatcher;
using execpolicy::policy::default_policy;
using execpolicy::policy::load_default_policy;
using execpolicy::policy::MatchError;
using execpolicy::policy::NotEnoughArgs;
using execpolicy::policy::Policy;
using execpolicy::policy::ReadableFilesMatcher;
using execpolicy::policy::UnexpectedArguments;
using execpolicy::policy::UnknownOption;
using execpolicy::policy::VarargMatcherDidNotMatchAnything;
using execpolicy::policy::WriteableFileMatcher;
using execpolicy::protocol::ArgType;
using execpolicy::protocol::ExecCall;
using execpolicy::protocol::MatchedArg;
using execpolicy::protocol::MatchedExec;
using execpolicy::protocol::MatchedFlag;
using execpolicy::protocol::PositionalArg;
using execpolicy::protocol::ValidExec;

const std::vector<std::string> kCpPaths = {"/bin/cp", "/usr/bin/cp"};
const std::vector<std::string> kPwdPaths = {"/bin/pwd", "/usr/bin/pwd"};

Policy setup() {
    auto loaded = load_default_policy();
    EXPECT_FALSE(is_error(loaded));
    return get_value(loaded);
}

ValidExec pwd_exec(std::vector<MatchedFlag> flags) {
    ValidExec exec;
    exec.program = "pwd";
    exec.flags = std::move(flags);
    exec.system_path = kPwdPaths;
    return exec;
}

TEST(DefaultPolicyTest, LoadsBuiltInPrograms) {
    const auto policy = setup();
    for (const char* program : {"pwd", "cp", "cat", "head", "tail", "wc", "cmp", "true",
                                "false", "whoami"}) {
        EXPECT_TRUE(policy.contains(program)) << program;
    }
}

TEST(DefaultPolicyTest, EmbeddedExamplesHold) {
    const auto violations = setup().check_examples();
    for (const auto& violation : violations) {
        ADD_FAILURE() << violation.program << ": " << violation.detail;
    }
    EXPECT_TRUE(violations.empty());
}

TEST(DefaultPolicyTest, CachedPolicyIsSharedAndEquivalent) {
    const Policy& first = default_policy();
    const Policy& second = default_policy();
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.programs(), setup().programs());
}

TEST(DefaultPolicyTest, CachedPolicyServesConcurrentChecks) {
    const Policy& policy = default_policy();
    std::vector<std::future<bool>> jobs;
    for (int i = 0; i < 8; ++i) {
        jobs.push_back(std::async(std::launch::async, [&policy]() {
            bool all_matched = true;
            for (int j = 0; j < 200; ++j) {
                all_matched = all_matched &&
                              !is_error(policy.check(ExecCall{"cp", {"a", "b", "dest"}}));
            }
            return all_matched;
        }));
    }
    for (auto& job : jobs) {
        EXPECT_TRUE(job.get());
    }
}

TEST(CpPolicyTest, NoArgs) {
    const auto policy = setup();
    const std::vector<ArgMatcher> patterns = {ReadableFilesMatcher{}, WriteableFileMatcher{}};
    auto result = policy.check(ExecCall{"cp", {}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result), MatchError(NotEnoughArgs{"cp", {}, patterns}));
}

TEST(CpPolicyTest, OneArg) {
    auto result = setup().check(ExecCall{"cp", {"foo/bar"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result),
              MatchError(VarargMatcherDidNotMatchAnything{"cp", ReadableFilesMatcher{}}));
}

TEST(CpPolicyTest, OneFile) {
    auto result = setup().check(ExecCall{"cp", {"foo/bar", "../baz"}});
    ASSERT_FALSE(is_error(result));

    ValidExec expected;
    expected.program = "cp";
    expected.args = {
        MatchedArg{0, ArgType::readable_file(), "foo/bar"},
        MatchedArg{1, ArgType::writeable_file(), "../baz"},
    };
    expected.system_path = kCpPaths;
    EXPECT_EQ(get_value(result), MatchedExec{expected});
}

TEST(CpPolicyTest, MultipleFiles) {
    auto result = setup().check(ExecCall{"cp", {"foo", "bar", "baz"}});
    ASSERT_FALSE(is_error(result));

    ValidExec expected;
    expected.program = "cp";
    expected.args = {
        MatchedArg{0, ArgType::readable_file(), "foo"},
        MatchedArg{1, ArgType::readable_file(), "bar"},
        MatchedArg{2, ArgType::writeable_file(), "baz"},
    };
    expected.system_path = kCpPaths;
    EXPECT_EQ(get_value(result), MatchedExec{expected});
}

TEST(CpPolicyTest, RecursiveFlagBetweenSources) {
    auto result = setup().check(ExecCall{"cp", {"src1", "--recursive", "src2", "dest"}});
    ASSERT_FALSE(is_error(result));
    const auto& exec = get_value(result).exec;
    const std::vector<MatchedArg> expected = {
        MatchedArg{0, ArgType::readable_file(), "src1"},
        MatchedArg{2, ArgType::readable_file(), "src2"},
        MatchedArg{3, ArgType::writeable_file(), "dest"},
    };
    EXPECT_EQ(exec.args, expected);
    EXPECT_EQ(exec.flags, std::vector<MatchedFlag>({MatchedFlag{"--recursive"}}));
}

TEST(CpPolicyTest, UndeclaredFlagIsRejected) {
    auto result = setup().check(ExecCall{"cp", {"-t", "/etc", "src"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result), MatchError(UnknownOption{"cp", "-t"}));
}

TEST(PwdPolicyTest, NoArgs) {
    auto result = setup().check(ExecCall{"pwd", {}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), MatchedExec{pwd_exec({})});
    EXPECT_FALSE(get_value(result).exec.might_write_files());
}

TEST(PwdPolicyTest, CapitalL) {
    auto result = setup().check(ExecCall{"pwd", {"-L"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), MatchedExec{pwd_exec({MatchedFlag{"-L"}})});
}

TEST(PwdPolicyTest, CapitalP) {
    auto result = setup().check(ExecCall{"pwd", {"-P"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), MatchedExec{pwd_exec({MatchedFlag{"-P"}})});
}

TEST(PwdPolicyTest, ExtraArgs) {
    auto result = setup().check(ExecCall{"pwd", {"foo", "bar"}});
    ASSERT_TRUE(is_error(result));
    const std::vector<PositionalArg> extra = {{0, "foo"}, {1, "bar"}};
    EXPECT_EQ(get_error(result), MatchError(UnexpectedArguments{"pwd", extra}));
}

TEST(CmpPolicyTest, TwoReadableFiles) {
    auto result = setup().check(ExecCall{"cmp", {"-s", "left", "right"}});
    ASSERT_FALSE(is_error(result));
    const auto& exec = get_value(result).exec;
    ASSERT_EQ(exec.args.size(), 2u);
    EXPECT_EQ(exec.args[0], (MatchedArg{1, ArgType::readable_file(), "left"}));
    EXPECT_EQ(exec.args[1], (MatchedArg{2, ArgType::readable_file(), "right"}));
    EXPECT_FALSE(exec.might_write_files());
}

}  // namespace
