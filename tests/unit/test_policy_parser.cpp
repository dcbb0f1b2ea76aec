#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/engine_errors.hpp"
#include "policy/arg_matcher.hpp"
#include "policy/match_errors.hpp"
#include "policy/policy.hpp"
#include "policy/policy_parser.hpp"
#include "protocol/exec_call.hpp"

namespace {

using execpolicy::core::errors::get_error;
using execpolicy::core::errors::get_value;
using execpolicy::core::errors::is_error;
using execpolicy::policy::ArgMatcher;
using execpolicy::policy::LiteralMatcher;
using execpolicy::policy::LiteralValueDidNotMatch;
using execpolicy::policy::load_policy;
using execpolicy::policy::load_policy_file;
using execpolicy::policy::MatchError;
using execpolicy::policy::ParseError;
using execpolicy::policy::PolicyParser;
using execpolicy::policy::ReadableFileMatcher;
using execpolicy::policy::ReadableFilesMatcher;
using execpolicy::policy::WriteableFileMatcher;
using execpolicy::protocol::ArgType;
using execpolicy::protocol::ExecCall;
using execpolicy::protocol::MatchedArg;

ParseError parse_error_of(const std::string& source) {
    auto result = load_policy("test.policy", source);
    EXPECT_TRUE(is_error(result));
    if (!is_error(result)) {
        return ParseError{};
    }
    return get_error(result);
}

std::string unique_suffix() {
    static std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream out;
    out << std::hex << rng();
    return out.str();
}

TEST(PolicyParserTest, ParsesFullDefinition) {
    const std::string source = R"(
# cp-like program
define_program(
    program="cp",
    options=[flag("-r")],
    args=[ARG_RFILES, ARG_WFILE],
    system_path=["/bin/cp", "/usr/bin/cp"],
    should_match=[["a", "b"]],
    should_not_match=[["a"], []],
)
)";
    auto result = PolicyParser("cp.policy", source).parse();
    ASSERT_FALSE(is_error(result));

    const auto& policy = get_value(result);
    ASSERT_EQ(policy.size(), 1u);
    const auto* cp = policy.find("cp");
    ASSERT_NE(cp, nullptr);

    const std::vector<ArgMatcher> patterns = {ReadableFilesMatcher{}, WriteableFileMatcher{}};
    EXPECT_EQ(cp->arg_patterns(), patterns);
    EXPECT_EQ(cp->flags(), std::vector<std::string>({"-r"}));
    EXPECT_EQ(cp->system_path(), std::vector<std::string>({"/bin/cp", "/usr/bin/cp"}));
    ASSERT_EQ(cp->should_match().size(), 1u);
    ASSERT_EQ(cp->should_not_match().size(), 2u);
    EXPECT_TRUE(cp->should_not_match()[1].empty());
}

TEST(PolicyParserTest, TwoLevelLiteralSubcommands) {
    const std::string source = R"(
define_program(
    program="fake_executable",
    args=["subcommand", "sub-subcommand"],
)
)";
    auto result = load_policy("test_invalid_subcommand", source);
    ASSERT_FALSE(is_error(result));
    const auto& policy = get_value(result);

    auto valid = policy.check(ExecCall{"fake_executable", {"subcommand", "sub-subcommand"}});
    ASSERT_FALSE(is_error(valid));
    const std::vector<MatchedArg> expected = {
        MatchedArg{0, ArgType::literal_value("subcommand"), "subcommand"},
        MatchedArg{1, ArgType::literal_value("sub-subcommand"), "sub-subcommand"},
    };
    EXPECT_EQ(get_value(valid).exec.args, expected);
    EXPECT_TRUE(get_value(valid).exec.system_path.empty());

    auto invalid =
        policy.check(ExecCall{"fake_executable", {"subcommand", "not-a-real-subcommand"}});
    ASSERT_TRUE(is_error(invalid));
    EXPECT_EQ(get_error(invalid),
              MatchError(LiteralValueDidNotMatch{"sub-subcommand", "not-a-real-subcommand"}));
}

TEST(PolicyParserTest, FlagInsideArgsBecomesFlag) {
    auto result = load_policy("t", R"(define_program(program="ls", args=[flag("-l"), ARG_RFILE]))");
    ASSERT_FALSE(is_error(result));
    const auto* ls = get_value(result).find("ls");
    ASSERT_NE(ls, nullptr);
    EXPECT_EQ(ls->flags(), std::vector<std::string>({"-l"}));
    ASSERT_EQ(ls->arg_patterns().size(), 1u);
    EXPECT_EQ(ls->arg_patterns()[0], ArgMatcher{ReadableFileMatcher{}});
}

TEST(PolicyParserTest, SingleQuotesAndEscapes) {
    auto result = load_policy("t", "define_program(program='echo', args=['a\\'b', \"tab\\there\"])");
    ASSERT_FALSE(is_error(result));
    const auto* echo = get_value(result).find("echo");
    ASSERT_NE(echo, nullptr);
    const std::vector<ArgMatcher> patterns = {LiteralMatcher{"a'b"}, LiteralMatcher{"tab\there"}};
    EXPECT_EQ(echo->arg_patterns(), patterns);
}

TEST(PolicyParserTest, EmptySourceIsEmptyPolicy) {
    auto result = load_policy("empty", "  # nothing here\n\n");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).size(), 0u);
}

TEST(PolicyParserTest, AcceptsDuplicateVarargs) {
    auto result = load_policy("t", "define_program(program=\"x\", args=[ARG_RFILES, ARG_RFILES])");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).find("x")->arg_patterns().size(), 2u);
}

TEST(PolicyParserTest, RejectsUnknownMatcher) {
    const auto error = parse_error_of(
        "define_program(\n"
        "    program=\"x\",\n"
        "    args=[ARG_RFILE, ARG_WHATEVER],\n"
        ")\n");
    EXPECT_EQ(error.code, "unknown_matcher");
    EXPECT_EQ(error.source_name, "test.policy");
    EXPECT_EQ(error.line, 3u);
    EXPECT_EQ(error.column, 22u);
    EXPECT_NE(error.message.find("ARG_WHATEVER"), std::string::npos);
}

TEST(PolicyParserTest, RejectsDuplicateProgram) {
    const auto error = parse_error_of(
        "define_program(program=\"pwd\")\n"
        "define_program(program=\"pwd\")\n");
    EXPECT_EQ(error.code, "duplicate_program");
    EXPECT_EQ(error.line, 2u);
}

TEST(PolicyParserTest, RejectsUnknownStatement) {
    EXPECT_EQ(parse_error_of("forbid_program(program=\"rm\")").code, "unknown_statement");
}

TEST(PolicyParserTest, RejectsUnknownKeyword) {
    EXPECT_EQ(parse_error_of("define_program(program=\"x\", argz=[])").code, "unknown_keyword");
}

TEST(PolicyParserTest, RejectsRepeatedKeyword) {
    EXPECT_EQ(parse_error_of("define_program(program=\"x\", program=\"y\")").code,
              "duplicate_keyword");
}

TEST(PolicyParserTest, RequiresProgram) {
    const auto error = parse_error_of("define_program(args=[ARG_RFILE])");
    EXPECT_EQ(error.code, "missing_program");
    EXPECT_EQ(error.line, 1u);
    EXPECT_EQ(error.column, 1u);
}

TEST(PolicyParserTest, RejectsWrongValueShapes) {
    EXPECT_EQ(parse_error_of("define_program(program=pwd)").code, "unexpected_value");
    EXPECT_EQ(parse_error_of("define_program(program=\"\")").code, "unexpected_value");
    EXPECT_EQ(parse_error_of("define_program(program=\"x\", args=ARG_RFILE)").code,
              "unexpected_value");
    EXPECT_EQ(parse_error_of("define_program(program=\"x\", options=[\"-l\"])").code,
              "unexpected_value");
    EXPECT_EQ(parse_error_of("define_program(program=\"x\", system_path=[ARG_RFILE])").code,
              "unexpected_value");
    EXPECT_EQ(parse_error_of("define_program(program=\"x\", should_match=[\"a\"])").code,
              "unexpected_value");
    EXPECT_EQ(parse_error_of("define_program(\"x\")").code, "unexpected_value");
}

TEST(PolicyParserTest, RejectsStructuralSyntaxErrors) {
    EXPECT_EQ(parse_error_of("define_program(program=\"x\"").code, "syntax_error");
    EXPECT_EQ(parse_error_of("define_program program=\"x\")").code, "syntax_error");
    EXPECT_EQ(parse_error_of("define_program(program=\"x\" args=[])").code, "syntax_error");
    EXPECT_EQ(parse_error_of("define_program(program=\"x\", args=[ARG_RFILE)").code,
              "syntax_error");
    EXPECT_EQ(parse_error_of("\"x\"").code, "syntax_error");
}

TEST(PolicyParserTest, RejectsLexicalErrors) {
    const auto unterminated = parse_error_of("define_program(program=\"x)\n");
    EXPECT_EQ(unterminated.code, "unterminated_string");
    EXPECT_EQ(unterminated.line, 1u);
    EXPECT_EQ(unterminated.column, 24u);

    EXPECT_EQ(parse_error_of("define_program(program=\"a\\qb\")").code, "invalid_escape");
    EXPECT_EQ(parse_error_of("define_program(program=\"x\"; )").code, "unexpected_character");
}

TEST(PolicyParserTest, RejectsDeeplyNestedValues) {
    const std::string source = "define_program(program=\"x\", args=" + std::string(100, '[') +
                               std::string(100, ']') + ")";
    const auto error = parse_error_of(source);
    EXPECT_EQ(error.code, "syntax_error");
    EXPECT_EQ(error.line, 1u);
    EXPECT_EQ(error.column, 66u);
    EXPECT_NE(error.message.find("nested"), std::string::npos);
}

TEST(PolicyParserTest, AcceptsModestNesting) {
    auto result = load_policy("t", "define_program(program=\"x\", should_match=[[\"a\"], []])");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).find("x")->should_match().size(), 2u);
}

TEST(PolicyParserTest, ErrorStringNamesSource) {
    const auto error = parse_error_of("define_program(program=\"x\", argz=[])");
    EXPECT_EQ(to_string(error).rfind("test.policy:1:", 0), 0u);
}

class TempPolicyFile {
public:
    explicit TempPolicyFile(const std::string& content) {
        path_ = std::filesystem::temp_directory_path() /
                ("execpolicy_test_" + unique_suffix() + ".policy");
        std::ofstream out(path_);
        out << content;
    }

    ~TempPolicyFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

TEST(PolicyFileTest, LoadsPolicyFromDisk) {
    TempPolicyFile file("define_program(program=\"pwd\", options=[flag(\"-L\")])\n");
    auto result = load_policy_file(file.path());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).contains("pwd"));
}

TEST(PolicyFileTest, ParseErrorsNameTheFile) {
    TempPolicyFile file("define_program(program=\"pwd\", bogus=[])\n");
    auto result = load_policy_file(file.path());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).source_name, file.path().string());
    EXPECT_EQ(get_error(result).code, "unknown_keyword");
}

TEST(PolicyFileTest, MissingFileIsUnreadable) {
    const auto missing = std::filesystem::temp_directory_path() /
                         ("execpolicy_missing_" + unique_suffix() + ".policy");
    auto result = load_policy_file(missing);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unreadable_source");
    EXPECT_EQ(get_error(result).line, 0u);
}

}  // namespace
