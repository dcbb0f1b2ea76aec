#include "report/check_report.hpp"

#include "core/visit/overloaded.hpp"

namespace execpolicy::report {

using core::overloaded;
using nlohmann::json;

namespace {

json positional_args_to_json(const std::vector<protocol::PositionalArg>& args) {
    json payload = json::array();
    for (const auto& arg : args) {
        payload.push_back(json{{"index", arg.index}, {"value", arg.value}});
    }
    return payload;
}

json matchers_to_json(const std::vector<policy::ArgMatcher>& matchers) {
    json payload = json::array();
    for (const auto& matcher : matchers) {
        payload.push_back(to_json(matcher));
    }
    return payload;
}

}  // namespace

CheckVerdict classify(const CheckOutcome& outcome) {
    if (core::errors::is_error(outcome)) {
        return CheckVerdict::Unverified;
    }
    return core::errors::get_value(outcome).exec.might_write_files() ? CheckVerdict::Match
                                                                     : CheckVerdict::Safe;
}

json to_json(const policy::ArgMatcher& matcher) {
    return std::visit(
        overloaded{
            [](const policy::LiteralMatcher& m) {
                return json{{"type", "literal"}, {"value", m.value}};
            },
            [](const policy::ReadableFileMatcher&) { return json{{"type", "readable_file"}}; },
            [](const policy::WriteableFileMatcher&) { return json{{"type", "writeable_file"}}; },
            [](const policy::ReadableFilesMatcher&) { return json{{"type", "readable_files"}}; },
            [](const policy::FlagMatcher& m) {
                return json{{"type", "flag"}, {"name", m.name}};
            },
        },
        matcher);
}

json to_json(const protocol::MatchedArg& arg) {
    json payload;
    payload["index"] = arg.index;
    payload["type"] = protocol::to_string(arg.type.kind);
    if (arg.type.kind == protocol::ArgKind::Literal) {
        payload["literal"] = arg.type.literal;
    }
    payload["value"] = arg.value;
    return payload;
}

json to_json(const protocol::ValidExec& exec) {
    json payload;
    payload["program"] = exec.program;
    payload["args"] = json::array();
    for (const auto& arg : exec.args) {
        payload["args"].push_back(to_json(arg));
    }
    payload["flags"] = json::array();
    for (const auto& flag : exec.flags) {
        payload["flags"].push_back(flag.name);
    }
    payload["system_path"] = exec.system_path;
    return payload;
}

json to_json(const policy::MatchError& error) {
    json payload = std::visit(
        overloaded{
            [](const policy::NotEnoughArgs& e) {
                return json{{"program", e.program},
                            {"args", positional_args_to_json(e.args)},
                            {"arg_patterns", matchers_to_json(e.arg_patterns)}};
            },
            [](const policy::VarargMatcherDidNotMatchAnything& e) {
                return json{{"program", e.program}, {"matcher", to_json(e.matcher)}};
            },
            [](const policy::LiteralValueDidNotMatch& e) {
                return json{{"expected", e.expected}, {"actual", e.actual}};
            },
            [](const policy::UnexpectedArguments& e) {
                return json{{"program", e.program}, {"args", positional_args_to_json(e.args)}};
            },
            [](const policy::EmptyFileName&) { return json::object(); },
            [](const policy::UnknownOption& e) {
                return json{{"program", e.program}, {"option", e.option}};
            },
            [](const policy::MultipleVarargPatterns& e) {
                return json{{"program", e.program},
                            {"first", to_json(e.first)},
                            {"second", to_json(e.second)}};
            },
            [](const policy::NoPolicyForProgram& e) { return json{{"program", e.program}}; },
        },
        error);
    payload["type"] = policy::error_code(error);
    payload["message"] = policy::describe(error);
    return payload;
}

json to_json(const policy::ExampleViolation& violation) {
    json payload;
    payload["program"] = violation.program;
    payload["args"] = violation.args;
    payload["expected"] = violation.expected_match ? "match" : "no_match";
    payload["detail"] = violation.detail;
    return payload;
}

json build_report(const CheckOutcome& outcome) {
    json report;
    report["result"] = to_string(classify(outcome));
    if (core::errors::is_error(outcome)) {
        report["error"] = to_json(core::errors::get_error(outcome));
    } else {
        report["match"] = to_json(core::errors::get_value(outcome).exec);
    }
    return report;
}

}  // namespace execpolicy::report
