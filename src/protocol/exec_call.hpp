#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace execpolicy::protocol {

// A candidate invocation: program name plus argv[1..].
struct ExecCall {
    std::string program;
    std::vector<std::string> args;

    ExecCall() = default;
    ExecCall(std::string program_name, std::vector<std::string> arguments)
        : program(std::move(program_name)), args(std::move(arguments)) {}
};

// One argument of an ExecCall together with its index in ExecCall::args.
struct PositionalArg {
    std::size_t index = 0;
    std::string value;
};

enum class ArgKind {
    Literal,
    ReadableFile,
    WriteableFile
};

// What a matched argument was resolved to. `literal` is only meaningful for
// ArgKind::Literal.
struct ArgType {
    ArgKind kind = ArgKind::Literal;
    std::string literal;

    static ArgType literal_value(std::string value) {
        return ArgType{ArgKind::Literal, std::move(value)};
    }
    static ArgType readable_file() { return ArgType{ArgKind::ReadableFile, ""}; }
    static ArgType writeable_file() { return ArgType{ArgKind::WriteableFile, ""}; }
};

struct MatchedArg {
    std::size_t index = 0;
    ArgType type;
    std::string value;
};

struct MatchedFlag {
    std::string name;
};

// A call that matched its program policy completely. Default state is a
// zero-argument call.
struct ValidExec {
    std::string program;
    std::vector<MatchedArg> args;
    std::vector<MatchedFlag> flags;
    // Acceptable absolute paths for `program`, for the caller to compare
    // against the binary that would actually run.
    std::vector<std::string> system_path;

    bool might_write_files() const {
        for (const auto& arg : args) {
            if (arg.type.kind == ArgKind::WriteableFile) {
                return true;
            }
        }
        return false;
    }
};

struct MatchedExec {
    ValidExec exec;
};

inline bool operator==(const PositionalArg& lhs, const PositionalArg& rhs) {
    return lhs.index == rhs.index && lhs.value == rhs.value;
}

inline bool operator==(const ArgType& lhs, const ArgType& rhs) {
    if (lhs.kind != rhs.kind) {
        return false;
    }
    return lhs.kind != ArgKind::Literal || lhs.literal == rhs.literal;
}

inline bool operator==(const MatchedArg& lhs, const MatchedArg& rhs) {
    return lhs.index == rhs.index && lhs.type == rhs.type && lhs.value == rhs.value;
}

inline bool operator==(const MatchedFlag& lhs, const MatchedFlag& rhs) {
    return lhs.name == rhs.name;
}

inline bool operator==(const ValidExec& lhs, const ValidExec& rhs) {
    return lhs.program == rhs.program && lhs.args == rhs.args &&
           lhs.flags == rhs.flags && lhs.system_path == rhs.system_path;
}

inline bool operator==(const MatchedExec& lhs, const MatchedExec& rhs) {
    return lhs.exec == rhs.exec;
}

inline std::string to_string(const ArgKind kind) {
    switch (kind) {
        case ArgKind::Literal:
            return "literal";
        case ArgKind::ReadableFile:
            return "readable_file";
        case ArgKind::WriteableFile:
            return "writeable_file";
    }
    return "unknown";
}

}  // namespace execpolicy::protocol
