#include "policy/policy_parser.hpp"

#include <cctype>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace execpolicy::policy {

using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;
using core::errors::Result;

namespace {

enum class TokenKind {
    Identifier,
    String,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,
    Equals,
    End
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;
    std::size_t line = 1;
    std::size_t column = 1;
};

// Lists and calls may nest at most this deep inside a statement.
constexpr std::size_t kMaxNestingDepth = 32;

std::string describe_token(const Token& token) {
    switch (token.kind) {
        case TokenKind::Identifier:
            return "identifier '" + token.text + "'";
        case TokenKind::String:
            return "string \"" + token.text + "\"";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::LBracket:
            return "'['";
        case TokenKind::RBracket:
            return "']'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Equals:
            return "'='";
        case TokenKind::End:
            return "end of input";
    }
    return "unknown token";
}

class Lexer {
public:
    Lexer(const std::string& source_name, const std::string& source)
        : source_name_(source_name), source_(source) {}

    Result<std::vector<Token>, ParseError> tokenize() {
        std::vector<Token> tokens;
        while (!at_end()) {
            const char c = peek();
            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
                continue;
            }
            if (c == '#') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
                continue;
            }

            Token token;
            token.line = line_;
            token.column = column_;
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                token.kind = TokenKind::Identifier;
                while (!at_end() && (std::isalnum(static_cast<unsigned char>(peek())) ||
                                     peek() == '_')) {
                    token.text.push_back(advance());
                }
            } else if (c == '"' || c == '\'') {
                if (auto error = read_string(token)) {
                    return *error;
                }
            } else {
                switch (c) {
                    case '(':
                        token.kind = TokenKind::LParen;
                        break;
                    case ')':
                        token.kind = TokenKind::RParen;
                        break;
                    case '[':
                        token.kind = TokenKind::LBracket;
                        break;
                    case ']':
                        token.kind = TokenKind::RBracket;
                        break;
                    case ',':
                        token.kind = TokenKind::Comma;
                        break;
                    case '=':
                        token.kind = TokenKind::Equals;
                        break;
                    default:
                        return error_at(line_, column_,
                                        std::string("unexpected character '") + c + "'",
                                        "unexpected_character");
                }
                token.text.push_back(advance());
            }
            tokens.push_back(std::move(token));
        }

        Token end;
        end.kind = TokenKind::End;
        end.line = line_;
        end.column = column_;
        tokens.push_back(std::move(end));
        return tokens;
    }

private:
    bool at_end() const { return pos_ >= source_.size(); }

    char peek() const { return at_end() ? '\0' : source_[pos_]; }

    char advance() {
        const char c = source_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    ParseError error_at(const std::size_t line, const std::size_t column,
                        std::string message, std::string code) const {
        return ParseError{source_name_, line, column, std::move(message), std::move(code)};
    }

    std::optional<ParseError> read_string(Token& token) {
        token.kind = TokenKind::String;
        const char quote = advance();
        while (true) {
            if (at_end() || peek() == '\n') {
                return error_at(token.line, token.column, "unterminated string literal",
                                "unterminated_string");
            }
            const std::size_t char_line = line_;
            const std::size_t char_column = column_;
            const char c = advance();
            if (c == quote) {
                return std::nullopt;
            }
            if (c != '\\') {
                token.text.push_back(c);
                continue;
            }
            if (at_end()) {
                return error_at(token.line, token.column, "unterminated string literal",
                                "unterminated_string");
            }
            const char escaped = advance();
            switch (escaped) {
                case '\\':
                case '"':
                case '\'':
                    token.text.push_back(escaped);
                    break;
                case 'n':
                    token.text.push_back('\n');
                    break;
                case 't':
                    token.text.push_back('\t');
                    break;
                default:
                    return error_at(char_line, char_column,
                                    std::string("invalid escape sequence '\\") + escaped + "'",
                                    "invalid_escape");
            }
        }
    }

    const std::string& source_name_;
    const std::string& source_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
};

// Untyped syntax tree. Keyword arguments of a call are items with a
// non-empty `keyword`.
struct Value {
    enum class Kind { String, Identifier, List, Call };

    Kind kind = Kind::String;
    std::string text;
    std::string keyword;
    std::vector<Value> items;
    std::size_t line = 0;
    std::size_t column = 0;
};

class Parser {
public:
    Parser(const std::string& source_name, const std::vector<Token>& tokens)
        : source_name_(source_name), tokens_(tokens) {}

    Result<std::vector<Value>, ParseError> parse_statements() {
        std::vector<Value> statements;
        while (peek().kind != TokenKind::End) {
            if (peek().kind != TokenKind::Identifier) {
                return error_at(peek(), "expected a statement but found " + describe_token(peek()));
            }
            if (peek(1).kind != TokenKind::LParen) {
                return error_at(peek(1), "expected '(' after '" + peek().text + "' but found " +
                                             describe_token(peek(1)));
            }
            auto call = parse_call();
            if (is_error(call)) {
                return get_error(call);
            }
            statements.push_back(get_value(call));
        }
        return statements;
    }

private:
    const Token& peek(const std::size_t ahead = 0) const {
        const std::size_t index = pos_ + ahead;
        return index < tokens_.size() ? tokens_[index] : tokens_.back();
    }

    const Token& advance() {
        const Token& token = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return token;
    }

    ParseError error_at(const Token& token, std::string message,
                        std::string code = "syntax_error") const {
        return ParseError{source_name_, token.line, token.column, std::move(message),
                          std::move(code)};
    }

    Result<Value, ParseError> parse_value() {
        if (depth_ >= kMaxNestingDepth) {
            return error_at(peek(), "values nested deeper than " +
                                        std::to_string(kMaxNestingDepth) + " levels");
        }
        ++depth_;
        auto value = parse_nested_value();
        --depth_;
        return value;
    }

    Result<Value, ParseError> parse_nested_value() {
        const Token& token = peek();
        switch (token.kind) {
            case TokenKind::String:
            case TokenKind::Identifier: {
                if (token.kind == TokenKind::Identifier && peek(1).kind == TokenKind::LParen) {
                    return parse_call();
                }
                Value value;
                value.kind = token.kind == TokenKind::String ? Value::Kind::String
                                                             : Value::Kind::Identifier;
                value.text = token.text;
                value.line = token.line;
                value.column = token.column;
                advance();
                return value;
            }
            case TokenKind::LBracket:
                return parse_list();
            case TokenKind::LParen:
            case TokenKind::RParen:
            case TokenKind::RBracket:
            case TokenKind::Comma:
            case TokenKind::Equals:
            case TokenKind::End:
                break;
        }
        return error_at(token, "expected a value but found " + describe_token(token));
    }

    Result<Value, ParseError> parse_list() {
        const Token& open = advance();
        Value list;
        list.kind = Value::Kind::List;
        list.line = open.line;
        list.column = open.column;

        while (peek().kind != TokenKind::RBracket) {
            auto item = parse_value();
            if (is_error(item)) {
                return get_error(item);
            }
            list.items.push_back(get_value(item));

            if (peek().kind == TokenKind::Comma) {
                advance();
                continue;
            }
            if (peek().kind != TokenKind::RBracket) {
                return error_at(peek(), "expected ',' or ']' but found " + describe_token(peek()));
            }
        }
        advance();
        return list;
    }

    Result<Value, ParseError> parse_call() {
        const Token& name = advance();
        Value call;
        call.kind = Value::Kind::Call;
        call.text = name.text;
        call.line = name.line;
        call.column = name.column;
        advance();  // '('

        while (peek().kind != TokenKind::RParen) {
            std::string keyword;
            if (peek().kind == TokenKind::Identifier && peek(1).kind == TokenKind::Equals) {
                keyword = advance().text;
                advance();
            }
            auto argument = parse_value();
            if (is_error(argument)) {
                return get_error(argument);
            }
            Value item = get_value(argument);
            item.keyword = std::move(keyword);
            call.items.push_back(std::move(item));

            if (peek().kind == TokenKind::Comma) {
                advance();
                continue;
            }
            if (peek().kind != TokenKind::RParen) {
                return error_at(peek(), "expected ',' or ')' but found " + describe_token(peek()));
            }
        }
        advance();
        return call;
    }

    const std::string& source_name_;
    const std::vector<Token>& tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
};

// Turns define_program(...) calls into ProgramPolicy entries.
class PolicyBuilder {
public:
    explicit PolicyBuilder(const std::string& source_name) : source_name_(source_name) {}

    std::optional<ParseError> define(const Value& call) {
        if (call.text != "define_program") {
            return error_at(call, "unknown statement '" + call.text + "', expected define_program",
                            "unknown_statement");
        }

        std::set<std::string> seen;
        const Value* program_value = nullptr;
        std::vector<ArgMatcher> patterns;
        std::vector<std::string> system_path;
        std::vector<std::vector<std::string>> should_match;
        std::vector<std::vector<std::string>> should_not_match;

        for (const auto& item : call.items) {
            if (item.keyword.empty()) {
                return error_at(item, "define_program only takes keyword arguments",
                                "unexpected_value");
            }
            if (!seen.insert(item.keyword).second) {
                return error_at(item, "keyword '" + item.keyword + "' given more than once",
                                "duplicate_keyword");
            }

            if (item.keyword == "program") {
                if (item.kind != Value::Kind::String || item.text.empty()) {
                    return error_at(item, "program must be a non-empty string",
                                    "unexpected_value");
                }
                program_value = &item;
            } else if (item.keyword == "args") {
                if (auto error = expect_list(item, "args")) {
                    return error;
                }
                for (const auto& element : item.items) {
                    auto matcher = to_matcher(element);
                    if (is_error(matcher)) {
                        return get_error(matcher);
                    }
                    patterns.push_back(get_value(matcher));
                }
            } else if (item.keyword == "options") {
                if (auto error = expect_list(item, "options")) {
                    return error;
                }
                for (const auto& element : item.items) {
                    auto flag = to_flag(element);
                    if (is_error(flag)) {
                        return get_error(flag);
                    }
                    patterns.push_back(get_value(flag));
                }
            } else if (item.keyword == "system_path") {
                auto paths = to_string_list(item, "system_path");
                if (is_error(paths)) {
                    return get_error(paths);
                }
                system_path = get_value(paths);
            } else if (item.keyword == "should_match" || item.keyword == "should_not_match") {
                if (auto error = expect_list(item, item.keyword)) {
                    return error;
                }
                auto& examples = item.keyword == "should_match" ? should_match : should_not_match;
                for (const auto& element : item.items) {
                    auto args = to_string_list(element, item.keyword + " entry");
                    if (is_error(args)) {
                        return get_error(args);
                    }
                    examples.push_back(get_value(args));
                }
            } else {
                return error_at(item, "unknown keyword '" + item.keyword + "' in define_program",
                                "unknown_keyword");
            }
        }

        if (program_value == nullptr) {
            return error_at(call, "define_program requires program=\"...\"", "missing_program");
        }

        ProgramPolicy program_policy(program_value->text, patterns, std::move(system_path));
        for (auto& args : should_match) {
            program_policy.add_should_match(std::move(args));
        }
        for (auto& args : should_not_match) {
            program_policy.add_should_not_match(std::move(args));
        }
        if (!policy_.add(std::move(program_policy))) {
            return error_at(*program_value,
                            "program '" + program_value->text + "' is defined more than once",
                            "duplicate_program");
        }
        return std::nullopt;
    }

    Policy take() { return std::move(policy_); }

private:
    ParseError error_at(const Value& value, std::string message, std::string code) const {
        return ParseError{source_name_, value.line, value.column, std::move(message),
                          std::move(code)};
    }

    std::optional<ParseError> expect_list(const Value& value, const std::string& what) const {
        if (value.kind != Value::Kind::List) {
            return error_at(value, what + " must be a list", "unexpected_value");
        }
        return std::nullopt;
    }

    Result<std::vector<std::string>, ParseError> to_string_list(const Value& value,
                                                                const std::string& what) const {
        if (auto error = expect_list(value, what)) {
            return *error;
        }
        std::vector<std::string> strings;
        for (const auto& element : value.items) {
            if (element.kind != Value::Kind::String) {
                return error_at(element, what + " may only contain strings", "unexpected_value");
            }
            strings.push_back(element.text);
        }
        return strings;
    }

    Result<ArgMatcher, ParseError> to_flag(const Value& value) const {
        if (value.kind != Value::Kind::Call || value.text != "flag") {
            return error_at(value, "expected flag(\"...\")", "unexpected_value");
        }
        if (value.items.size() != 1 || !value.items[0].keyword.empty() ||
            value.items[0].kind != Value::Kind::String || value.items[0].text.empty()) {
            return error_at(value, "flag() takes exactly one non-empty string",
                            "unexpected_value");
        }
        return ArgMatcher{FlagMatcher{value.items[0].text}};
    }

    Result<ArgMatcher, ParseError> to_matcher(const Value& value) const {
        switch (value.kind) {
            case Value::Kind::String:
                return ArgMatcher{LiteralMatcher{value.text}};
            case Value::Kind::Identifier: {
                auto matcher = matcher_from_identifier(value.text);
                if (!matcher.has_value()) {
                    return error_at(value, "unknown matcher '" + value.text + "'",
                                    "unknown_matcher");
                }
                return *matcher;
            }
            case Value::Kind::Call:
                return to_flag(value);
            case Value::Kind::List:
                break;
        }
        return error_at(value, "expected a literal, a matcher or flag(\"...\")",
                        "unexpected_value");
    }

    const std::string& source_name_;
    Policy policy_;
};

}  // namespace

std::string to_string(const ParseError& error) {
    std::ostringstream out;
    out << error.source_name << ":";
    if (error.line > 0) {
        out << error.line << ":" << error.column << ":";
    }
    out << " " << error.message;
    return out.str();
}

PolicyParser::PolicyParser(std::string source_name, std::string source)
    : source_name_(std::move(source_name)), source_(std::move(source)) {}

Result<Policy, ParseError> PolicyParser::parse() const {
    Lexer lexer(source_name_, source_);
    auto tokens = lexer.tokenize();
    if (is_error(tokens)) {
        return get_error(tokens);
    }

    Parser parser(source_name_, get_value(tokens));
    auto statements = parser.parse_statements();
    if (is_error(statements)) {
        return get_error(statements);
    }

    PolicyBuilder builder(source_name_);
    for (const auto& statement : get_value(statements)) {
        if (auto error = builder.define(statement)) {
            return *error;
        }
    }
    return builder.take();
}

Result<Policy, ParseError> load_policy(const std::string& source_name,
                                       const std::string& source) {
    return PolicyParser(source_name, source).parse();
}

Result<Policy, ParseError> load_policy_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ParseError{path.string(), 0, 0,
                          "Unable to open policy file: " + path.string(), "unreadable_source"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return ParseError{path.string(), 0, 0,
                          "I/O error while reading policy file: " + path.string(),
                          "unreadable_source"};
    }
    return load_policy(path.string(), buffer.str());
}

}  // namespace execpolicy::policy
