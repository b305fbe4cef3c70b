#include "policy/command_validator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace shellbench::policy {

using core::errors::BenchError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::CommandBatch;

namespace {

struct Token {
    bool is_operator = false;
    std::string text;  // words: quotes removed; operators: raw
    bool quoted = false;
    std::size_t begin = 0;
    std::size_t end = 0;

    bool is_empty_quoted() const { return !is_operator && quoted && text.empty(); }
};

struct Segment {
    std::vector<Token> words;
    std::vector<Token> redirect_targets;
};

bool is_operator_char(const char c) {
    return c == '|' || c == '&' || c == ';' || c == '<' || c == '>';
}

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && is_space(value[begin])) {
        ++begin;
    }
    while (end > begin && is_space(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

// Splits a command into shell words and operator runs. Returns false on an
// unterminated quote.
bool tokenize(const std::string& command, std::vector<Token>& tokens) {
    const std::size_t n = command.size();
    std::size_t i = 0;
    while (i < n) {
        const char c = command[i];
        if (is_space(c)) {
            ++i;
            continue;
        }

        Token token;
        token.begin = i;
        if (is_operator_char(c)) {
            token.is_operator = true;
            while (i < n && is_operator_char(command[i])) {
                token.text.push_back(command[i++]);
            }
            token.end = i;
            tokens.push_back(std::move(token));
            continue;
        }

        while (i < n && !is_space(command[i]) && !is_operator_char(command[i])) {
            const char ch = command[i];
            if (ch == '\'') {
                const std::size_t close = command.find('\'', i + 1);
                if (close == std::string::npos) {
                    return false;
                }
                token.quoted = true;
                token.text.append(command, i + 1, close - i - 1);
                i = close + 1;
                continue;
            }
            if (ch == '"') {
                token.quoted = true;
                ++i;
                bool closed = false;
                while (i < n) {
                    if (command[i] == '\\' && i + 1 < n) {
                        token.text.push_back(command[i + 1]);
                        i += 2;
                        continue;
                    }
                    if (command[i] == '"') {
                        closed = true;
                        ++i;
                        break;
                    }
                    token.text.push_back(command[i++]);
                }
                if (!closed) {
                    return false;
                }
                continue;
            }
            if (ch == '\\') {
                if (i + 1 < n) {
                    token.quoted = true;
                    token.text.push_back(command[i + 1]);
                }
                i += 2;
                continue;
            }
            token.text.push_back(ch);
            ++i;
        }
        token.end = std::min(i, n);
        tokens.push_back(std::move(token));
    }
    return true;
}

bool is_segment_separator(const std::string& op) {
    return op == "|" || op == "||" || op == "&&";
}

bool is_redirection(const std::string& op) {
    return op == ">" || op == ">>" || op == "<" || op == ">&" || op == "&>" ||
           op == "&>>" || op == ">|";
}

bool has_parent_segment(const std::string& text) {
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t slash = text.find('/', start);
        const std::size_t stop = slash == std::string::npos ? text.size() : slash;
        if (text.compare(start, stop - start, "..") == 0 && stop - start == 2) {
            return true;
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return false;
}

bool is_absolute_reference(const std::string& text) {
    return (!text.empty() && text.front() == '/') ||
           text.find("=/") != std::string::npos;
}

// A quoted argument can be re-parsed by a nested shell, so leading `~` counts
// whether or not it was quoted.
bool is_home_reference(const std::string& text) {
    return (!text.empty() && text.front() == '~') ||
           text.find("$HOME") != std::string::npos ||
           text.find("${HOME}") != std::string::npos;
}

// Whitespace-separated pieces of a word; a quoted word may hold a whole
// command line for `bash -c` or an interpreter.
std::vector<std::string> split_pieces(const std::string& text) {
    std::vector<std::string> pieces;
    std::string piece;
    for (const char c : text) {
        if (is_space(c)) {
            if (!piece.empty()) {
                pieces.push_back(std::move(piece));
                piece.clear();
            }
            continue;
        }
        piece.push_back(c);
    }
    if (!piece.empty()) {
        pieces.push_back(std::move(piece));
    }
    return pieces;
}

// `&` that is neither half of `&&` nor part of a `>&`/`&>` redirection.
bool has_background_ampersand(const std::string& text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            continue;
        }
        const char before = i > 0 ? text[i - 1] : '\0';
        const char after = i + 1 < text.size() ? text[i + 1] : '\0';
        if (before == '&' || after == '&' || before == '>' || after == '>') {
            continue;
        }
        return true;
    }
    return false;
}

BenchError unsafe(const std::string& message, const std::string& code,
                  const std::string& hint = "") {
    return BenchError{ErrorCategory::Policy, message, code, hint};
}

BenchError malformed(const std::string& message, const std::string& code,
                     const std::string& hint = "") {
    return BenchError{ErrorCategory::Input, message, code, hint};
}

std::string allowed_list_hint(const CommandPolicy& policy) {
    std::string hint = "Allowed:";
    for (const auto& name : policy.allowed_commands) {
        hint += " " + name;
    }
    return hint;
}

}  // namespace

std::optional<std::vector<std::string>> split_shell_words(const std::string& command) {
    std::vector<Token> tokens;
    if (!tokenize(command, tokens)) {
        return std::nullopt;
    }
    std::vector<std::string> words;
    words.reserve(tokens.size());
    for (auto& token : tokens) {
        words.push_back(std::move(token.text));
    }
    return words;
}

CommandValidator::CommandValidator(const core::config::HostPlatform host_platform,
                                   const std::size_t max_commands,
                                   CommandPolicy command_policy)
    : host_platform_(host_platform),
      max_commands_(max_commands),
      command_policy_(std::move(command_policy)) {}

core::errors::Result<CommandBatch> CommandValidator::parse_action(
    const std::string& action_text) const {
    const json action = json::parse(action_text, nullptr, false);
    if (action.is_discarded()) {
        return malformed("Invalid JSON in action.", "invalid_json",
                         "Send {\"commands\": [...], \"time_estimate\": <seconds>}.");
    }
    return parse_action(action);
}

core::errors::Result<CommandBatch> CommandValidator::parse_action(
    const json& action) const {
    if (action.is_string()) {
        return parse_action(action.get<std::string>());
    }
    if (!action.is_object()) {
        return malformed("Action must be an object or a JSON string.",
                         "invalid_action_shape");
    }
    if (!action.contains("commands")) {
        return malformed("Action must contain 'commands' field.", "missing_field");
    }
    if (!action.contains("time_estimate")) {
        return malformed("Action must contain 'time_estimate' field.",
                         "missing_field");
    }

    const json& commands = action.at("commands");
    if (!commands.is_array()) {
        return malformed("'commands' must be a list.", "invalid_field_type");
    }
    const json& time_estimate = action.at("time_estimate");
    if (!time_estimate.is_number()) {
        return malformed("'time_estimate' must be a number.", "invalid_field_type");
    }
    if (commands.size() > max_commands_) {
        return malformed("Too many commands: " + std::to_string(commands.size()) +
                             " > " + std::to_string(max_commands_),
                         "too_many_commands");
    }

    const double estimate = time_estimate.get<double>();
    if (!std::isfinite(estimate) || estimate <= 0.0) {
        return malformed("'time_estimate' must be a positive number of seconds.",
                         "invalid_time_estimate");
    }

    CommandBatch batch;
    batch.time_estimate = estimate;
    batch.commands.reserve(commands.size());
    for (const auto& entry : commands) {
        if (!entry.is_string()) {
            return malformed("Command must be a string, got " +
                                 std::string(entry.type_name()) + ".",
                             "invalid_field_type");
        }
        auto validated = validate_command(entry.get<std::string>());
        if (core::errors::is_error(validated)) {
            const auto& err = core::errors::get_error(validated);
            LOG_WARN("CommandValidator: rejected [" + err.code + "]: " + err.message);
            return err;
        }
        batch.commands.push_back(core::errors::get_value(validated));
    }
    return batch;
}

core::errors::Result<std::string> CommandValidator::validate_command(
    const std::string& raw_command) const {
    const std::string command = trim(raw_command);
    if (command.empty()) {
        return malformed("Empty command.", "empty_command");
    }

    if (command.find('\n') != std::string::npos ||
        command.find('\r') != std::string::npos) {
        return unsafe("Command contains an embedded newline.", "newline_in_command");
    }
    if (command.find('`') != std::string::npos) {
        return unsafe("Command contains unsafe operator: `", "command_substitution");
    }
    if (command.find("$(") != std::string::npos) {
        return unsafe("Command contains unsafe operator: $(", "command_substitution");
    }

    std::vector<Token> tokens;
    if (!tokenize(command, tokens)) {
        return unsafe("Command has an unterminated quote.", "unterminated_quote");
    }

    // Split into pipeline / && / || segments.
    std::vector<Segment> segments(1);
    bool expect_redirect_target = false;
    for (const auto& token : tokens) {
        if (!token.is_operator) {
            if (expect_redirect_target) {
                segments.back().redirect_targets.push_back(token);
                expect_redirect_target = false;
            } else {
                segments.back().words.push_back(token);
            }
            continue;
        }

        const std::string& op = token.text;
        if (expect_redirect_target) {
            return unsafe("Redirection without a target near '" + op + "'.",
                          "dangling_operator");
        }
        if (op.find("<<") != std::string::npos) {
            return unsafe("Heredoc markers are not allowed: " + op, "heredoc");
        }
        if (op.find(';') != std::string::npos) {
            return unsafe("Command contains unsafe operator: ;", "command_chaining");
        }
        if (is_segment_separator(op)) {
            segments.emplace_back();
            continue;
        }
        if (is_redirection(op)) {
            expect_redirect_target = true;
            continue;
        }
        if (op.find('&') != std::string::npos) {
            return unsafe("Background execution (&) not allowed.",
                          "background_execution");
        }
        return unsafe("Unsupported shell operator: " + op, "unsupported_operator");
    }
    if (expect_redirect_target) {
        return unsafe("Redirection without a target.", "dangling_operator");
    }

    const bool compound = segments.size() > 1;
    for (const auto& segment : segments) {
        if (segment.words.empty()) {
            return unsafe("Operator without a command.", "dangling_operator");
        }

        const std::string& tool = segment.words.front().text;
        if (command_policy_.allowed_commands.count(tool) == 0) {
            return unsafe("Unsafe command: " + tool, "command_not_allowed",
                          allowed_list_hint(command_policy_));
        }

        const bool text_tool = command_policy_.text_processing_commands.count(tool) > 0;
        const bool absolute_exempt = command_policy_.absolute_path_exempt.count(tool) > 0;
        const bool standalone = !compound && segment.redirect_targets.empty();
        const bool parent_exempt =
            command_policy_.parent_path_exempt.count(tool) > 0 &&
            (tool != "cd" || standalone);

        for (std::size_t i = 1; i < segment.words.size(); ++i) {
            const Token& word = segment.words[i];
            if (word.text.find(';') != std::string::npos && !text_tool) {
                return unsafe("';' is only allowed inside a text-processing pattern: " +
                                  word.text,
                              "command_chaining");
            }
            if (word.quoted && text_tool) {
                continue;
            }
            if (has_background_ampersand(word.text)) {
                return unsafe("Background execution (&) not allowed: " + word.text,
                              "background_execution");
            }
            for (const auto& piece : split_pieces(word.text)) {
                if (is_home_reference(piece) && !absolute_exempt) {
                    return unsafe("Command uses home directory: " + word.text,
                                  "home_directory");
                }
                if (is_absolute_reference(piece) && !absolute_exempt) {
                    return unsafe("Command uses absolute path: " + word.text,
                                  "absolute_path");
                }
                if (has_parent_segment(piece) && !parent_exempt) {
                    return unsafe("Command contains path traversal: " + word.text,
                                  "path_traversal");
                }
            }
        }

        for (const auto& target : segment.redirect_targets) {
            if (is_home_reference(target.text)) {
                return unsafe("Redirection uses home directory: " + target.text,
                              "home_directory");
            }
            if (is_absolute_reference(target.text)) {
                return unsafe("Redirection uses absolute path: " + target.text,
                              "absolute_path");
            }
            if (has_parent_segment(target.text)) {
                return unsafe("Redirection contains path traversal: " + target.text,
                              "path_traversal");
            }
        }
    }

    return normalize_in_place_edit(command);
}

std::string CommandValidator::normalize_in_place_edit(const std::string& command) const {
    std::vector<Token> tokens;
    if (!tokenize(command, tokens)) {
        return command;
    }

    // (position, erase length, insertion)
    std::vector<std::pair<std::pair<std::size_t, std::size_t>, std::string>> edits;
    bool at_segment_start = true;
    bool in_sed = false;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (token.is_operator) {
            if (is_segment_separator(token.text)) {
                at_segment_start = true;
                in_sed = false;
            }
            continue;
        }
        if (at_segment_start) {
            in_sed = token.text == "sed";
            at_segment_start = false;
            continue;
        }
        if (!in_sed || token.quoted || token.text != "-i") {
            continue;
        }

        const bool has_empty_suffix =
            i + 1 < tokens.size() && tokens[i + 1].is_empty_quoted();
        if (host_platform_ == core::config::HostPlatform::Gnu && has_empty_suffix) {
            edits.push_back({{token.end, tokens[i + 1].end - token.end}, ""});
        } else if (host_platform_ == core::config::HostPlatform::Bsd &&
                   !has_empty_suffix) {
            edits.push_back({{token.end, 0}, " ''"});
        }
    }

    std::string normalized = command;
    for (auto it = edits.rbegin(); it != edits.rend(); ++it) {
        normalized.replace(it->first.first, it->first.second, it->second);
    }
    return normalized;
}

}  // namespace shellbench::policy
