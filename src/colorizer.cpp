#include "colorizer.hpp"
#include <regex>
#include <vector>

namespace mcp_tap {

namespace {

const char* kReset = "\x1b[0m";
const char* kDim = "\x1b[2m";
const char* kRed = "\x1b[31m";

// Tokens are found by plain scanning: std::regex recurses once per character
// on unbounded repeats and overflows the stack on long lines.
struct Token {
    std::size_t begin;
    std::size_t end;
};

bool is_word(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool word_start(const std::string& s, std::size_t pos) {
    return pos == 0 || !is_word(s[pos - 1]);
}

enum class Tail {
    None,       // the literal alone
    WordEnd,    // \b after the literal
    Word,       // \w*
    NonSpace    // \S+
};

struct Pass {
    std::string literal;   // empty for the digit patterns
    bool word_before;      // \b before the literal
    Tail tail;
    std::string open;
    bool first_only;
    bool (*scan)(const std::string&, std::size_t, Token&);   // overrides literal matching
};

bool find_literal(const std::string& line, std::size_t from, const Pass& pass, Token& tok) {
    for (std::size_t p = line.find(pass.literal, from); p != std::string::npos;
         p = line.find(pass.literal, p + 1)) {
        if (pass.word_before && !word_start(line, p)) continue;

        std::size_t end = p + pass.literal.size();
        switch (pass.tail) {
            case Tail::None:
                break;
            case Tail::WordEnd:
                if (end < line.size() && is_word(line[end])) continue;
                break;
            case Tail::Word:
                while (end < line.size() && is_word(line[end])) ++end;
                break;
            case Tail::NonSpace: {
                std::size_t start = end;
                while (end < line.size() && !is_space(line[end])) ++end;
                if (end == start) continue;
                break;
            }
        }

        tok = {p, end};
        return true;
    }
    return false;
}

// #<digits>
bool scan_id(const std::string& line, std::size_t from, Token& tok) {
    for (std::size_t p = line.find('#', from); p != std::string::npos; p = line.find('#', p + 1)) {
        std::size_t end = p + 1;
        while (end < line.size() && is_digit(line[end])) ++end;
        if (end > p + 1) {
            tok = {p, end};
            return true;
        }
    }
    return false;
}

// <digits>ms
bool scan_elapsed(const std::string& line, std::size_t from, Token& tok) {
    std::size_t i = from;
    while (i < line.size()) {
        if (!is_digit(line[i])) {
            ++i;
            continue;
        }
        std::size_t end = i;
        while (end < line.size() && is_digit(line[end])) ++end;
        if (line.compare(end, 2, "ms") == 0) {
            tok = {i, end + 2};
            return true;
        }
        i = end;
    }
    return false;
}

const std::vector<Pass>& passes() {
    static const std::vector<Pass> table = {
        {"→ CLIENT", false, Tail::None, "\x1b[36m\x1b[1m", false, nullptr},
        {"← SERVER", false, Tail::None, "\x1b[32m\x1b[1m", false, nullptr},
        {"ERROR", true, Tail::WordEnd, "\x1b[31m\x1b[1m", false, nullptr},
        {"notification", true, Tail::WordEnd, "\x1b[34m", true, nullptr},
        {"request", true, Tail::WordEnd, "\x1b[37m", true, nullptr},
        {"response", true, Tail::WordEnd, "\x1b[37m", true, nullptr},
        // Method families, each its own pass so markers can stack
        {"initialize", true, Tail::Word, "\x1b[35m", false, nullptr},
        {"tools/", true, Tail::NonSpace, "\x1b[32m", false, nullptr},
        {"resources/", true, Tail::NonSpace, "\x1b[36m", false, nullptr},
        {"prompts/", true, Tail::NonSpace, "\x1b[33m", false, nullptr},
        {"notifications/", true, Tail::NonSpace, "\x1b[34m", false, nullptr},
        {"", false, Tail::None, "\x1b[2m", false, scan_id},
        {"", false, Tail::None, "\x1b[2m", false, scan_elapsed},
    };
    return table;
}

std::string apply(const std::string& line, const Pass& pass) {
    std::string out;
    std::size_t pos = 0;
    Token tok{};

    while (pos <= line.size()) {
        bool found = pass.scan ? pass.scan(line, pos, tok) : find_literal(line, pos, pass, tok);
        if (!found) break;

        out.append(line, pos, tok.begin - pos);
        out += pass.open;
        out.append(line, tok.begin, tok.end - tok.begin);
        out += kReset;
        pos = tok.end;

        if (pass.first_only) break;
    }

    if (pos < line.size()) {
        out.append(line, pos, std::string::npos);
    }
    return out;
}

// Leading HH:MM:SS.mmm
bool has_timestamp(const std::string& line) {
    static const std::regex ts(R"(\d{2}:\d{2}:\d{2}\.\d{3})");
    return line.size() >= 12 && std::regex_match(line.begin(), line.begin() + 12, ts);
}

// ^\s+\[[-\d]+\]
bool is_error_detail(const std::string& line) {
    std::size_t i = 0;
    while (i < line.size() && is_space(line[i])) ++i;
    if (i == 0 || i >= line.size() || line[i] != '[') return false;

    std::size_t start = ++i;
    while (i < line.size() && (is_digit(line[i]) || line[i] == '-')) ++i;
    return i > start && i < line.size() && line[i] == ']';
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

std::string colorize(std::string line, bool enabled) {
    if (!enabled) return line;

    if (has_timestamp(line)) {
        line = kDim + line.substr(0, 12) + kReset + line.substr(12);
    }

    for (const auto& pass : passes()) {
        line = mcp_tap::apply(line, pass);
    }

    if (starts_with(line, "    ")) {
        line = kDim + line + kReset;
    }

    if (starts_with(line, kStderrPrefix)) {
        line = kDim + line + kReset;
    }

    if (is_error_detail(line)) {
        line = kRed + line + kReset;
    }

    return line;
}

} // namespace mcp_tap
