#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace mds::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    out.push_back({TokenType::Flag, std::move(k)});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// "-p/home/me/notes" carries its value glued on; "-fp" is a bundle of switches.
inline bool looks_glued_value(std::string_view tail) {
    return std::ranges::any_of(tail, [](char c) { return c == '/' || c == '.' || c == ':' || c == '=' || c == '~'; });
}

inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// argv already arrives split and unquoted by the shell, so each element is one atom.
// The first element is always the command word, even when it starts with dashes.
inline std::vector<Token> tokenizeArgs(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    bool stop_flags = false;
    for (const auto& a : args) {
        if (out.empty() || stop_flags || a.size() < 2 || a[0] != '-' || looks_negative_number(a)) {
            pushWord(out, a);
            continue;
        }

        if (a == "--") {
            stop_flags = true;
            pushWord(out, a);
            continue;
        }

        if (a.starts_with("--")) {
            const auto eq = a.find('=');
            if (eq == std::string::npos) pushFlag(out, a.substr(2));
            else {
                pushFlag(out, a.substr(2, eq - 2));
                pushWord(out, a.substr(eq + 1));
            }
            continue;
        }

        if (a.size() == 2) {
            pushFlag(out, a.substr(1));
            continue;
        }

        const std::string_view tail = std::string_view(a).substr(2);
        if (looks_glued_value(tail)) {
            pushFlag(out, std::string(1, a[1]));
            pushWord(out, std::string(tail.starts_with('=') ? tail.substr(1) : tail));
        } else {
            expand_bundle(std::string_view(a).substr(1), out);
        }
    }

    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

inline std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    out.reserve(64 + tokens.size() * 16);
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
