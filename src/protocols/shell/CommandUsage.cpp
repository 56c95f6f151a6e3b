#include "protocols/shell/CommandUsage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace mds::shell {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0, n = s.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(s[i])) && s[i] != '\n') ++i;

        if (i < n && s[i] == '\n') {
            out.emplace_back("");
            ++i;
            continue;
        }

        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp >= i) break_pos = sp;
        }

        if (break_pos == i) break_pos = end;

        out.push_back(trimRight(s.substr(i, break_pos - i)));

        if (break_pos < n && s[break_pos] == ' ') i = break_pos + 1;
        else i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

void emitWrapped(std::ostringstream& out, const std::string& text, std::size_t indent, int width) {
    for (const auto& ln : wrap(text, width - static_cast<int>(indent)))
        out << std::string(indent, ' ') << ln << "\n";
}

std::string keyFor(const Entry& it) {
    if (it.aliases.empty()) return it.label;
    return fmt::format("{} | {}", it.label, fmt::join(it.aliases, " | "));
}

std::size_t computeKeyWidth(const std::vector<Entry>& items, std::size_t cap) {
    std::size_t w = 0;
    for (const auto& it : items) w = std::max(w, keyFor(it).size());
    return std::min(w, cap);
}

std::string padRight(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out,
                       const std::string& title,
                       const std::vector<Entry>& items,
                       std::size_t indent, std::size_t gap, int width,
                       std::size_t max_key_col) {
    if (items.empty()) return;
    out << title << "\n";

    const auto keyw = computeKeyWidth(items, max_key_col);
    const int rightw = width - static_cast<int>(indent + keyw + gap);

    for (const auto& it : items) {
        const auto desc_lines = wrap(it.desc, std::max(20, rightw));
        out << std::string(indent, ' ') << padRight(keyFor(it), keyw) << std::string(gap, ' ');
        out << desc_lines[0] << "\n";
        for (std::size_t i = 1; i < desc_lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << desc_lines[i] << "\n";
    }
    out << "\n";
}

std::string stripDashes(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

}

std::string CommandUsage::normalizePositional_(const std::string& s) {
    if (s.find('<') != std::string::npos || s.find('[') != std::string::npos) return s;
    return fmt::format("<{}>", s);
}

std::string CommandUsage::bracketizeIfNeeded_(const std::string& s) {
    if (s.find('[') != std::string::npos) return s;
    return fmt::format("[{}]", s);
}

std::string CommandUsage::buildSynopsis_() const {
    if (synopsis) return *synopsis;

    std::ostringstream syn;
    syn << "mdsync " << command;
    for (const auto& p : positionals) syn << " " << normalizePositional_(p.label);
    for (const auto& o : optional)    syn << " " << bracketizeIfNeeded_(o.label);
    return syn.str();
}

std::unordered_set<std::string> CommandUsage::switches() const {
    std::unordered_set<std::string> out;
    for (const auto& o : optional) {
        if (o.label.find('<') != std::string::npos) continue;
        out.insert(stripDashes(o.label));
        for (const auto& a : o.aliases) out.insert(stripDashes(a));
    }
    return out;
}

std::string CommandUsage::str() const {
    const int tw = term_width > 40 ? term_width : 100;
    constexpr std::size_t indent = 2;
    constexpr std::size_t gap = 2;

    std::ostringstream out;

    emitTwoColSection(out, "Arguments:", positionals, indent, gap, tw, max_key_col);
    emitTwoColSection(out, "Options:", optional, indent, gap, tw, max_key_col);

    if (!examples.empty()) {
        out << "Examples:\n";
        for (const auto& ex : examples) {
            emitWrapped(out, fmt::format("$ {}", ex.cmd), indent, tw);
            if (!ex.note.empty()) emitWrapped(out, ex.note, indent + 2, tw);
            out << "\n";
        }
    }

    return basicStr(true) + out.str();
}

std::string CommandUsage::basicStr(const bool splitHeader) const {
    const int tw = term_width > 40 ? term_width : 100;

    std::ostringstream out;
    out << command;
    if (!command_aliases.empty()) out << " (" << fmt::format("{}", fmt::join(command_aliases, ", ")) << ")";
    if (!description.empty()) out << " - " << description;
    out << "\n";

    if (splitHeader) out << "\n";
    out << "Usage:";
    emitWrapped(out, buildSynopsis_(), 1, tw);
    out << "\n";

    return out.str();
}

std::string CommandBook::str() const {
    std::ostringstream out;
    if (!title.empty()) out << title << "\n\n";
    for (std::size_t i = 0; i < commands.size(); ++i) {
        out << commands[i].str();
        if (i + 1 < commands.size()) out << "\n";
    }
    return out.str();
}

std::string CommandBook::basicStr() const {
    std::ostringstream out;
    if (!title.empty()) out << title << "\n\n";
    for (const auto& c : commands) out << c.basicStr();
    return out.str();
}

}
