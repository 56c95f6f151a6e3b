#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace mds::shell {

// A labeled option or positional. Labels without "<value>" are switches.
struct Entry {
    std::string label;                  // e.g. "--backend <drive|mount>"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-b"}
};

struct Example {
    std::string cmd;
    std::string note;
};

class CommandUsage {
public:
    std::string command;
    std::vector<std::string> command_aliases;
    std::string description;
    std::optional<std::string> synopsis;         // if empty, synthesized

    std::vector<Entry> positionals;
    std::vector<Entry> optional;

    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 30;

    // Full help: header, usage, options and examples
    [[nodiscard]] std::string str() const;

    // Header and usage line only
    [[nodiscard]] std::string basicStr(bool splitHeader = false) const;

    // Flag names (no dashes, aliases included) that never take a value.
    [[nodiscard]] std::unordered_set<std::string> switches() const;

    [[nodiscard]] std::string primary() const { return command; }

private:
    [[nodiscard]] std::string buildSynopsis_() const;
    [[nodiscard]] static std::string normalizePositional_(const std::string& s);
    [[nodiscard]] static std::string bracketizeIfNeeded_(const std::string& s);
};

class CommandBook {
public:
    std::string title;
    std::vector<CommandUsage> commands;

    [[nodiscard]] std::string str() const;
    [[nodiscard]] std::string basicStr() const;
};

}
