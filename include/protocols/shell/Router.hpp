#pragma once

#include "protocols/shell/types.hpp"
#include "protocols/shell/CommandUsage.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mds::shell {

class Router {
public:
    void registerCommand(const CommandUsage& usage, CommandHandler handler);

    // argv without the program name
    CommandResult execute(const std::vector<std::string>& args) const;

    [[nodiscard]] const CommandBook& book() const { return book_; }

    [[nodiscard]] const CommandUsage* usageFor(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::unordered_set<std::string> switches_;
    CommandBook book_{"mdsync - keep a Markdown folder and a .docx collection in sync", {}};

    CommandResult dispatch(CommandCall call) const;

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string normalize_alias(const std::string& s);
    static std::string strip_leading_dashes(const std::string& s);
};

}
