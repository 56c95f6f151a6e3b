#include "protocols/shell/Router.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <cctype>
#include <string>

using namespace mds::shell;

void Router::registerCommand(const CommandUsage& usage, CommandHandler handler) {
    const std::string key = normalize(usage.primary());

    CommandInfo info{usage.description.empty() ? "No description provided." : usage.description, std::move(handler), {}};

    for (const std::string& alias : usage.command_aliases) {
        const auto a = normalize_alias(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            log::Registry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                         a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    for (auto& s : usage.switches()) switches_.insert(s);

    book_.commands.push_back(usage);
    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const auto n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    const auto a = normalize_alias(nameOrAlias);
    if (aliasMap_.contains(a)) return aliasMap_.at(a);
    return n; // unknown; let caller error
}

const CommandUsage* Router::usageFor(const std::string& nameOrAlias) const {
    const auto canonical = canonicalFor(nameOrAlias);
    for (const auto& u : book_.commands)
        if (normalize(u.primary()) == canonical) return &u;
    return nullptr;
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    return dispatch(parseTokens(tokenizeArgs(args), switches_));
}

CommandResult Router::dispatch(CommandCall call) const {
    if (call.name.empty()) return invalid(book_.basicStr(), "No command provided.");

    const auto canonical = canonicalFor(call.name);
    log::Registry::shell()->debug("[Router] Executing command: '{}'", canonical);

    if (!commands_.contains(canonical))
        return invalid(book_.basicStr(), fmt::format("Unknown command: {}", call.name));

    call.name = canonical;
    return commands_.at(canonical).handler(call);
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::strip_leading_dashes(const std::string& s) {
    size_t i = 0; while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

std::string Router::normalize_alias(const std::string& s) {
    return normalize(strip_leading_dashes(s));
}
