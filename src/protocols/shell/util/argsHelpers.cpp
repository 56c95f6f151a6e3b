#include "protocols/shell/util/argsHelpers.hpp"

#include <algorithm>
#include <stdexcept>

namespace mds::shell {

CommandResult invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult invalid(const std::string& help, std::string msg) { return {2, help, std::move(msg)}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult failed(std::string msg) { return {1, "", std::move(msg)}; }

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& key : keys)
        if (auto v = optVal(c, key)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& key) { return hasFlag(c, key); });
}

std::optional<std::filesystem::path> takeConfigOption(std::vector<std::string>& args) {
    static constexpr std::string_view LONG = "--config";

    std::optional<std::filesystem::path> found;
    for (auto it = args.begin(); it != args.end();) {
        if (*it == "--") break;

        if (*it == LONG) {
            if (std::next(it) == args.end()) throw std::invalid_argument("--config requires a file argument");
            found = *std::next(it);
            it = args.erase(it, std::next(it, 2));
            continue;
        }

        if (it->starts_with("--config=")) {
            found = it->substr(LONG.size() + 1);
            it = args.erase(it);
            continue;
        }

        ++it;
    }
    return found;
}

}
