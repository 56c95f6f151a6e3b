#pragma once

#include "protocols/shell/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mds::shell {

CommandResult invalid(std::string msg);
CommandResult invalid(const std::string& help, std::string msg);
CommandResult ok(std::string out);
CommandResult failed(std::string msg);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

// Removes "--config <file>" / "--config=<file>" from argv and returns the file.
std::optional<std::filesystem::path> takeConfigOption(std::vector<std::string>& args);

}
