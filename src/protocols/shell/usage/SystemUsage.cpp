#include "protocols/shell/usage/SystemUsage.hpp"

using namespace mds::shell;

CommandUsage SystemUsage::help() {
    CommandUsage cmd;
    cmd.command = "help";
    cmd.command_aliases = {"h", "?", "--help", "-h"};
    cmd.description = "Show help information about commands.";
    cmd.positionals = {{"[command]", "Optional command name to get detailed help"}};
    cmd.synopsis = "mdsync help [command]";
    cmd.examples.push_back({"mdsync help", "List every command."});
    cmd.examples.push_back({"mdsync help init", "Show detailed help for 'init'."});
    return cmd;
}

CommandUsage SystemUsage::version() {
    CommandUsage cmd;
    cmd.command = "version";
    cmd.command_aliases = {"v", "--version", "-v"};
    cmd.description = "Show the mdsync version.";
    return cmd;
}
