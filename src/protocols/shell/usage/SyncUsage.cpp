#include "protocols/shell/usage/SyncUsage.hpp"

using namespace mds::shell;

CommandUsage SyncUsage::init() {
    CommandUsage cmd;
    cmd.command = "init";
    cmd.description = "Start tracking a local Markdown folder against a remote .docx collection.";
    cmd.positionals = {
        {"<local-path>", "Existing local folder holding the .md documents"},
        {"<remote>", "Drive folder name (found or created), or a mounted directory with --backend mount"}
    };
    cmd.optional = {
        {"--backend <drive|mount>", "Remote store to use (default: drive)", {"-b"}},
        {"--force", "Overwrite an existing sync config in <local-path>", {"-f"}},
        {"--init-git", "Also run 'git init' in <local-path>; failures only warn"}
    };
    cmd.examples.push_back({"mdsync init ~/notes Notes", "Track ~/notes against the Drive folder 'Notes'."});
    cmd.examples.push_back({"mdsync init ~/notes ~/gdrive/Notes --backend mount",
                            "Use a locally mounted Drive folder instead of the API."});
    return cmd;
}

CommandUsage SyncUsage::update() {
    CommandUsage cmd;
    cmd.command = "update";
    cmd.command_aliases = {"sync", "u"};
    cmd.description = "Push newer local documents, then pull newer remote documents.";
    cmd.optional = {
        {"--path <dir>", "Tracked folder (default: current directory)", {"-p"}},
        {"--json", "Print the run report as JSON"},
    };
    cmd.examples.push_back({"mdsync update", "Sync the folder you are in."});
    cmd.examples.push_back({"mdsync update --path ~/notes", "Sync ~/notes from anywhere."});
    return cmd;
}

CommandUsage SyncUsage::status() {
    CommandUsage cmd;
    cmd.command = "status";
    cmd.command_aliases = {"st"};
    cmd.description = "Show the tracked documents and their last sync times.";
    cmd.optional = {
        {"--path <dir>", "Tracked folder (default: current directory)", {"-p"}},
    };
    cmd.examples.push_back({"mdsync status -p ~/notes", ""});
    return cmd;
}
