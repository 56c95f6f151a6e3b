#include <gtest/gtest.h>

#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Table.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/commands.hpp"
#include "protocols/shell/usage/SyncUsage.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "runtime/Context.hpp"

using namespace mds;
using namespace mds::shell;

TEST(TokenizerTest, LongFlagsWithInlineValuesAreSplit) {
    const auto toks = tokenizeArgs({"init", "My Notes", "Notes", "--backend=mount", "-f", "-p~/notes"});

    ASSERT_EQ(toks.size(), 8u);
    EXPECT_EQ(to_string(toks[0]), "Word(init)");
    EXPECT_EQ(to_string(toks[1]), "Word(My Notes)");
    EXPECT_EQ(to_string(toks[3]), "Flag(backend)");
    EXPECT_EQ(to_string(toks[4]), "Word(mount)");
    EXPECT_EQ(to_string(toks[5]), "Flag(f)");
    EXPECT_EQ(to_string(toks[6]), "Flag(p)");
    EXPECT_EQ(to_string(toks[7]), "Word(~/notes)");
}

TEST(TokenizerTest, NegativeNumbersAreWords) {
    const auto toks = tokenizeArgs({"status", "-12"});
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(to_string(toks[1]), "Word(-12)");
}

TEST(TokenizerTest, ArgvElementsStayWhole) {
    const auto toks = tokenizeArgs({"update", "--path", "/home/me/My Notes", "-fp", "--", "--literal"});

    ASSERT_EQ(toks.size(), 7u);
    EXPECT_EQ(to_string(toks[2]), "Word(/home/me/My Notes)");
    EXPECT_EQ(to_string(toks[3]), "Flag(f)");
    EXPECT_EQ(to_string(toks[4]), "Flag(p)");
    EXPECT_EQ(to_string(toks[6]), "Word(--literal)");
}

TEST(ParserTest, SwitchesDoNotSwallowPositionals) {
    const auto call = parseTokens(tokenizeArgs({"init", "--force", "notes", "Notes", "--backend", "mount"}),
                                  SyncUsage::init().switches());

    EXPECT_EQ(call.name, "init");
    ASSERT_EQ(call.positionals.size(), 2u);
    EXPECT_EQ(call.positionals[0], "notes");
    EXPECT_EQ(call.positionals[1], "Notes");
    EXPECT_TRUE(hasFlag(call, "force"));
    EXPECT_EQ(optVal(call, "backend"), "mount");
}

TEST(ParserTest, DoubleDashEndsOptions) {
    const auto call = parseTokens(tokenizeArgs({"status", "--", "--weird-dir"}));
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "--weird-dir");
    EXPECT_TRUE(call.options.empty());
}

TEST(ArgsHelpersTest, ConfigOptionIsExtractedFromArgv) {
    std::vector<std::string> args{"--config", "/etc/mdsync.yaml", "update", "-p", "x"};
    EXPECT_EQ(takeConfigOption(args), std::filesystem::path("/etc/mdsync.yaml"));
    EXPECT_EQ(args, (std::vector<std::string>{"update", "-p", "x"}));

    std::vector<std::string> inline_{"status", "--config=/tmp/c.yaml"};
    EXPECT_EQ(takeConfigOption(inline_), std::filesystem::path("/tmp/c.yaml"));
    EXPECT_EQ(inline_.size(), 1u);

    std::vector<std::string> dangling{"update", "--config"};
    EXPECT_THROW(takeConfigOption(dangling), std::invalid_argument);
}

class RouterTest : public ::testing::Test {
protected:
    runtime::Context ctx;
    std::shared_ptr<Router> router = std::make_shared<Router>();

    void SetUp() override { registerAllCommands(router, ctx); }
};

TEST_F(RouterTest, VersionAndAliases) {
    const auto res = router->execute({"--version"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("mdsync v"), std::string::npos);
    EXPECT_EQ(router->execute({"v"}).stdout_text, res.stdout_text);
}

TEST_F(RouterTest, HelpListsEveryCommand) {
    const auto res = router->execute({"help"});
    EXPECT_EQ(res.exit_code, 0);
    for (const auto* cmd : {"init", "update", "status", "help", "version"})
        EXPECT_NE(res.stdout_text.find(cmd), std::string::npos) << cmd;

    const auto detail = router->execute({"help", "init"});
    EXPECT_NE(detail.stdout_text.find("--backend"), std::string::npos);
    EXPECT_NE(detail.stdout_text.find("--init-git"), std::string::npos);
}

TEST_F(RouterTest, UnknownCommandIsAUsageError) {
    const auto res = router->execute({"frobnicate"});
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_NE(res.stderr_text.find("frobnicate"), std::string::npos);
}

TEST_F(RouterTest, InitWithWrongArityIsAUsageError) {
    const auto res = router->execute({"init", "only-one"});
    EXPECT_EQ(res.exit_code, 2);
}

TEST_F(RouterTest, InitWithUnknownBackendIsAUsageError) {
    const auto res = router->execute({"init", "a", "b", "--backend", "ftp"});
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_NE(res.stderr_text.find("ftp"), std::string::npos);
}

TEST_F(RouterTest, UpdateOnMissingDirectoryFails) {
    const auto res = router->execute({"update", "--path", "/nonexistent/mdsync/dir"});
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_NE(res.stderr_text.find("update:"), std::string::npos);
}

TEST(TableTest, LongCellsAreClampedInTheMiddle) {
    Table table({
        {"NAME", Align::Left, 4, 12, true, true},
        {"SIZE", Align::Right, 4}
    }, 80);
    table.add_row({"a-rather-long-document-name.md", "42"});
    table.add_row({"b.md", "7"});

    const auto out = table.render();
    EXPECT_NE(out.find("NAME"), std::string::npos);
    EXPECT_NE(out.find("a-ra...me.md"), std::string::npos);
    EXPECT_EQ(out.find("a-rather-long"), std::string::npos);
    EXPECT_NE(out.find("b.md"), std::string::npos);
    EXPECT_NE(out.find("  42\n"), std::string::npos);
}
