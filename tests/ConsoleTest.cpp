#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include "core/Config.h"
#include "core/Console.h"
#include "TestUtils.h"

namespace {

class ConsoleTest : public ::testing::Test {
protected:
    void SetUp() override {
        writeFile(songs.path / "100 Artist - Song" / "a.osu", chartText("Song", "Artist", "Mapper", "A", 1, 100));
        writeFile(songs.path / "100 Artist - Song (copy)" / "a.osu", chartText("Song", "Artist", "Mapper", "A", 1, 100));
        writeFile(songs.path / "200 Other - Tune" / "b.osu", chartText("Tune", "Other", "Someone", "B", 2, 200));

        configPath = (data.path / "config.ini").string();
        writeFile(configPath, "[General]\ncachePath=" + (data.path / "beatmaps.idx").string() + "\n");
    }

    bool init(Console& console) {
        std::vector<std::string> args = {"beatmap-locator", "--config", configPath, songs.path.string()};
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(&arg[0]);
        return console.init((int)argv.size(), argv.data());
    }

    // Output produced by one command
    std::string run(Console& console, const std::string& line) {
        out.str("");
        EXPECT_TRUE(console.execute(line)) << line;
        return out.str();
    }

    TempDir songs;
    TempDir data;
    std::string configPath;
    std::istringstream in;
    std::ostringstream out;
};

} // anonymous namespace

TEST_F(ConsoleTest, ListFindAndCheck) {
    Console console(in, out);
    ASSERT_TRUE(init(console));
    EXPECT_TRUE(fs::exists(data.path / "beatmaps.idx"));

    std::string listed = run(console, "list");
    EXPECT_NE(listed.find("total: 3"), std::string::npos) << listed;

    std::string found = run(console, "find name=tune");
    EXPECT_NE(found.find("Other"), std::string::npos) << found;
    EXPECT_NE(found.find("total: 1"), std::string::npos) << found;

    std::string rejected = run(console, "find title=tune");
    EXPECT_NE(rejected.find("QueryError"), std::string::npos) << rejected;

    std::string checked = run(console, "check");
    EXPECT_NE(checked.find("total: 1 groups, 2 folders"), std::string::npos) << checked;

    EXPECT_FALSE(console.execute("exit"));
}

TEST_F(ConsoleTest, SongsPathIsSaved) {
    Console console(in, out);
    ASSERT_TRUE(init(console));

    Settings saved;
    ASSERT_TRUE(Config::load(configPath, saved));
    EXPECT_EQ(saved.songsPath, songs.path.string());
    EXPECT_EQ(saved.cachePath, (data.path / "beatmaps.idx").string());
}

TEST_F(ConsoleTest, PathCommandRejectsMissingFolder) {
    Console console(in, out);
    ASSERT_TRUE(init(console));

    std::string output = run(console, "path " + (songs.path / "missing").string());
    EXPECT_NE(output.find("RootPathInvalid"), std::string::npos) << output;

    std::string listed = run(console, "list");
    EXPECT_NE(listed.find("total: 3"), std::string::npos) << listed;
}

TEST_F(ConsoleTest, UnknownCommandShowsHelp) {
    Console console(in, out);
    ASSERT_TRUE(init(console));

    std::string output = run(console, "frobnicate");
    EXPECT_NE(output.find("unknown command"), std::string::npos);
    EXPECT_NE(output.find("find [sid|name|artist|creator=]"), std::string::npos);
}
