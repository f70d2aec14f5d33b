#include <gtest/gtest.h>
#include "systems/QueryEngine.h"
#include "TestUtils.h"

namespace {

class QueryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        index.setRootPath("/beatmaps");
        index.upsert(makeSet("/beatmaps/12345 Singer - Love Song", 12345, "Love Song", "Singer", "Mapper", 2));
        index.upsert(makeSet("/beatmaps/222 Lovers - Tune", 222, "Tune", "Lovers", "Mapper"));
        index.upsert(makeSet("/beatmaps/333 Band - Anthem", 333, "Anthem", "Band", "lovemapper"));
        index.upsert(makeSet("/beatmaps/local", 0, "Untitled", "Nobody", "Me"));
    }

    std::vector<QueryMatch> run(const std::string& text) {
        Query query;
        IndexError error;
        EXPECT_TRUE(QueryEngine::parse(text, query, error)) << text << ": " << error.message;
        return QueryEngine::run(index, query).collect();
    }

    static std::vector<std::string> folders(const std::vector<QueryMatch>& matches) {
        std::vector<std::string> out;
        for (const auto& match : matches) out.push_back(match.set->folderPath);
        return out;
    }

    BeatmapIndex index;
};

} // anonymous namespace

TEST_F(QueryEngineTest, EmptyQueryReturnsEverySetOnce) {
    auto matches = run("");
    ASSERT_EQ(matches.size(), index.size());
    EXPECT_EQ(folders(matches), (std::vector<std::string>{
        "/beatmaps/12345 Singer - Love Song", "/beatmaps/222 Lovers - Tune",
        "/beatmaps/333 Band - Anthem", "/beatmaps/local"}));
    EXPECT_EQ(matches[0].charts.size(), 2u);
}

TEST_F(QueryEngineTest, BareKeywordSearchesAllTextFields) {
    auto matches = run("LOVE");
    EXPECT_EQ(folders(matches), (std::vector<std::string>{
        "/beatmaps/12345 Singer - Love Song", "/beatmaps/222 Lovers - Tune",
        "/beatmaps/333 Band - Anthem"}));
}

TEST_F(QueryEngineTest, NameMatchesTitleOnly) {
    auto matches = run("name=love");
    EXPECT_EQ(folders(matches), (std::vector<std::string>{"/beatmaps/12345 Singer - Love Song"}));
}

TEST_F(QueryEngineTest, ArtistAndCreatorQualifiers) {
    EXPECT_EQ(folders(run("artist=lover")), (std::vector<std::string>{"/beatmaps/222 Lovers - Tune"}));
    EXPECT_EQ(folders(run("creator=LOVEMAPPER")), (std::vector<std::string>{"/beatmaps/333 Band - Anthem"}));
    EXPECT_EQ(folders(run(" Artist = band ")), (std::vector<std::string>{"/beatmaps/333 Band - Anthem"}));
}

TEST_F(QueryEngineTest, SetIdMatchesExactly) {
    EXPECT_EQ(folders(run("sid=12345")), (std::vector<std::string>{"/beatmaps/12345 Singer - Love Song"}));
    EXPECT_EQ(folders(run("sid=0012345")), (std::vector<std::string>{"/beatmaps/12345 Singer - Love Song"}));
    EXPECT_TRUE(run("sid=1234").empty());
    EXPECT_EQ(run("sid=12345")[0].charts.size(), 2u);
}

TEST_F(QueryEngineTest, EmptyKeywordAfterQualifierMatchesEverything) {
    EXPECT_EQ(run("name=").size(), index.size());
    EXPECT_EQ(run("sid=").size(), index.size());
}

TEST_F(QueryEngineTest, NoMatchIsEmptyNotError) {
    EXPECT_TRUE(run("zzzz-nothing").empty());
}

TEST_F(QueryEngineTest, MalformedQueriesAreQueryErrors) {
    Query query;
    IndexError error;
    EXPECT_FALSE(QueryEngine::parse("title=love", query, error));
    EXPECT_EQ(error.kind, ErrorKind::QueryError);
    EXPECT_FALSE(QueryEngine::parse("=love", query, error));
    EXPECT_EQ(error.kind, ErrorKind::QueryError);
    EXPECT_FALSE(QueryEngine::parse("sid=abc", query, error));
    EXPECT_EQ(error.kind, ErrorKind::QueryError);
    EXPECT_FALSE(QueryEngine::parse("sid=-5", query, error));
    EXPECT_EQ(error.kind, ErrorKind::QueryError);
}

TEST_F(QueryEngineTest, ResultsCanBeIteratedAgain) {
    Query query;
    IndexError error;
    ASSERT_TRUE(QueryEngine::parse("love", query, error));
    QueryResults results = QueryEngine::run(index, query);

    size_t first = 0;
    for (auto it = results.begin(); it != results.end(); ++it) first++;
    EXPECT_EQ(first, 3u);
    EXPECT_EQ(results.count(), 3u);
    EXPECT_EQ(results.collect().size(), 3u);
}

TEST_F(QueryEngineTest, MatchesOnlyTheChartsThatFit) {
    BeatmapSet mixed = makeSet("/beatmaps/mixed", 500, "Song", "Artist", "Mapper", 3);
    mixed.charts[1].creator = "Guest";
    index.upsert(mixed);

    auto matches = run("creator=guest");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].charts, (std::vector<size_t>{1}));
}
