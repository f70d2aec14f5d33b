#include <gtest/gtest.h>
#include "core/Library.h"
#include "TestUtils.h"

namespace {

class LibraryTest : public ::testing::Test {
protected:
    void SetUp() override {
        addSet(songs.path, "100 Artist - Song", "Song", "Artist", 100);
        addSet(songs.path, "200 Other - Tune", "Tune", "Other", 200);
    }

    static void addSet(const fs::path& root, const std::string& folder, const std::string& title,
                       const std::string& artist, long long sid) {
        writeFile(root / folder / "easy.osu", chartText(title, artist, "Mapper", "Easy", sid * 10, sid));
        writeFile(root / folder / "hard.osu", chartText(title, artist, "Mapper", "Hard", sid * 10 + 1, sid));
    }

    std::unique_ptr<Library> makeLibrary(MemoryCacheStore*& store) {
        auto owned = std::make_unique<MemoryCacheStore>();
        store = owned.get();
        ScanOptions options;
        options.threads = 2;
        return std::make_unique<Library>(std::move(owned), options);
    }

    TempDir songs;
    IndexError error;
};

} // anonymous namespace

TEST_F(LibraryTest, OpenBuildsAndPersists) {
    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);

    ASSERT_TRUE(library->open(songs.path.string(), error)) << error.message;
    EXPECT_EQ(library->getLastCacheLoad(), CacheLoad::Missing);
    EXPECT_EQ(library->getIndex().size(), 2u);
    EXPECT_EQ(library->getLastScan().chartsParsed, 4);
    EXPECT_FALSE(store->blob().empty());
}

TEST_F(LibraryTest, SecondOpenUsesCache) {
    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    ASSERT_TRUE(library->open(songs.path.string(), error));

    MemoryCacheStore* secondStore = nullptr;
    auto second = makeLibrary(secondStore);
    secondStore->setBlob(store->blob());
    ASSERT_TRUE(second->open(songs.path.string(), error));
    EXPECT_EQ(second->getLastCacheLoad(), CacheLoad::Loaded);
    EXPECT_EQ(second->getLastScan().chartsParsed, 0);
    EXPECT_EQ(second->getLastScan().setsReused, 2);
    EXPECT_EQ(second->getIndex(), library->getIndex());
}

TEST_F(LibraryTest, CacheForAnotherRootIsRebuilt) {
    TempDir other;
    addSet(other.path, "300 Third - Thing", "Thing", "Third", 300);

    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    ASSERT_TRUE(library->open(other.path.string(), error));

    MemoryCacheStore* secondStore = nullptr;
    auto second = makeLibrary(secondStore);
    secondStore->setBlob(store->blob());
    ASSERT_TRUE(second->open(songs.path.string(), error));
    EXPECT_EQ(second->getLastCacheLoad(), CacheLoad::Loaded);
    EXPECT_EQ(second->getLastScan().setsReused, 0);
    EXPECT_EQ(second->getIndex().size(), 2u);
    EXPECT_EQ(second->getIndex().getRootPath(), songs.path.string());
}

TEST_F(LibraryTest, CorruptCacheIsRebuilt) {
    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    store->setBlob("BMLX\x07 truncated");

    ASSERT_TRUE(library->open(songs.path.string(), error));
    EXPECT_EQ(library->getLastCacheLoad(), CacheLoad::Corrupt);
    EXPECT_EQ(library->getIndex().size(), 2u);
    EXPECT_EQ(library->getLastScan().chartsParsed, 4);
}

TEST_F(LibraryTest, RefreshPicksUpNewFolders) {
    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    ASSERT_TRUE(library->open(songs.path.string(), error));

    addSet(songs.path, "300 Third - Thing", "Thing", "Third", 300);
    ASSERT_TRUE(library->refresh(error));
    EXPECT_EQ(library->getIndex().size(), 3u);
    EXPECT_EQ(library->getLastScan().setsReused, 2);
    EXPECT_EQ(library->getLastScan().chartsParsed, 2);
}

TEST_F(LibraryTest, FlushReparsesEverything) {
    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    ASSERT_TRUE(library->open(songs.path.string(), error));

    ASSERT_TRUE(library->flush(error));
    EXPECT_EQ(library->getLastScan().setsReused, 0);
    EXPECT_EQ(library->getLastScan().chartsParsed, 4);
    EXPECT_EQ(library->getIndex().size(), 2u);
    EXPECT_FALSE(store->blob().empty());
}

TEST_F(LibraryTest, ChangeRootSwitchesIndex) {
    TempDir other;
    addSet(other.path, "300 Third - Thing", "Thing", "Third", 300);

    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    ASSERT_TRUE(library->open(songs.path.string(), error));

    ASSERT_TRUE(library->changeRoot(other.path.string(), error));
    EXPECT_EQ(library->getRootPath(), other.path.string());
    EXPECT_EQ(library->getIndex().size(), 1u);
    EXPECT_EQ(library->list().count(), 1u);
}

TEST_F(LibraryTest, InvalidRootIsReported) {
    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    EXPECT_FALSE(library->open((songs.path / "missing").string(), error));
    EXPECT_EQ(error.kind, ErrorKind::RootPathInvalid);
}

TEST_F(LibraryTest, FailedRefreshKeepsIndex) {
    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    ASSERT_TRUE(library->open(songs.path.string(), error));

    fs::remove_all(songs.path);
    ASSERT_FALSE(library->refresh(error));
    EXPECT_EQ(error.kind, ErrorKind::RootPathInvalid);
    EXPECT_EQ(library->getIndex().size(), 2u);
}

TEST_F(LibraryTest, FindAndCheck) {
    writeFile(songs.path / "100 Artist - Song (copy)" / "easy.osu",
              chartText("Song", "Artist", "Mapper", "Easy", 1000, 100));

    MemoryCacheStore* store = nullptr;
    auto library = makeLibrary(store);
    ASSERT_TRUE(library->open(songs.path.string(), error));

    auto results = library->find("artist=other", error);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(results->count(), 1u);

    EXPECT_FALSE(library->find("bpm=180", error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::QueryError);

    auto groups = library->check();
    ASSERT_EQ(groups.size(), 1u);
    ASSERT_EQ(groups[0].sets.size(), 2u);
    EXPECT_EQ(groups[0].sets[0]->folderPath, (songs.path / "100 Artist - Song").string());
    EXPECT_EQ(groups[0].sets[1]->folderPath, (songs.path / "100 Artist - Song (copy)").string());
}
