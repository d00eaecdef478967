#include <gtest/gtest.h>
#include "snapshot/Repository.hpp"
#include "error/Errors.hpp"
#include "FakeVolumes.hpp"

#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace sv::snapshot;
using sv::test::dates;

class LocalRepositoryTest : public ::testing::Test {
protected:
    fs::path volume;
    LocalRepository repo;

    void SetUp() override {
        volume = fs::temp_directory_path() / ("subvolsync_repo_" + std::to_string(::getpid()));
        fs::remove_all(volume);
        fs::create_directories(volume);
    }

    void TearDown() override { fs::remove_all(volume); }
};

TEST_F(LocalRepositoryTest, ListsDatedDirectories) {
    fs::create_directory(volume / "2024-01-10");
    fs::create_directory(volume / "2024-01-01");
    fs::create_directory(volume / "2023-12-31");

    EXPECT_EQ(repo.listDates(volume), dates({"2023-12-31", "2024-01-01", "2024-01-10"}));
}

TEST_F(LocalRepositoryTest, EmptyVolumeHasNoDates) {
    EXPECT_TRUE(repo.listDates(volume).empty());
}

TEST_F(LocalRepositoryTest, ListingIsNotCached) {
    fs::create_directory(volume / "2024-01-01");
    EXPECT_EQ(repo.listDates(volume).size(), 1u);

    fs::create_directory(volume / "2024-01-02");
    EXPECT_EQ(repo.listDates(volume).size(), 2u);
}

TEST_F(LocalRepositoryTest, UndatedEntryIsFatal) {
    fs::create_directory(volume / "2024-01-01");
    fs::create_directory(volume / "lost+found");

    try {
        (void)repo.listDates(volume);
        FAIL() << "expected InvalidSnapshotName";
    } catch (const sv::error::InvalidSnapshotName& e) {
        EXPECT_EQ(e.name, "lost+found");
        EXPECT_EQ(e.volume, volume.string());
    }
}

TEST_F(LocalRepositoryTest, MissingVolumeThrows) {
    EXPECT_THROW((void)repo.listDates(volume / "nope"), fs::filesystem_error);
}
