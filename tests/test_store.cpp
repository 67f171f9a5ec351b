#include <dash/tracker/store.hpp>
#include <dash/core/utils.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <fstream>

namespace dash {
namespace test {

class TrackerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(dir.path().empty());
        db_path = dir.file("data/dash.db");
        ASSERT_TRUE(store.open(db_path)) << store.last_error();
        ASSERT_TRUE(store.ensure_initialized()) << store.last_error();
    }

    TempDir dir;
    std::string db_path;
    TrackerStore store;
};

TEST_F(TrackerStoreTest, OpenCreatesParentDirectory) {
    EXPECT_TRUE(path_exists(dir.file("data")));
    EXPECT_TRUE(store.is_open());
    EXPECT_EQ(store.path(), db_path);
}

TEST_F(TrackerStoreTest, FreshStoreLoadsDefaults) {
    TrackerState state;
    ASSERT_TRUE(store.load(state)) << store.last_error();
    EXPECT_FALSE(state.meta.has_current_project());
    EXPECT_TRUE(state.projects.empty());
    EXPECT_TRUE(state.records.empty());
}

TEST_F(TrackerStoreTest, EnsureInitializedIsIdempotent) {
    Meta meta;
    meta.current_project = "keep";
    ASSERT_TRUE(store.save_meta(meta));

    EXPECT_TRUE(store.ensure_initialized());
    EXPECT_TRUE(store.ensure_initialized());

    TrackerState state;
    ASSERT_TRUE(store.load(state));
    EXPECT_EQ(state.meta.current_project, "keep");
}

TEST_F(TrackerStoreTest, SaveReplacesStoresWholesale) {
    Meta meta;
    meta.current_project = "alpha";
    ProjectSet projects;
    projects["alpha"] = Project("alpha", 111);
    projects["beta"] = Project("beta", 222);
    RecordSet records;
    records[1] = Record(1, "alpha", "design", 1000, 2000);
    records[2] = Record(2, "alpha", "coding", 3000);
    ASSERT_TRUE(store.save(&meta, &projects, &records)) << store.last_error();

    TrackerState state;
    ASSERT_TRUE(store.load(state));
    EXPECT_EQ(state.meta.current_project, "alpha");
    ASSERT_EQ(state.projects.size(), 2u);
    EXPECT_EQ(state.projects["beta"].created_at, 222);
    ASSERT_EQ(state.records.size(), 2u);
    EXPECT_EQ(state.records[1].phase, "design");
    EXPECT_EQ(state.records[1].end, 2000);
    EXPECT_TRUE(state.records[2].is_open());

    // A smaller set fully replaces the previous one
    RecordSet fewer;
    fewer[2] = Record(2, "alpha", "coding", 3000, 4000);
    ASSERT_TRUE(store.save_records(fewer));

    ASSERT_TRUE(store.load(state));
    ASSERT_EQ(state.records.size(), 1u);
    EXPECT_EQ(state.records.begin()->first, 2);
    EXPECT_EQ(state.records[2].end, 4000);
}

TEST_F(TrackerStoreTest, OmittedStoresAreUntouched) {
    Meta meta;
    meta.current_project = "alpha";
    ProjectSet projects;
    projects["alpha"] = Project("alpha");
    RecordSet records;
    records[1] = Record(1, "alpha", "design", 1000);
    ASSERT_TRUE(store.save(&meta, &projects, &records));

    RecordSet replaced;
    ASSERT_TRUE(store.save(nullptr, nullptr, &replaced));

    TrackerState state;
    ASSERT_TRUE(store.load(state));
    EXPECT_EQ(state.meta.current_project, "alpha");
    EXPECT_EQ(state.projects.size(), 1u);
    EXPECT_TRUE(state.records.empty());

    EXPECT_TRUE(store.save(nullptr, nullptr, nullptr));
}

TEST_F(TrackerStoreTest, ClearingCurrentProjectPersists) {
    Meta meta;
    meta.current_project = "alpha";
    ASSERT_TRUE(store.save_meta(meta));
    ASSERT_TRUE(store.save_meta(Meta()));

    TrackerState state;
    ASSERT_TRUE(store.load(state));
    EXPECT_FALSE(state.meta.has_current_project());
}

TEST_F(TrackerStoreTest, DataSurvivesReopen) {
    Meta meta;
    meta.current_project = "alpha";
    ProjectSet projects;
    projects["alpha"] = Project("alpha");
    RecordSet records;
    records[5] = Record(5, "alpha", "writing", 1000, 61000);
    ASSERT_TRUE(store.save(&meta, &projects, &records));
    store.close();
    EXPECT_FALSE(store.is_open());

    TrackerStore reopened;
    ASSERT_TRUE(reopened.open(db_path));
    ASSERT_TRUE(reopened.ensure_initialized());

    TrackerState state;
    ASSERT_TRUE(reopened.load(state));
    EXPECT_EQ(state.meta.current_project, "alpha");
    ASSERT_EQ(state.records.count(5), 1u);
    EXPECT_EQ(state.records[5].phase, "writing");
}

TEST_F(TrackerStoreTest, ClosedStoreRefusesWork) {
    store.close();

    TrackerState state;
    EXPECT_FALSE(store.load(state));
    EXPECT_FALSE(store.save_meta(Meta()));
    EXPECT_FALSE(store.ensure_initialized());
    EXPECT_FALSE(store.last_error().empty());
}

TEST(TrackerStoreCorruption, CorruptFileFailsToLoad) {
    TempDir dir;
    std::string path = dir.file("dash.db");
    {
        std::ofstream junk(path.c_str(), std::ios::binary);
        for (int i = 0; i < 64; ++i) {
            junk << "this is not an sqlite database, just text ";
        }
    }

    TrackerStore store;
    if (store.open(path)) {
        TrackerState state;
        EXPECT_FALSE(store.ensure_initialized());
        EXPECT_FALSE(store.load(state));
        EXPECT_FALSE(store.last_error().empty());
    }
}

} // namespace test
} // namespace dash
