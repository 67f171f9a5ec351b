#include <dash/tracker/query.hpp>

#include <gtest/gtest.h>

namespace dash {
namespace test {

class QueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        projects["alpha"] = Project("alpha");
        projects["beta"] = Project("beta");

        add(1, "alpha", "design", 3000, 4000);
        add(2, "beta", "ops", 9000);
        add(3, "alpha", "coding", 1000, 2000);
        add(4, "alpha", "review", 5000);
    }

    void add(int64_t id, const std::string& project, const std::string& phase,
             int64_t start, int64_t end = 0) {
        records[id] = Record(id, project, phase, start, end);
    }

    ProjectSet projects;
    RecordSet records;
};

TEST_F(QueryTest, FindProjectExactMatch) {
    ASSERT_NE(find_project(projects, "alpha"), nullptr);
    EXPECT_EQ(find_project(projects, "alpha")->name, "alpha");
    EXPECT_EQ(find_project(projects, "Alpha"), nullptr);
    EXPECT_EQ(find_project(projects, ""), nullptr);
}

TEST_F(QueryTest, CurrentProjectFollowsMeta) {
    Meta meta;
    EXPECT_EQ(get_current_project(meta, projects), nullptr);

    meta.current_project = "beta";
    ASSERT_NE(get_current_project(meta, projects), nullptr);
    EXPECT_EQ(get_current_project(meta, projects)->name, "beta");

    meta.current_project = "gone";
    EXPECT_EQ(get_current_project(meta, projects), nullptr);
}

TEST_F(QueryTest, FilterKeepsOnlyProjectRecords) {
    std::vector<const Record*> alpha = filter_project_records(projects["alpha"], records);
    ASSERT_EQ(alpha.size(), 3u);
    for (size_t i = 0; i < alpha.size(); ++i) {
        EXPECT_EQ(alpha[i]->project, "alpha");
    }

    Project empty("gamma");
    EXPECT_TRUE(filter_project_records(empty, records).empty());
}

TEST_F(QueryTest, LastRecordHasLatestStart) {
    const Record* last = get_last_record(projects["alpha"], records);
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->id, 4);
    EXPECT_EQ(last->phase, "review");

    Project empty("gamma");
    EXPECT_EQ(get_last_record(empty, records), nullptr);
}

TEST_F(QueryTest, LastRecordTieGoesToLatestInserted) {
    add(7, "alpha", "late-a", 6000, 6500);
    add(8, "alpha", "late-b", 6000);

    const Record* last = get_last_record(projects["alpha"], records);
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->id, 8);
}

TEST_F(QueryTest, SortedRecordsAscendByStartThenId) {
    add(5, "alpha", "tie-second", 3000);

    std::vector<const Record*> sorted = sorted_project_records(projects["alpha"], records);
    ASSERT_EQ(sorted.size(), 4u);
    EXPECT_EQ(sorted[0]->phase, "coding");
    EXPECT_EQ(sorted[1]->phase, "design");
    EXPECT_EQ(sorted[2]->phase, "tie-second");
    EXPECT_EQ(sorted[3]->phase, "review");
}

} // namespace test
} // namespace dash
