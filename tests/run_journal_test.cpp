#include <gtest/gtest.h>
#include "hypoforge/run_journal.hpp"

using namespace hypoforge;

class RunJournalTest : public ::testing::Test {
protected:
    void SetUp() override { RunJournal::instance().clear(); }

    static RunRecord record(const std::string& hypothesis) {
        RunRecord r;
        r.timestamp = 1700000000;
        r.session_id = "s";
        r.hypothesis = hypothesis;
        r.stage_reached = "done";
        r.success = true;
        r.p_value = 0.03;
        return r;
    }
};

TEST_F(RunJournalTest, NewestFirst) {
    RunJournal::instance().add(record("first"));
    RunJournal::instance().add(record("second"));
    auto runs = RunJournal::instance().to_json();
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0]["hypothesis"], "second");
    EXPECT_EQ(runs[1]["hypothesis"], "first");
    EXPECT_DOUBLE_EQ(runs[0]["p_value"].get<double>(), 0.03);
    EXPECT_TRUE(runs[0]["failed_stage"].is_null());
}

TEST_F(RunJournalTest, FailedRunWithoutPValue) {
    RunRecord r = record("broken");
    r.stage_reached = "failed";
    r.failed_stage = "executing";
    r.p_value.reset();
    RunJournal::instance().add(r);
    auto runs = RunJournal::instance().to_json();
    EXPECT_EQ(runs[0]["failed_stage"], "executing");
    EXPECT_TRUE(runs[0]["p_value"].is_null());
}

TEST_F(RunJournalTest, CapacityDropsOldest) {
    for (size_t i = 0; i < RunJournal::kCapacity + 5; ++i) {
        RunJournal::instance().add(record("h" + std::to_string(i)));
    }
    EXPECT_EQ(RunJournal::instance().size(), RunJournal::kCapacity);
    auto runs = RunJournal::instance().to_json();
    EXPECT_EQ(runs.back()["hypothesis"], "h5");
}
