/**
 * @file test_status_poller.cpp
 * @brief Client polling loop: outcomes, failure budget and pacing
 */

#include <gtest/gtest.h>
#include "StatusPoller.h"
#include <deque>

using namespace ChunkVault;

namespace {

// Replays a fixed script of replies; the last entry repeats forever.
class ScriptedTransport : public IStatusTransport {
public:
    struct Step {
        bool ok;
        PolledStatus status;
    };

    void reply(const std::string& status, uint64_t uploaded, uint64_t total) {
        script_.push_back({true, PolledStatus{status, uploaded, total}});
    }

    void drop(int times = 1) {
        for (int i = 0; i < times; ++i) {
            script_.push_back({false, {}});
        }
    }

    Result<PolledStatus> fetch(int64_t fileId) override {
        ++fetches;
        lastFileId = fileId;
        Step step = script_.front();
        if (script_.size() > 1) {
            script_.pop_front();
        }
        if (!step.ok) {
            return Err(Core::ErrorCode::CONNECTION_LOST, "connection refused", "ScriptedTransport");
        }
        return step.status;
    }

    int fetches{0};
    int64_t lastFileId{0};

private:
    std::deque<Step> script_;
};

} // namespace

class StatusPollerTest : public ::testing::Test {
protected:
    StatusPoller poller(PollerOptions options = {}) {
        return StatusPoller(transport_, options, [this](std::chrono::milliseconds delay) {
            sleeps_.push_back(delay);
        });
    }

    ScriptedTransport transport_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(StatusPollerTest, StopsWhenCompleted) {
    transport_.reply("chunking", 0, 3);
    transport_.reply("uploading", 1, 3);
    transport_.reply("uploading", 2, 3);
    transport_.reply("completed", 3, 3);

    std::vector<uint64_t> progress;
    PollReport report = poller().poll(12, [&progress](const PolledStatus& status) {
        progress.push_back(status.uploaded);
    });

    EXPECT_EQ(report.outcome, PollOutcome::Completed);
    EXPECT_EQ(report.polls, 4);
    EXPECT_EQ(report.last.uploaded, 3u);
    EXPECT_EQ(progress, (std::vector<uint64_t>{0, 1, 2, 3}));
    EXPECT_EQ(transport_.lastFileId, 12);
}

TEST_F(StatusPollerTest, StopsWhenFailed) {
    transport_.reply("uploading", 1, 3);
    transport_.reply("failed", 1, 3);

    PollReport report = poller().poll(1);
    EXPECT_EQ(report.outcome, PollOutcome::Failed);
    EXPECT_EQ(report.polls, 2);
    EXPECT_EQ(report.last.uploaded, 1u);
}

TEST_F(StatusPollerTest, SleepsOneIntervalBetweenPolls) {
    transport_.reply("uploading", 0, 2);
    transport_.reply("uploading", 1, 2);
    transport_.reply("completed", 2, 2);

    PollerOptions options;
    options.interval = std::chrono::milliseconds(250);
    poller(options).poll(1);

    ASSERT_EQ(sleeps_.size(), 2u);
    for (auto delay : sleeps_) {
        EXPECT_EQ(delay, std::chrono::milliseconds(250));
    }
}

TEST_F(StatusPollerTest, ElevenConsecutiveFailuresLoseConnection) {
    transport_.reply("uploading", 1, 5);
    transport_.drop(11);
    transport_.reply("completed", 5, 5);

    PollReport report = poller().poll(3);

    EXPECT_EQ(report.outcome, PollOutcome::ConnectionLost);
    EXPECT_EQ(report.polls, 12);
    EXPECT_EQ(report.consecutiveFailures, 11);
    EXPECT_EQ(report.last.status, "uploading");
    EXPECT_FALSE(report.lastError.empty());
    EXPECT_EQ(transport_.fetches, 12);
}

TEST_F(StatusPollerTest, FailuresFromTheStartLoseConnectionAfterBudget) {
    transport_.drop(1);

    PollReport report = poller().poll(3);
    EXPECT_EQ(report.outcome, PollOutcome::ConnectionLost);
    EXPECT_EQ(report.polls, 11);
    EXPECT_EQ(sleeps_.size(), 10u);
}

TEST_F(StatusPollerTest, SuccessResetsFailureCount) {
    transport_.drop(10);
    transport_.reply("uploading", 1, 2);
    transport_.drop(10);
    transport_.reply("completed", 2, 2);

    PollReport report = poller().poll(3);
    EXPECT_EQ(report.outcome, PollOutcome::Completed);
    EXPECT_EQ(report.polls, 22);
    EXPECT_EQ(report.consecutiveFailures, 0);
}

TEST_F(StatusPollerTest, MaxPollsGivesUp) {
    transport_.reply("uploading", 1, 9);

    PollerOptions options;
    options.maxPolls = 5;
    PollReport report = poller(options).poll(3);
    EXPECT_EQ(report.outcome, PollOutcome::GaveUp);
    EXPECT_EQ(report.polls, 5);
}

TEST(PollOutcomeTest, Names) {
    EXPECT_STREQ(toString(PollOutcome::Completed), "completed");
    EXPECT_STREQ(toString(PollOutcome::ConnectionLost), "connection_lost");
}
