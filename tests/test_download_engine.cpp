#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "core/downloader/DownloadEngine.hpp"
#include "core/downloader/DownloadError.hpp"
#include "utils/MockTransport.hpp"
#include "utils/RecordingObserver.hpp"
#include "utils/TestUtils.hpp"

using namespace tether::core::downloader;
using namespace tether::test;

namespace {

std::string tagFor(const std::string& name, const std::string& url, const std::string& dest = "") {
    return TransferIdentity(name, url, dest).serialize();
}

TransportError failure(DownloadErrc code, ResumeData resumeData = {}) {
    TransportError error;
    error.code = make_error_code(code);
    error.message = "simulated";
    error.resumeData = std::move(resumeData);
    return error;
}

TransportError interruption(BackgroundCancelReason reason, ResumeData resumeData = {}) {
    TransportError error;
    error.code = make_error_code(DownloadErrc::interrupted);
    error.message = "process ended";
    error.backgroundCancelReason = reason;
    error.resumeData = std::move(resumeData);
    return error;
}

void pauseBriefly() {
    std::this_thread::sleep_for(std::chrono::milliseconds(15));
}

} // namespace

class DownloadEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_unique<DownloadEngine>(transport_, observer_, [this] { ++completions_; });
        engine_->setDefaultDirectory(downloads_.str());
    }

    void TearDown() override {
        engine_.reset();
    }

    void settle() { engine_->waitIdle(); }

    /** Initialize, start one transfer and return its id */
    RecordId startOne(const std::string& name = "a.bin",
                      const std::string& url = "https://x/a.bin",
                      const std::string& dest = "") {
        if (!transport_.delegate()) engine_->initialize();
        RecordId id = engine_->start(name, url, dest);
        settle();
        return id;
    }

    TaskHandle handleOf(RecordId id) const {
        auto record = engine_->find(id);
        return record ? record->handle : kNoTask;
    }

    MockTransport transport_;
    RecordingObserver observer_;
    std::atomic<int> completions_{0};
    TempDirectory downloads_{"tether_downloads"};
    TempDirectory scratch_{"tether_scratch"};
    std::unique_ptr<DownloadEngine> engine_;
};

// -- start --

TEST_F(DownloadEngineTest, StartIssuesTaggedTaskAndEmitsStarted) {
    RecordId id = startOne();

    auto started = observer_.eventsOfType("started");
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].index, 0u);
    EXPECT_EQ(started[0].record.id, id);
    EXPECT_EQ(started[0].record.status, DownloadStatus::Downloading);
    EXPECT_DOUBLE_EQ(started[0].record.progress, 0.0);
    EXPECT_TRUE(started[0].record.startTime.has_value());

    TaskHandle handle = handleOf(id);
    ASSERT_NE(handle, kNoTask);

    auto task = transport_.task(handle);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->url, "https://x/a.bin");
    EXPECT_EQ(task->tag, tagFor("a.bin", "https://x/a.bin"));
    EXPECT_EQ(task->state, TaskState::Running);
}

TEST_F(DownloadEngineTest, EveryStartGetsItsOwnRecordAndTask) {
    RecordId first = startOne("a.bin", "https://x/a.bin");
    RecordId second = startOne("a.bin", "https://x/a.bin");

    EXPECT_NE(first, second);
    EXPECT_NE(handleOf(first), handleOf(second));
    EXPECT_EQ(engine_->count(), 2u);
    EXPECT_EQ(transport_.urlCreations().size(), 2u);
}

TEST_F(DownloadEngineTest, StartRejectsUnencodableIdentity) {
    engine_->initialize();
    std::string bad = std::string("a") + TransferIdentity::kDelimiter + "b";

    EXPECT_THROW(engine_->start(bad, "https://x/a.bin"), MalformedIdentity);
    settle();
    EXPECT_EQ(engine_->count(), 0u);
    EXPECT_TRUE(transport_.urlCreations().empty());
}

// -- progress --

TEST_F(DownloadEngineTest, FullTransferMovesFileAndFinishes) {
    RecordId id = startOne();
    TaskHandle handle = handleOf(id);

    pauseBriefly();
    transport_.fireProgress(handle, 500, 1000, 500);
    settle();

    auto progress = observer_.eventsOfType("progress");
    ASSERT_EQ(progress.size(), 1u);
    EXPECT_DOUBLE_EQ(progress[0].record.progress, 0.5);
    EXPECT_GT(progress[0].record.speed, 0.0);
    EXPECT_EQ(progress[0].record.bytesDownloaded, 500);
    EXPECT_EQ(progress[0].record.bytesTotal, 1000);
    EXPECT_TRUE(progress[0].record.remainingTime.has_value());

    auto temp = writeFile(scratch_.path() / "CFNetworkDownload.tmp", "payload");
    transport_.fireFinished(handle, temp.string());
    settle();

    auto destination = downloads_.path() / "a.bin";
    EXPECT_TRUE(std::filesystem::exists(destination));
    EXPECT_FALSE(std::filesystem::exists(temp));
    EXPECT_EQ(readFile(destination), "payload");
    EXPECT_EQ(observer_.count("failed"), 0u);

    transport_.fireCompleted(handle);
    settle();

    EXPECT_EQ(observer_.count("finished"), 1u);
    EXPECT_EQ(observer_.count("failed"), 0u);
    EXPECT_EQ(observer_.count("canceled"), 0u);
    EXPECT_EQ(engine_->count(), 0u);
}

TEST_F(DownloadEngineTest, UnknownTotalKeepsPreviousProgress) {
    RecordId id = startOne();
    TaskHandle handle = handleOf(id);

    pauseBriefly();
    transport_.fireProgress(handle, 500, 1000);
    transport_.fireProgress(handle, 700, 0);
    settle();

    auto progress = observer_.eventsOfType("progress");
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_DOUBLE_EQ(progress[1].record.progress, 0.5);
    EXPECT_EQ(progress[1].record.bytesDownloaded, 700);
    EXPECT_FALSE(progress[1].record.remainingTime.has_value());
}

TEST_F(DownloadEngineTest, UnknownTotalStillCoversWrittenBytes) {
    RecordId id = startOne();
    TaskHandle handle = handleOf(id);

    transport_.fireProgress(handle, 500, 1000);
    transport_.fireProgress(handle, 1500, 0);
    settle();

    auto record = engine_->find(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->bytesDownloaded, 1500);
    EXPECT_EQ(record->bytesTotal, 1500);
    EXPECT_LE(record->bytesDownloaded, record->bytesTotal);
    EXPECT_DOUBLE_EQ(record->progress, 0.5);
}

TEST_F(DownloadEngineTest, UnknownTotalFromTheStartLeavesProgressAtZero) {
    RecordId id = startOne();

    transport_.fireProgress(handleOf(id), 4096, 0);
    settle();

    auto record = engine_->find(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->progress, 0.0);
    EXPECT_EQ(record->bytesDownloaded, 4096);
    EXPECT_EQ(record->bytesTotal, 0);
    EXPECT_FALSE(record->remainingTime.has_value());
}

TEST_F(DownloadEngineTest, ProgressIsClampedAndTotalCoversWrittenBytes) {
    RecordId id = startOne();

    pauseBriefly();
    transport_.fireProgress(handleOf(id), 1500, 1000);
    settle();

    auto record = engine_->find(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->progress, 1.0);
    EXPECT_EQ(record->bytesTotal, 1500);
}

TEST_F(DownloadEngineTest, ProgressForUntrackedHandleIsIgnored) {
    startOne();

    transport_.fireProgress(9999, 10, 100);
    settle();

    EXPECT_EQ(observer_.count("progress"), 0u);
}

TEST_F(DownloadEngineTest, ProgressReportsCurrentIndex) {
    RecordId first = startOne("a.bin", "https://x/a.bin");
    RecordId second = startOne("b.bin", "https://x/b.bin");

    transport_.fireProgress(handleOf(second), 10, 100);
    settle();
    ASSERT_EQ(observer_.count("progress"), 1u);
    EXPECT_EQ(observer_.eventsOfType("progress")[0].index, 1u);

    transport_.fireCompleted(handleOf(first));
    settle();

    transport_.fireProgress(handleOf(second), 20, 100);
    settle();
    EXPECT_EQ(observer_.eventsOfType("progress")[1].index, 0u);
}

// -- pause / resume / retry --

TEST_F(DownloadEngineTest, PauseSuspendsAndResetsClock) {
    RecordId id = startOne();
    auto before = engine_->find(id)->startTime;

    pauseBriefly();
    engine_->pause(id);
    settle();

    auto paused = observer_.eventsOfType("paused");
    ASSERT_EQ(paused.size(), 1u);
    EXPECT_EQ(paused[0].record.status, DownloadStatus::Paused);
    ASSERT_TRUE(paused[0].record.startTime.has_value());
    EXPECT_GT(*paused[0].record.startTime, *before);
    EXPECT_EQ(transport_.suspended(), std::vector<TaskHandle>{handleOf(id)});
}

TEST_F(DownloadEngineTest, PauseWhenPausedIsNoop) {
    RecordId id = startOne();

    engine_->pause(id);
    settle();
    auto clock = engine_->find(id)->startTime;

    pauseBriefly();
    engine_->pause(id);
    settle();

    EXPECT_EQ(observer_.count("paused"), 1u);
    EXPECT_EQ(transport_.suspended().size(), 1u);
    EXPECT_EQ(engine_->find(id)->status, DownloadStatus::Paused);
    EXPECT_EQ(engine_->find(id)->startTime, clock);
}

TEST_F(DownloadEngineTest, ResumeWhenDownloadingIsNoop) {
    RecordId id = startOne();

    engine_->resume(id);
    settle();

    EXPECT_EQ(observer_.count("resumed"), 0u);
    EXPECT_EQ(transport_.resumed().size(), 1u);   // from start
}

TEST_F(DownloadEngineTest, ResumeKeepsAttemptClock) {
    RecordId id = startOne();
    engine_->pause(id);
    settle();
    auto pausedClock = engine_->find(id)->startTime;

    pauseBriefly();
    engine_->resume(id);
    settle();

    auto resumed = observer_.eventsOfType("resumed");
    ASSERT_EQ(resumed.size(), 1u);
    EXPECT_EQ(resumed[0].record.status, DownloadStatus::Downloading);
    EXPECT_EQ(resumed[0].record.startTime, pausedClock);
    EXPECT_EQ(transport_.task(handleOf(id))->state, TaskState::Running);
}

TEST_F(DownloadEngineTest, RetryWhenDownloadingIsNoop) {
    RecordId id = startOne();

    engine_->retry(id);
    settle();

    EXPECT_EQ(observer_.count("retried"), 0u);
    EXPECT_EQ(transport_.resumed().size(), 1u);
}

TEST_F(DownloadEngineTest, RetryRunsRearmedTaskWithFreshClock) {
    RecordId id = startOne();
    TaskHandle original = handleOf(id);

    transport_.fireCompleted(original, failure(DownloadErrc::network_error));
    settle();

    TaskHandle rearmed = handleOf(id);
    ASSERT_NE(rearmed, original);
    auto failedClock = engine_->find(id)->startTime;

    pauseBriefly();
    engine_->retry(id);
    settle();

    auto retried = observer_.eventsOfType("retried");
    ASSERT_EQ(retried.size(), 1u);
    EXPECT_EQ(retried[0].record.status, DownloadStatus::Downloading);
    EXPECT_EQ(retried[0].record.handle, rearmed);
    EXPECT_GT(*retried[0].record.startTime, *failedClock);
    EXPECT_EQ(transport_.resumed().back(), rearmed);
}

TEST_F(DownloadEngineTest, OperationsOnUnknownIdAreIgnored) {
    startOne();

    engine_->pause(12345);
    engine_->resume(12345);
    engine_->retry(12345);
    engine_->cancel(12345);
    settle();

    EXPECT_EQ(observer_.events().size(), 1u);   // started only
    EXPECT_TRUE(transport_.canceled().empty());
}

// -- failures --

TEST_F(DownloadEngineTest, FailureWithStaleResumeDataRestartsFromUrl) {
    RecordId id = startOne();
    TaskHandle original = handleOf(id);

    auto blob = toResumeData(nlohmann::json{{"localPath", (scratch_.path() / "gone.part").string()}});
    transport_.fireCompleted(original, failure(DownloadErrc::network_error, blob));
    settle();

    EXPECT_TRUE(transport_.resumeCreations().empty());
    ASSERT_EQ(transport_.urlCreations().size(), 2u);

    TaskHandle rearmed = transport_.urlCreations().back();
    EXPECT_EQ(transport_.task(rearmed)->url, "https://x/a.bin");
    EXPECT_EQ(transport_.task(rearmed)->tag, tagFor("a.bin", "https://x/a.bin"));
    EXPECT_EQ(transport_.task(rearmed)->state, TaskState::Suspended);

    auto record = engine_->find(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DownloadStatus::Failed);
    EXPECT_EQ(record->handle, rearmed);

    auto failed = observer_.eventsOfType("failed");
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].error->code, DownloadErrc::network_error);
    EXPECT_EQ(failed[0].error->message, "simulated");
    EXPECT_EQ(failed[0].record.status, DownloadStatus::Failed);
}

TEST_F(DownloadEngineTest, FailureWithUsableResumeDataContinuesFromIt) {
    RecordId id = startOne();

    auto partial = writeFile(scratch_.path() / "a.part", "half");
    auto blob = toResumeData(nlohmann::json{{"localPath", partial.string()}});
    transport_.fireCompleted(handleOf(id), failure(DownloadErrc::network_error, blob));
    settle();

    ASSERT_EQ(transport_.resumeCreations().size(), 1u);
    TaskHandle rearmed = transport_.resumeCreations().front();
    EXPECT_EQ(transport_.task(rearmed)->resumeData, blob);
    EXPECT_EQ(handleOf(id), rearmed);
    EXPECT_EQ(transport_.urlCreations().size(), 1u);   // from start
}

TEST_F(DownloadEngineTest, FailureWithoutErrorCodeIsReportedAsUnknown) {
    RecordId id = startOne();

    TransportError error;   // no code attached
    transport_.fireCompleted(handleOf(id), error);
    settle();

    auto failed = observer_.eventsOfType("failed");
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].error->code, DownloadErrc::unknown);
    EXPECT_EQ(failed[0].error->message, "Unknown error occurred");
    EXPECT_EQ(engine_->count(), 1u);
}

TEST_F(DownloadEngineTest, SystemResourceShortageIsAFailureNotAnInterruption) {
    RecordId id = startOne();

    auto error = interruption(BackgroundCancelReason::InsufficientSystemResources);
    transport_.fireCompleted(handleOf(id), error);
    settle();

    EXPECT_EQ(observer_.count("failed"), 1u);
    EXPECT_EQ(observer_.count("interruptedTasksPopulated"), 0u);
    EXPECT_EQ(engine_->find(id)->status, DownloadStatus::Failed);
}

// -- cancel --

TEST_F(DownloadEngineTest, CancelWaitsForTransportConfirmation) {
    RecordId id = startOne();
    TaskHandle handle = handleOf(id);

    engine_->cancel(id);
    settle();

    EXPECT_EQ(transport_.canceled(), std::vector<TaskHandle>{handle});
    EXPECT_EQ(observer_.count("canceled"), 0u);
    EXPECT_EQ(engine_->count(), 1u);

    transport_.fireCompleted(handle, failure(DownloadErrc::cancelled));
    settle();

    auto canceled = observer_.eventsOfType("canceled");
    ASSERT_EQ(canceled.size(), 1u);
    EXPECT_EQ(canceled[0].record.status, DownloadStatus::Canceled);
    EXPECT_EQ(observer_.count("failed"), 0u);
    EXPECT_EQ(observer_.count("finished"), 0u);
    EXPECT_EQ(engine_->count(), 0u);
}

TEST_F(DownloadEngineTest, CleanCompletionAlwaysFinishes) {
    RecordId id = startOne();

    transport_.fireCompleted(handleOf(id), std::nullopt);
    settle();

    EXPECT_EQ(observer_.count("finished"), 1u);
    EXPECT_EQ(observer_.count("failed"), 0u);
    EXPECT_EQ(observer_.count("canceled"), 0u);
    EXPECT_FALSE(engine_->find(id).has_value());
}

// -- file placement --

TEST_F(DownloadEngineTest, ExplicitDestinationIsUsed) {
    TempDirectory target("tether_target");
    RecordId id = startOne("c.bin", "https://x/c.bin", target.str());

    auto temp = writeFile(scratch_.path() / "c.tmp", "ccc");
    transport_.fireFinished(handleOf(id), temp.string());
    settle();

    EXPECT_EQ(readFile(target.path() / "c.bin"), "ccc");
    EXPECT_FALSE(std::filesystem::exists(downloads_.path() / "c.bin"));
}

TEST_F(DownloadEngineTest, MissingDestinationIsReportedSeparately) {
    auto missing = (downloads_.path() / "not-there").string();
    RecordId id = startOne("d.bin", "https://x/d.bin", missing);

    auto temp = writeFile(scratch_.path() / "d.tmp", "ddd");
    transport_.fireFinished(handleOf(id), temp.string());
    settle();

    auto events = observer_.eventsOfType("destinationMissing");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].location, temp.string());
    EXPECT_EQ(events[0].record.identity.destinationPath(), missing);
    EXPECT_TRUE(std::filesystem::exists(temp));
    EXPECT_EQ(observer_.count("failed"), 0u);
}

TEST_F(DownloadEngineTest, MoveFailureIsReportedAsFailed) {
    RecordId id = startOne();

    transport_.fireFinished(handleOf(id), (scratch_.path() / "vanished.tmp").string());
    settle();

    auto failed = observer_.eventsOfType("failed");
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_TRUE(static_cast<bool>(failed[0].error->code));
    EXPECT_EQ(engine_->find(id)->status, DownloadStatus::Downloading);
}

// -- reconciliation --

TEST_F(DownloadEngineTest, ReconciliationRestoresRecordsFromTags) {
    transport_.addExistingTask(5, TaskState::Suspended, tagFor("r.bin", "https://x/r.bin", "/srv"));
    transport_.addExistingTask(6, TaskState::Running, tagFor("s.bin", "https://x/s.bin"));
    transport_.addExistingTask(7, TaskState::Canceling, tagFor("t.bin", "https://x/t.bin"));

    engine_->initialize();

    auto records = engine_->records();
    ASSERT_EQ(records.size(), 3u);

    EXPECT_EQ(records[0].status, DownloadStatus::Paused);
    EXPECT_EQ(records[0].handle, 5u);
    EXPECT_EQ(records[0].identity.name(), "r.bin");
    EXPECT_EQ(records[0].identity.sourceUrl(), "https://x/r.bin");
    EXPECT_EQ(records[0].identity.destinationPath(), "/srv");

    EXPECT_EQ(records[1].status, DownloadStatus::Downloading);
    EXPECT_EQ(records[2].status, DownloadStatus::Failed);

    auto populated = observer_.eventsOfType("interruptedTasksPopulated");
    ASSERT_EQ(populated.size(), 1u);
    EXPECT_EQ(populated[0].records.size(), 3u);

    EXPECT_EQ(transport_.delegate(), engine_.get());
}

TEST_F(DownloadEngineTest, ReconciliationDropsMalformedTags) {
    transport_.addExistingTask(5, TaskState::Suspended, "no delimiters here");
    transport_.addExistingTask(6, TaskState::Suspended, tagFor("ok.bin", "https://x/ok.bin"));

    engine_->initialize();

    auto records = engine_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].identity.name(), "ok.bin");
    EXPECT_EQ(transport_.canceled(), std::vector<TaskHandle>{5});
}

TEST_F(DownloadEngineTest, ReconciliationWithNothingToRestoreIsSilent) {
    engine_->initialize();

    EXPECT_EQ(engine_->count(), 0u);
    EXPECT_TRUE(observer_.events().empty());
    EXPECT_EQ(transport_.delegate(), engine_.get());
}

TEST_F(DownloadEngineTest, RestoredRecordsCanBeResumed) {
    transport_.addExistingTask(5, TaskState::Suspended, tagFor("r.bin", "https://x/r.bin"));
    engine_->initialize();

    RecordId id = engine_->records()[0].id;
    engine_->resume(id);
    settle();

    EXPECT_EQ(observer_.count("resumed"), 1u);
    EXPECT_EQ(transport_.resumed(), std::vector<TaskHandle>{5});
}

// -- background interruption --

TEST_F(DownloadEngineTest, InterruptedTaskIsRebuiltNotRemoved) {
    engine_->initialize();

    TaskInfo lost{42, TaskState::Completed, tagFor("i.bin", "https://x/i.bin")};
    transport_.fireCompleted(lost, interruption(BackgroundCancelReason::UserForceQuit));
    settle();

    auto records = engine_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, DownloadStatus::Failed);
    EXPECT_EQ(records[0].identity.name(), "i.bin");
    EXPECT_NE(records[0].handle, 42u);
    EXPECT_EQ(transport_.urlCreations(), std::vector<TaskHandle>{records[0].handle});

    auto populated = observer_.eventsOfType("interruptedTasksPopulated");
    ASSERT_EQ(populated.size(), 1u);
    ASSERT_EQ(populated[0].records.size(), 1u);
    EXPECT_EQ(populated[0].records[0].identity.sourceUrl(), "https://x/i.bin");

    EXPECT_EQ(observer_.count("failed"), 0u);
    EXPECT_EQ(observer_.count("finished"), 0u);
}

TEST_F(DownloadEngineTest, InterruptedTaskWithPartialFileContinues) {
    engine_->initialize();

    auto partial = writeFile(scratch_.path() / "i.part", "part");
    auto blob = toResumeData(nlohmann::json{{"localPath", partial.string()}, {"url", "https://x/i.bin"}});

    TaskInfo lost{42, TaskState::Completed, tagFor("i.bin", "https://x/i.bin")};
    transport_.fireCompleted(lost, interruption(BackgroundCancelReason::BackgroundUpdatesDisabled, blob));
    settle();

    ASSERT_EQ(transport_.resumeCreations().size(), 1u);
    EXPECT_EQ(engine_->records()[0].handle, transport_.resumeCreations()[0]);
}

TEST_F(DownloadEngineTest, InterruptionOfTrackedTaskRearmsInPlace) {
    RecordId id = startOne();
    TaskHandle original = handleOf(id);

    transport_.fireCompleted(original, interruption(BackgroundCancelReason::UserForceQuit));
    settle();

    EXPECT_EQ(engine_->count(), 1u);
    auto record = engine_->find(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DownloadStatus::Failed);
    EXPECT_NE(record->handle, original);
    EXPECT_EQ(observer_.count("interruptedTasksPopulated"), 1u);
}

TEST_F(DownloadEngineTest, InterruptedTaskWithMalformedTagIsDropped) {
    engine_->initialize();

    TaskInfo lost{42, TaskState::Completed, "garbage"};
    transport_.fireCompleted(lost, interruption(BackgroundCancelReason::UserForceQuit));
    settle();

    EXPECT_EQ(engine_->count(), 0u);
    EXPECT_TRUE(observer_.events().empty());
    EXPECT_TRUE(transport_.urlCreations().empty());
}

// -- lifecycle --

TEST_F(DownloadEngineTest, BackgroundCompletionRunsOnce) {
    engine_->initialize();

    transport_.fireAllEventsDelivered();
    transport_.fireAllEventsDelivered();
    settle();

    EXPECT_EQ(completions_, 1);
}

TEST_F(DownloadEngineTest, ThrowingObserverDoesNotStallEngine) {
    observer_.throwOn("started");
    RecordId id = startOne();

    transport_.fireProgress(handleOf(id), 10, 100);
    settle();

    EXPECT_EQ(observer_.count("started"), 1u);
    EXPECT_EQ(observer_.count("progress"), 1u);
}

TEST_F(DownloadEngineTest, ShutdownDetachesAndDropsLaterWork) {
    startOne();
    engine_->shutdown();

    EXPECT_EQ(transport_.delegate(), nullptr);

    engine_->start("late.bin", "https://x/late.bin");
    engine_->waitIdle();
    EXPECT_EQ(engine_->count(), 1u);
    EXPECT_EQ(observer_.count("started"), 1u);
}

TEST_F(DownloadEngineTest, RecordsAreSnapshots) {
    RecordId id = startOne();

    auto records = engine_->records();
    records[0].status = DownloadStatus::Finished;

    EXPECT_EQ(engine_->find(id)->status, DownloadStatus::Downloading);
}
