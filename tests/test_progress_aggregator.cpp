/**
 * @file test_progress_aggregator.cpp
 * @brief Unit tests for job state transitions and published progress snapshots
 */

#include "test_harness.hpp"

#include "progress_aggregator.hpp"

#include <vector>

using namespace ferry;
using std::chrono::milliseconds;
using std::chrono::seconds;

static FileTask make_task(const std::string& rel, uint64_t size) {
    FileTask task;
    task.relative_path = rel;
    task.source_path = "/src/" + rel;
    task.size = size;
    return task;
}

static TransferJob make_job() {
    TransferJob job;
    job.id = 7;
    job.source_root = "/src";
    job.destination_root = "/dst";
    return job;
}

// Running job with three files of 100, 200 and 300 bytes
static void prepare(ProgressAggregator& agg, TimePoint t0) {
    ASSERT(agg.start(t0));
    agg.add_task(make_task("a.bin", 100));
    agg.add_task(make_task("docs/b.bin", 200));
    agg.add_task(make_task("docs/c.bin", 300));
    agg.enumeration_complete(t0);
}

TEST(initial_snapshot_is_pending) {
    ProgressAggregator agg(make_job(), EngineConfig());
    auto snap = agg.snapshot();
    ASSERT(snap != nullptr);
    ASSERT(snap->status == JobStatus::Pending);
    ASSERT_EQ(snap->status_text, "Waiting to start");
    ASSERT_EQ(snap->current_folder, "-");
    ASSERT_EQ(snap->percent, 0);
    ASSERT(!snap->started_at.has_value());
}

TEST(scanning_before_totals_known) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    agg.start(t0);
    agg.add_task(make_task("a.bin", 100));
    agg.enumeration_progress(t0);

    auto snap = agg.snapshot();
    ASSERT_EQ(snap->status_text, "Scanning source folder...");
    ASSERT(!snap->totals_known);
    ASSERT_EQ(snap->percent, 0);
    ASSERT_EQ(snap->files_total, 1u);
}

TEST(first_file_done_of_three) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);

    agg.file_started(0, t0 + milliseconds(100));
    agg.file_progress(0, 60, t0 + milliseconds(200));
    agg.file_finished(0, t0 + milliseconds(300));

    auto snap = agg.snapshot();
    ASSERT_EQ(snap->files_text(), "1 / 3");
    ASSERT_EQ(snap->size_text(), "100 B / 600 B");
    ASSERT_EQ(snap->percent, 16);
    ASSERT_EQ(snap->current_folder, "src");
    ASSERT_EQ(snap->status_text, "Copied a.bin");
}

TEST(current_folder_follows_file) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);

    agg.file_started(1, t0);
    auto snap = agg.snapshot();
    ASSERT_EQ(snap->current_folder, "docs");
    ASSERT_EQ(snap->status_text, "Copying b.bin (200 B)");
}

TEST(published_progress_is_monotonic) {
    ProgressAggregator agg(make_job(), EngineConfig());
    std::vector<std::shared_ptr<const AggregateProgress>> seen;
    agg.set_listener([&seen](const std::shared_ptr<const AggregateProgress>& s) { seen.push_back(s); });

    TimePoint t0 = Clock::now();
    prepare(agg, t0);
    agg.file_started(0, t0);
    agg.file_progress(0, 80, t0 + milliseconds(100));
    agg.file_progress(0, 40, t0 + milliseconds(200));
    agg.file_progress(0, 9999, t0 + milliseconds(300));
    agg.file_finished(0, t0 + milliseconds(400));
    agg.file_started(1, t0 + milliseconds(400));
    agg.file_failed(1, "Permission denied", t0 + milliseconds(500));
    agg.file_started(2, t0 + milliseconds(500));
    agg.file_progress(2, 150, t0 + milliseconds(600));

    ASSERT_GT(seen.size(), 5u);
    for (size_t i = 1; i < seen.size(); i++) {
        ASSERT_GT(seen[i]->version, seen[i - 1]->version);
        ASSERT_GE(seen[i]->bytes_done, seen[i - 1]->bytes_done);
        ASSERT_GE(seen[i]->files_done, seen[i - 1]->files_done);
        ASSERT_LE(seen[i]->bytes_done, seen[i]->bytes_total);
    }
    ASSERT_EQ(agg.bytes_done(), 250u);
    ASSERT_EQ(agg.job().tasks[0].bytes_copied, 100u);
}

TEST(failed_file_is_skipped) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);

    agg.file_started(0, t0);
    agg.file_finished(0, t0);
    agg.file_started(1, t0);
    agg.file_failed(1, "Permission denied", t0);

    auto snap = agg.snapshot();
    ASSERT_EQ(snap->files_skipped, 1u);
    ASSERT(agg.job().tasks[1].status == FileStatus::Errored);
    ASSERT_EQ(agg.job().tasks[1].error_reason, "Permission denied");
    ASSERT_EQ(snap->status_text, "Skipped b.bin, 1 file skipped");

    agg.file_started(2, t0);
    agg.file_finished(2, t0);
    ASSERT(agg.complete(t0 + seconds(1)));
    ASSERT_EQ(agg.snapshot()->status_text, "2 of 3 files copied, 1 skipped");
}

TEST(status_tracks_file_in_flight) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);
    ASSERT_EQ(agg.snapshot()->status_text, "Preparing...");

    agg.file_started(0, t0);
    ASSERT_EQ(agg.snapshot()->status_text, "Copying a.bin (100 B)");
    agg.file_finished(0, t0);
    ASSERT_EQ(agg.snapshot()->status_text, "Copied a.bin");

    agg.file_started(1, t0);
    agg.file_failed(1, "Permission denied", t0);
    ASSERT_EQ(agg.snapshot()->status_text, "Skipped b.bin, 1 file skipped");

    agg.file_started(2, t0);
    ASSERT_EQ(agg.snapshot()->status_text, "Copying c.bin (300 B), 1 file skipped");
}

TEST(completed_job) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);
    for (size_t i = 0; i < 3; i++) {
        agg.file_started(i, t0 + seconds(i));
        agg.file_finished(i, t0 + seconds(i + 1));
    }
    ASSERT(agg.complete(t0 + seconds(3)));

    auto snap = agg.snapshot();
    ASSERT(snap->status == JobStatus::Completed);
    ASSERT_EQ(snap->status_text, "Completed");
    ASSERT_EQ(snap->percent, 100);
    ASSERT(snap->eta_seconds.has_value());
    ASSERT_EQ(*snap->eta_seconds, 0.0);
    ASSERT_EQ(snap->current_folder, "-");
    ASSERT_EQ(snap->elapsed_seconds, 3.0);

    // Elapsed time is frozen once finished
    AggregateProgress later = snap->refreshed(t0 + seconds(60), seconds(5));
    ASSERT_EQ(later.elapsed_seconds, 3.0);
}

TEST(terminal_states_are_final) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);
    ASSERT(agg.cancel(t0));

    ASSERT(!agg.resume(t0));
    ASSERT(!agg.pause(t0));
    ASSERT(!agg.complete(t0));
    ASSERT(!agg.fail("late", t0));
    ASSERT(!agg.start(t0));
    ASSERT(agg.snapshot()->status == JobStatus::Cancelled);
    ASSERT_EQ(agg.snapshot()->status_text, "Cancelled by user");
}

TEST(unreached_files_marked_skipped_on_cancel) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);
    agg.file_started(0, t0);
    agg.file_finished(0, t0 + seconds(1));
    agg.file_started(1, t0 + seconds(1));
    ASSERT(agg.cancel(t0 + seconds(2)));

    const auto& tasks = agg.job().tasks;
    ASSERT(tasks[0].status == FileStatus::Done);
    ASSERT(tasks[1].status == FileStatus::Skipped);
    ASSERT(tasks[2].status == FileStatus::Skipped);
    ASSERT_EQ(std::string(file_status_name(tasks[2].status)), "skipped");
    // Not counted as failed files
    ASSERT_EQ(agg.snapshot()->files_skipped, 0u);
    ASSERT_EQ(agg.snapshot()->files_done, 1u);
}

TEST(completed_job_has_no_skipped_tasks) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);
    agg.file_started(0, t0);
    agg.file_failed(0, "Permission denied", t0);
    for (size_t i = 1; i < 3; i++) {
        agg.file_started(i, t0);
        agg.file_finished(i, t0);
    }
    ASSERT(agg.complete(t0 + seconds(1)));
    for (const FileTask& task : agg.job().tasks) {
        ASSERT(task.status != FileStatus::Skipped);
    }
    ASSERT(agg.job().tasks[0].status == FileStatus::Errored);
}

TEST(invalid_transitions_rejected) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    ASSERT(!agg.pause(t0));
    ASSERT(!agg.resume(t0));
    ASSERT(!agg.complete(t0));

    ASSERT(agg.start(t0));
    ASSERT(!agg.start(t0));
    ASSERT(!agg.resume(t0));
    ASSERT(agg.pause(t0));
    ASSERT_EQ(agg.snapshot()->status_text, "Paused");
    ASSERT(agg.resume(t0));
    ASSERT(agg.snapshot()->status == JobStatus::Running);
}

TEST(failure_reason_in_status) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    prepare(agg, t0);
    ASSERT(agg.fail("Destination unavailable", t0));
    ASSERT_EQ(agg.snapshot()->status_text, "Failed: Destination unavailable");
}

TEST(empty_job_completes_at_full_percent) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    agg.start(t0);
    agg.enumeration_complete(t0);
    ASSERT_EQ(agg.snapshot()->percent, 0);
    ASSERT(agg.complete(t0));

    auto snap = agg.snapshot();
    ASSERT_EQ(snap->status_text, "No files found to copy");
    ASSERT_EQ(snap->percent, 100);
    ASSERT_EQ(snap->files_text(), "0 / 0");
}

TEST(zero_byte_files_count_by_file) {
    ProgressAggregator agg(make_job(), EngineConfig());
    TimePoint t0 = Clock::now();
    agg.start(t0);
    agg.add_task(make_task("empty1", 0));
    agg.add_task(make_task("empty2", 0));
    agg.enumeration_complete(t0);

    agg.file_started(0, t0);
    agg.file_finished(0, t0);
    ASSERT_EQ(agg.snapshot()->percent, 50);
}

TEST(eta_from_samples) {
    EngineConfig config;
    ProgressAggregator agg(make_job(), config);
    TimePoint t0 = Clock::now();
    prepare(agg, t0);

    agg.file_started(0, t0);
    agg.file_progress(0, 100, t0 + seconds(1));

    auto snap = agg.snapshot();
    ASSERT(snap->eta_seconds.has_value());
    ASSERT_GT(snap->bytes_per_second, 0.0);
    ASSERT_GT(*snap->eta_seconds, 0.0);

    // No sample for longer than the idle threshold
    AggregateProgress stale = snap->refreshed(t0 + seconds(10), config.idle_eta_threshold);
    ASSERT(!stale.eta_seconds.has_value());
    ASSERT_EQ(stale.eta_text(), "--:--:--");
}

int main() {
    quiet_logging();
    printf("Running progress aggregator tests...\n");

    RUN_TEST(initial_snapshot_is_pending);
    RUN_TEST(scanning_before_totals_known);
    RUN_TEST(first_file_done_of_three);
    RUN_TEST(current_folder_follows_file);
    RUN_TEST(published_progress_is_monotonic);
    RUN_TEST(failed_file_is_skipped);
    RUN_TEST(status_tracks_file_in_flight);
    RUN_TEST(completed_job);
    RUN_TEST(terminal_states_are_final);
    RUN_TEST(unreached_files_marked_skipped_on_cancel);
    RUN_TEST(completed_job_has_no_skipped_tasks);
    RUN_TEST(invalid_transitions_rejected);
    RUN_TEST(failure_reason_in_status);
    RUN_TEST(empty_job_completes_at_full_percent);
    RUN_TEST(zero_byte_files_count_by_file);
    RUN_TEST(eta_from_samples);

    TEST_SUMMARY();
}
