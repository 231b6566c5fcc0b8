/**
 * @file test_transfer_engine.cpp
 * @brief End-to-end tests of the transfer engine: jobs, control, notifications, events
 */

#include "test_harness.hpp"

#include "errors.hpp"
#include "fault_file_system.hpp"
#include "transfer_engine.hpp"

#include <sys/stat.h>

#include <thread>

using namespace ferry;
using std::chrono::milliseconds;
using std::chrono::seconds;

static EngineConfig test_config() {
    EngineConfig config;
    config.copy_buffer_size = 4096;
    config.sample_interval = milliseconds(100);
    config.max_visible_notifications = 8;
    config.notification_duration = seconds(60);
    return config;
}

static bool exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

static bool has_notification(TransferEngine& engine, Severity severity, const std::string& prefix) {
    for (const auto& n : *engine.visible_notifications()) {
        if (n.severity == severity && n.message.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

// Polls until pred() holds or the timeout passes
template <typename Pred>
static bool eventually(Pred pred, milliseconds timeout = milliseconds(5000)) {
    auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(10));
    }
    return pred();
}

TEST(copies_folder) {
    TempDir dir;
    write_file(dir / "src/a.txt", "alpha");
    write_file(dir / "src/sub/b.txt", "beta");

    TransferEngine engine(test_config());
    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(engine.wait(id, seconds(10)));

    auto snap = engine.snapshot(id);
    ASSERT(snap->status == JobStatus::Completed);
    ASSERT_EQ(snap->status_text, "Completed");
    ASSERT_EQ(snap->percent, 100);
    ASSERT_EQ(snap->files_text(), "2 / 2");
    ASSERT_EQ(snap->eta_text(), "00:00:00");
    ASSERT_EQ(read_file(dir / "dst/a.txt"), "alpha");
    ASSERT_EQ(read_file(dir / "dst/sub/b.txt"), "beta");

    ASSERT(has_notification(engine, Severity::Info, "Copying 2 files"));
    ASSERT(has_notification(engine, Severity::Success, "Copy completed successfully"));
}

TEST(unreadable_file_is_skipped) {
    TempDir dir;
    write_file(dir / "src/a.txt", 100);
    write_file(dir / "src/b.txt", 500);
    write_file(dir / "src/c.txt", 100);

    auto fs = std::make_shared<FaultFileSystem>();
    fs->deny_read.insert("b.txt");
    TransferEngine engine(test_config(), fs);

    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(engine.wait(id, seconds(10)));

    auto snap = engine.snapshot(id);
    ASSERT(snap->status == JobStatus::Completed);
    ASSERT_EQ(snap->status_text, "2 of 3 files copied, 1 skipped");
    ASSERT_EQ(snap->files_done, 2u);
    ASSERT_EQ(snap->files_skipped, 1u);
    ASSERT(exists(dir / "dst/c.txt"));
    ASSERT(!exists(dir / "dst/b.txt"));

    ASSERT(has_notification(engine, Severity::Warning, "Skipped b.txt"));
    ASSERT(has_notification(engine, Severity::Warning, "Copy finished with errors"));
}

TEST(destination_full_fails_job) {
    TempDir dir;
    write_file(dir / "src/a.txt", 100);
    write_file(dir / "src/b.txt", 100);
    write_file(dir / "src/c.txt", 100);

    auto fs = std::make_shared<FaultFileSystem>();
    fs->free_space_after = 1;
    fs->free_space_value = 0;
    TransferEngine engine(test_config(), fs);

    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(engine.wait(id, seconds(10)));

    auto snap = engine.snapshot(id);
    ASSERT(snap->status == JobStatus::Failed);
    ASSERT(snap->status_text.find("Failed: Not enough space") == 0);
    ASSERT_EQ(snap->files_done, 1u);
    ASSERT_EQ(snap->files_skipped, 0u);
    ASSERT(exists(dir / "dst/a.txt"));
    ASSERT(!exists(dir / "dst/b.txt"));
    ASSERT(!exists(dir / "dst/c.txt"));
    ASSERT(has_notification(engine, Severity::Error, "Copy failed"));
}

TEST(missing_source_fails_job) {
    TempDir dir;
    TransferEngine engine(test_config());
    JobId id = engine.start(JobRequest{dir / "missing", dir / "dst"});
    ASSERT(engine.wait(id, seconds(10)));

    auto snap = engine.snapshot(id);
    ASSERT(snap->status == JobStatus::Failed);
    ASSERT(snap->status_text.find("Source folder does not exist") != std::string::npos);
    ASSERT(!exists(dir / "dst"));
}

TEST(empty_source_completes) {
    TempDir dir;
    mkdir((dir / "src").c_str(), 0755);

    TransferEngine engine(test_config());
    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(engine.wait(id, seconds(10)));

    auto snap = engine.snapshot(id);
    ASSERT(snap->status == JobStatus::Completed);
    ASSERT_EQ(snap->status_text, "No files found to copy");
    ASSERT_EQ(snap->percent, 100);
    ASSERT(has_notification(engine, Severity::Info, "No files found to copy"));
}

TEST(cancel_running_job) {
    TempDir dir;
    write_file(dir / "src/slow.bin", 400 * 1024);

    auto fs = std::make_shared<FaultFileSystem>();
    fs->read_delay = milliseconds(10);
    TransferEngine engine(test_config(), fs);

    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(eventually([&] { return engine.snapshot(id)->bytes_done > 0; }));

    auto requested = Clock::now();
    ASSERT(engine.cancel(id));
    ASSERT(engine.wait(id, seconds(2)));
    ASSERT_LE(Clock::now() - requested, seconds(1));

    auto snap = engine.snapshot(id);
    ASSERT(snap->status == JobStatus::Cancelled);
    ASSERT_EQ(snap->status_text, "Cancelled by user");
    ASSERT(!exists(dir / "dst/slow.bin"));
    ASSERT(!exists(dir / "dst/slow.bin.ferrypart"));
    ASSERT(has_notification(engine, Severity::Info, "Copy cancelled"));

    ASSERT(!engine.cancel(id));
    ASSERT(!engine.pause(id));
}

TEST(cancel_during_scan) {
    TempDir dir;
    for (int i = 0; i < 300; i++) {
        std::filesystem::create_directories(dir / ("src/d" + std::to_string(i)));
    }
    write_file(dir / "src/last/file.txt", "x");

    auto fs = std::make_shared<FaultFileSystem>();
    fs->list_delay = milliseconds(5);
    TransferEngine engine(test_config(), fs);

    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(eventually([&] { return engine.snapshot(id)->status == JobStatus::Running; }));
    ASSERT(!engine.snapshot(id)->totals_known);

    auto requested = Clock::now();
    ASSERT(engine.cancel(id));
    ASSERT(engine.wait(id, seconds(2)));
    ASSERT_LE(Clock::now() - requested, milliseconds(200));

    auto snap = engine.snapshot(id);
    ASSERT(snap->status == JobStatus::Cancelled);
    ASSERT(!exists(dir / "dst/last/file.txt"));
}

TEST(cancel_queued_job) {
    TempDir dir;
    write_file(dir / "src/slow.bin", 400 * 1024);
    write_file(dir / "other/x.txt", "x");

    auto fs = std::make_shared<FaultFileSystem>();
    fs->read_delay = milliseconds(10);
    TransferEngine engine(test_config(), fs);

    JobId first = engine.start(JobRequest{dir / "src", dir / "dst1"});
    JobId second = engine.start(JobRequest{dir / "other", dir / "dst2"});
    ASSERT_NE(first, second);
    ASSERT(engine.snapshot(second)->status == JobStatus::Pending);

    ASSERT(engine.cancel(second));
    ASSERT(engine.snapshot(second)->status == JobStatus::Cancelled);
    ASSERT(engine.wait(second, milliseconds(10)));

    ASSERT(engine.cancel(first));
    ASSERT(engine.wait(first, seconds(2)));
    ASSERT(!exists(dir / "dst2/x.txt"));
}

TEST(pause_and_resume) {
    TempDir dir;
    write_file(dir / "src/slow.bin", 200 * 1024);

    auto fs = std::make_shared<FaultFileSystem>();
    fs->read_delay = milliseconds(10);
    TransferEngine engine(test_config(), fs);

    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(eventually([&] { return engine.snapshot(id)->bytes_done > 0; }));

    ASSERT(!engine.resume(id));
    ASSERT(engine.pause(id));
    ASSERT(!engine.pause(id));
    ASSERT(eventually([&] { return engine.snapshot(id)->status == JobStatus::Paused; }));

    auto paused = engine.snapshot(id);
    ASSERT_EQ(paused->status_text, "Paused");
    ASSERT(!paused->eta_seconds.has_value());
    std::this_thread::sleep_for(milliseconds(200));
    ASSERT_EQ(engine.snapshot(id)->bytes_done, paused->bytes_done);

    ASSERT(engine.resume(id));
    ASSERT(engine.wait(id, seconds(10)));
    ASSERT(engine.snapshot(id)->status == JobStatus::Completed);
    ASSERT_EQ(read_file(dir / "dst/slow.bin").size(), 200u * 1024);
}

TEST(cancel_while_paused) {
    TempDir dir;
    write_file(dir / "src/slow.bin", 200 * 1024);

    auto fs = std::make_shared<FaultFileSystem>();
    fs->read_delay = milliseconds(10);
    TransferEngine engine(test_config(), fs);

    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(eventually([&] { return engine.snapshot(id)->bytes_done > 0; }));
    ASSERT(engine.pause(id));
    ASSERT(eventually([&] { return engine.snapshot(id)->status == JobStatus::Paused; }));

    ASSERT(engine.cancel(id));
    ASSERT(engine.wait(id, seconds(2)));
    ASSERT(engine.snapshot(id)->status == JobStatus::Cancelled);
    ASSERT(!exists(dir / "dst/slow.bin.ferrypart"));
}

TEST(subscriber_receives_events) {
    TempDir dir;
    write_file(dir / "src/a.txt", 1000);
    write_file(dir / "src/b.txt", 1000);

    TransferEngine engine(test_config());
    auto channel = engine.subscribe();
    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});

    bool saw_running = false;
    bool finished = false;
    uint64_t last_version = 0;
    uint64_t last_bytes = 0;
    auto deadline = Clock::now() + seconds(10);
    while (!finished && Clock::now() < deadline) {
        auto event = channel->pop_for(milliseconds(200));
        if (!event) continue;
        ASSERT_EQ(event->job_id, id);
        ASSERT_GT(event->snapshot->version, last_version);
        ASSERT_GE(event->snapshot->bytes_done, last_bytes);
        last_version = event->snapshot->version;
        last_bytes = event->snapshot->bytes_done;

        if (event->kind == ProgressEventKind::StateChanged &&
            event->snapshot->status == JobStatus::Running) {
            saw_running = true;
        }
        if (event->kind == ProgressEventKind::Finished) {
            finished = true;
            ASSERT(event->snapshot->status == JobStatus::Completed);
        }
    }
    ASSERT(saw_running);
    ASSERT(finished);
}

TEST(file_error_event) {
    TempDir dir;
    write_file(dir / "src/a.txt", 10);

    auto fs = std::make_shared<FaultFileSystem>();
    fs->deny_read.insert("a.txt");
    TransferEngine engine(test_config(), fs);
    auto channel = engine.subscribe();
    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(engine.wait(id, seconds(10)));

    bool saw_error = false;
    while (auto event = channel->try_pop()) {
        if (event->kind == ProgressEventKind::FileError) saw_error = true;
    }
    ASSERT(saw_error);
}

TEST(channel_drops_progress_first) {
    EventChannel channel(2);
    auto snap = std::make_shared<const AggregateProgress>();
    channel.push(ProgressEvent{1, ProgressEventKind::Progress, snap});
    channel.push(ProgressEvent{1, ProgressEventKind::Finished, snap});
    channel.push(ProgressEvent{1, ProgressEventKind::Progress, snap});

    ASSERT_EQ(channel.size(), 2u);
    ASSERT_EQ(channel.dropped_count(), 1u);
    ASSERT(channel.try_pop()->kind == ProgressEventKind::Finished);
    ASSERT(channel.try_pop()->kind == ProgressEventKind::Progress);
    ASSERT(!channel.try_pop().has_value());
}

TEST(unknown_job_ids) {
    TransferEngine engine(test_config());
    ASSERT(engine.snapshot(42) == nullptr);
    ASSERT(!engine.pause(42));
    ASSERT(!engine.resume(42));
    ASSERT(!engine.cancel(42));
    ASSERT(!engine.wait(42, milliseconds(10)));
    ASSERT(!engine.acknowledge(42));
}

TEST(acknowledge_forgets_finished_job) {
    TempDir dir;
    write_file(dir / "src/a.txt", "a");

    TransferEngine engine(test_config());
    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(engine.wait(id, seconds(10)));
    ASSERT_EQ(engine.jobs().size(), 1u);

    ASSERT(engine.acknowledge(id));
    ASSERT(engine.snapshot(id) == nullptr);
    ASSERT(engine.jobs().empty());
}

TEST(dismiss_notification) {
    TempDir dir;
    mkdir((dir / "src").c_str(), 0755);

    TransferEngine engine(test_config());
    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(engine.wait(id, seconds(10)));

    auto visible = engine.visible_notifications();
    ASSERT(!visible->empty());
    ASSERT(engine.dismiss(visible->front().id));
    ASSERT_EQ(engine.visible_notifications()->size(), visible->size() - 1);
}

TEST(shutdown_cancels_and_rejects_new_jobs) {
    TempDir dir;
    write_file(dir / "src/slow.bin", 400 * 1024);

    auto fs = std::make_shared<FaultFileSystem>();
    fs->read_delay = milliseconds(10);
    TransferEngine engine(test_config(), fs);
    auto channel = engine.subscribe();

    JobId id = engine.start(JobRequest{dir / "src", dir / "dst"});
    ASSERT(eventually([&] { return engine.snapshot(id)->bytes_done > 0; }));

    engine.shutdown();
    engine.shutdown();
    ASSERT(is_terminal(engine.snapshot(id)->status));
    ASSERT(channel->closed());
    ASSERT(!exists(dir / "dst/slow.bin.ferrypart"));
    ASSERT_THROWS(engine.start(JobRequest{dir / "src", dir / "dst"}), TransferError);
}

int main() {
    quiet_logging();
    printf("Running transfer engine tests...\n");

    RUN_TEST(copies_folder);
    RUN_TEST(unreadable_file_is_skipped);
    RUN_TEST(destination_full_fails_job);
    RUN_TEST(missing_source_fails_job);
    RUN_TEST(empty_source_completes);
    RUN_TEST(cancel_running_job);
    RUN_TEST(cancel_during_scan);
    RUN_TEST(cancel_queued_job);
    RUN_TEST(pause_and_resume);
    RUN_TEST(cancel_while_paused);
    RUN_TEST(subscriber_receives_events);
    RUN_TEST(file_error_event);
    RUN_TEST(channel_drops_progress_first);
    RUN_TEST(unknown_job_ids);
    RUN_TEST(acknowledge_forgets_finished_job);
    RUN_TEST(dismiss_notification);
    RUN_TEST(shutdown_cancels_and_rejects_new_jobs);

    TEST_SUMMARY();
}
