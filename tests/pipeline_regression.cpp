#include "core/errors/Errors.hpp"
#include "core/manifest/ManifestStore.hpp"
#include "core/naming/Naming.hpp"
#include "core/pipeline/PipelineOrchestrator.hpp"
#include "core/pipeline/RadarPublisher.hpp"
#include "core/pipeline/WorkerPool.hpp"
#include "core/storage/OutputStore.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace
{
using namespace rpub;
using rpub_test::OdimFixture;
using rpub_test::TempDir;
namespace fs = std::filesystem;

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[pipeline-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout = std::chrono::seconds(5))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() > deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

std::string source_name(int minute)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "T_PABV23_C_OKPR_202509131%d0000.hdf", minute);
    return buf;
}

// Writes an ODIM file into the current data directory and registers it as fetched.
SourceFile stage_source(const Config& cfg, ManifestStore& manifest, int minute, bool valid = true)
{
    SourceFile f;
    f.name = source_name(minute);
    f.stream = Stream::Current;
    f.product = "PABV23";
    f.timestamp = *extractTimestamp(f.name);
    f.local_path = (fs::path(cfg.dataDir(Stream::Current)) / f.name).string();
    fs::create_directories(cfg.dataDir(Stream::Current));

    if (valid)
    {
        OdimFixture fx;
        fx.time = "1" + std::to_string(minute) + "0000";
        fx.at(1, 1) = OdimFixture::rawFor(42.0);
        rpub_test::writeOdim(f.local_path, fx);
    }
    else
    {
        OdimFixture fx;
        fx.xsize = 10;
        fx.ysize = 10;
        rpub_test::writeOdim(f.local_path, fx);
    }

    SourceRecord rec;
    rec.name = f.name;
    rec.stream = "current";
    rec.product = f.product;
    rec.timestamp = f.timestamp;
    manifest.upsertSource(rec);
    manifest.markFetched(f.name, f.local_path, 0);
    return f;
}

RenderJob job_for(const SourceFile& f)
{
    RenderJob job;
    job.identifier = f.name;
    job.input_path = f.local_path;
    job.stream = Stream::Current;
    job.timestamp = f.timestamp;
    return job;
}

int test_process_isolates_failures()
{
    int failures = 0;
    TempDir dir("pipeline");
    Config cfg = rpub_test::makeTestConfig(dir);
    rpub_test::initTestDatabase(cfg);
    ManifestStore manifest(cfg.storage.db_path);
    OutputStore output(cfg.storage.output_root);
    WorkerPool pool(2);
    PipelineOrchestrator orchestrator(cfg, manifest, output, pool);

    const SourceFile good = stage_source(cfg, manifest, 0);
    const SourceFile layout = stage_source(cfg, manifest, 1, false);
    SourceFile gone = stage_source(cfg, manifest, 2);
    fs::remove(gone.local_path);

    const CycleReport report = orchestrator.process(Stream::Current, {good, layout, gone});
    failures += expect_true(report.outcomes.size() == 3, "one outcome per file");
    failures += expect_true(report.count(JobStatus::Published) == 1, "valid file is published");
    failures += expect_true(report.count(JobStatus::Quarantined) == 1, "off-contract file is quarantined");
    failures += expect_true(report.count(JobStatus::Failed) == 1, "unreadable local file fails");

    for (const JobOutcome& o : report.outcomes)
    {
        if (o.identifier == good.name)
        {
            failures += expect_true(o.artifacts.size() == 4, "2 variants x 2 scales are published");
        }
        if (o.identifier == layout.name)
        {
            failures += expect_true(o.stage == Stage::Decode, "quarantine is attributed to decode");
        }
    }

    auto rec = manifest.lookup(good.name);
    failures += expect_true(rec && rec->state == SourceState::Processed, "manifest: processed");
    rec = manifest.lookup(layout.name);
    failures += expect_true(rec && rec->state == SourceState::Quarantined, "manifest: quarantined");
    rec = manifest.lookup(gone.name);
    failures += expect_true(rec && rec->state == SourceState::Failed && rec->cooldown_until == 0,
                            "manifest: failed without cool-down");

    ArtifactKey key;
    key.stream = Stream::Current;
    key.timestamp = good.timestamp;
    key.variant = "contrast";
    key.scale = 2;
    failures += expect_true(output.exists(key), "contrast 2x artifact exists");
    failures += expect_true(fs::is_empty(output.stagingDir(Stream::Current)),
                            "staging directory is empty after the cycle");
    failures += expect_true(!orchestrator.isInFlight(renderKey(Stream::Current, good.timestamp, 0)),
                            "keys are released after the cycle");
    return failures;
}

int test_publish_error_keeps_other_artifacts()
{
    int failures = 0;
    TempDir dir("pipeline-publish");
    Config cfg = rpub_test::makeTestConfig(dir);
    rpub_test::initTestDatabase(cfg);
    ManifestStore manifest(cfg.storage.db_path);
    OutputStore output(cfg.storage.output_root);
    WorkerPool pool(1);
    PipelineOrchestrator orchestrator(cfg, manifest, output, pool);

    const SourceFile f = stage_source(cfg, manifest, 3);
    ArtifactKey blocked;
    blocked.stream = Stream::Current;
    blocked.timestamp = f.timestamp;
    blocked.variant = "standard";
    blocked.scale = 1;
    // a directory in place of the PNG makes the rename fail
    fs::create_directories(output.pathFor(blocked));

    const JobOutcome o = orchestrator.execute(job_for(f));
    failures += expect_true(o.status == JobStatus::Failed && o.stage == Stage::Publish,
                            "failed publish marks the job failed at publish");
    failures += expect_true(o.artifacts.size() == 3, "remaining artifacts are still published");

    const SourceFile older = stage_source(cfg, manifest, 2);
    failures += expect_true(orchestrator.execute(job_for(older)).status == JobStatus::Published,
                            "older timestamp publishes all artifacts");
    RadarPublisher listing(cfg, manifest, output);
    const auto latest = listing.latestArtifacts(Stream::Current);
    failures += expect_true(latest.size() == 4 && latest.front().key.timestamp == older.timestamp,
                            "listing skips a timestamp with a missing variant");
    return failures;
}

int test_artifacts_follow_container_time()
{
    int failures = 0;
    TempDir dir("pipeline-nominal");
    Config cfg = rpub_test::makeTestConfig(dir);
    cfg.output.scales = {1};
    rpub_test::initTestDatabase(cfg);
    ManifestStore manifest(cfg.storage.db_path);
    OutputStore output(cfg.storage.output_root);
    WorkerPool pool(1);
    PipelineOrchestrator orchestrator(cfg, manifest, output, pool);

    // file name says 16:00, the container says 16:55
    const SourceFile f = stage_source(cfg, manifest, 6);
    OdimFixture fx;
    fx.time = "165500";
    rpub_test::writeOdim(f.local_path, fx);

    const JobOutcome o = orchestrator.execute(job_for(f));
    failures += expect_true(o.status == JobStatus::Published, "mismatched time still publishes");
    ArtifactKey nominal;
    nominal.stream = Stream::Current;
    nominal.timestamp = makeUtc(2025, 9, 13, 16, 55, 0);
    nominal.variant = "standard";
    failures += expect_true(output.exists(nominal), "artifact is named by the /what time");
    ArtifactKey by_name = nominal;
    by_name.timestamp = f.timestamp;
    failures += expect_true(!output.exists(by_name), "no artifact under the file name time");
    return failures;
}

int test_in_flight_key_is_not_duplicated()
{
    int failures = 0;
    TempDir dir("pipeline-mutex");
    Config cfg = rpub_test::makeTestConfig(dir);
    rpub_test::initTestDatabase(cfg);
    ManifestStore manifest(cfg.storage.db_path);
    OutputStore output(cfg.storage.output_root);
    WorkerPool pool(1);
    PipelineOrchestrator orchestrator(cfg, manifest, output, pool);

    const SourceFile f = stage_source(cfg, manifest, 4);
    const std::string key = renderKey(Stream::Current, f.timestamp, 0);

    // occupy the only worker so the first job stays queued
    std::promise<void> gate;
    std::shared_future<void> open = gate.get_future().share();
    auto blocker = pool.submit([open] { open.wait(); });

    std::vector<JobOutcome> first;
    std::thread caller([&] { first = orchestrator.runJobs({job_for(f)}); });
    failures += expect_true(wait_for([&] {
        return orchestrator.isInFlight(key) && pool.active_threads() == 1 && pool.pending_tasks() == 1;
    }),
                            "first caller claims the key and queues its job");

    const auto second = orchestrator.runJobs({job_for(f)});
    failures += expect_true(second.size() == 1 && second.front().status == JobStatus::Skipped,
                            "overlapping caller is skipped, not queued");
    failures += expect_true(pool.pending_tasks() == 1, "only one render job was submitted");

    gate.set_value();
    blocker.get();
    caller.join();
    failures += expect_true(first.size() == 1 && first.front().status == JobStatus::Published,
                            "first caller publishes");
    failures += expect_true(!orchestrator.isInFlight(key), "key released after completion");

    const auto third = orchestrator.runJobs({job_for(f)});
    failures += expect_true(third.size() == 1 && third.front().status == JobStatus::Published,
                            "re-rendering after release is allowed and idempotent");
    return failures;
}

int test_shutdown_reports_incomplete()
{
    int failures = 0;
    TempDir dir("pipeline-shutdown");
    Config cfg = rpub_test::makeTestConfig(dir);
    rpub_test::initTestDatabase(cfg);
    ManifestStore manifest(cfg.storage.db_path);
    OutputStore output(cfg.storage.output_root);
    WorkerPool pool(1);
    PipelineOrchestrator orchestrator(cfg, manifest, output, pool);

    const SourceFile f = stage_source(cfg, manifest, 5);
    std::promise<void> gate;
    std::shared_future<void> open = gate.get_future().share();
    auto blocker = pool.submit([open] { open.wait(); });

    std::vector<JobOutcome> outcomes;
    std::thread caller([&] { outcomes = orchestrator.runJobs({job_for(f)}); });
    failures += expect_true(wait_for([&] { return pool.active_threads() == 1 && pool.pending_tasks() == 1; }),
                            "job is queued behind the blocker");

    const bool clean = pool.shutdown(std::chrono::milliseconds(50));
    caller.join();
    gate.set_value();
    blocker.get();

    failures += expect_true(!clean, "shutdown with a stuck job is not clean");
    failures += expect_true(outcomes.size() == 1 && outcomes.front().status == JobStatus::Incomplete,
                            "abandoned job is reported incomplete");
    failures += expect_true(!orchestrator.isInFlight(renderKey(Stream::Current, f.timestamp, 0)),
                            "abandoned job releases its key");

    bool rejected = false;
    try
    {
        pool.submit([] { return 1; }).get();
    }
    catch (const ShutdownError&)
    {
        rejected = true;
    }
    failures += expect_true(rejected, "submit after shutdown fails with ShutdownError");
    return failures;
}

int test_publisher_outlives_abandoned_jobs()
{
    int failures = 0;
    TempDir dir("pipeline-teardown");
    Config cfg = rpub_test::makeTestConfig(dir);
    cfg.workers.pool_size = 1;
    rpub_test::initTestDatabase(cfg);
    ManifestStore manifest(cfg.storage.db_path);
    OutputStore output(cfg.storage.output_root);

    auto publisher = std::make_unique<RadarPublisher>(cfg, manifest, output);
    PipelineOrchestrator& orchestrator = publisher->orchestrator();
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    // a running job that still reads the orchestrator after shutdown gave up on it
    auto job = publisher->pool().submit([&orchestrator, &started, &finished] {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        const bool busy = orchestrator.isInFlight("current/19990101_0000");
        finished = true;
        return busy;
    });
    failures += expect_true(wait_for([&] { return started.load(); }), "job is running");

    failures += expect_true(!publisher->shutdown(std::chrono::milliseconds(0)),
                            "zero-grace shutdown with a running job is not clean");
    publisher.reset();
    failures += expect_true(finished.load(), "destruction waits for the abandoned job");
    failures += expect_true(job.get() == false, "abandoned job completed against a live orchestrator");
    return failures;
}

int test_retention_keeps_newest_timestamps()
{
    int failures = 0;
    TempDir dir("pipeline-retention");
    Config cfg = rpub_test::makeTestConfig(dir);
    cfg.storage.retained_timestamps = 2;
    cfg.storage.listing_window = 2;
    cfg.output.scales = {1};
    rpub_test::initTestDatabase(cfg);
    ManifestStore manifest(cfg.storage.db_path);
    OutputStore output(cfg.storage.output_root);
    WorkerPool pool(2);
    PipelineOrchestrator orchestrator(cfg, manifest, output, pool);

    std::vector<SourceFile> files;
    for (int minute : {0, 1, 2})
    {
        files.push_back(stage_source(cfg, manifest, minute));
    }
    orchestrator.process(Stream::Current, files);

    const auto left = output.list(Stream::Current);
    failures += expect_true(left.size() == 4, "two timestamps x two variants remain");
    failures += expect_true(!left.empty() && left.front().key.timestamp == files[1].timestamp,
                            "oldest timestamp was pruned");
    failures += expect_true(!fs::exists(files[0].local_path), "source file of the pruned timestamp is removed");
    failures += expect_true(fs::exists(files[2].local_path), "newest source file is kept");

    failures += expect_true(!manifest.lookup(files[0].name).has_value(), "pruned source leaves the manifest");
    failures += expect_true(rpub_test::manifestRows(cfg, "source_history", files[0].name) == 0,
                            "history of the pruned source is dropped");
    failures += expect_true(manifest.lookup(files[1].name).has_value() &&
                                rpub_test::manifestRows(cfg, "source_history", files[1].name) == 1,
                            "kept sources keep their record and history");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_process_isolates_failures();
    failures += test_publish_error_keeps_other_artifacts();
    failures += test_artifacts_follow_container_time();
    failures += test_in_flight_key_is_not_duplicated();
    failures += test_shutdown_reports_incomplete();
    failures += test_publisher_outlives_abandoned_jobs();
    failures += test_retention_keeps_newest_timestamps();

    if (failures != 0)
    {
        std::cerr << "[pipeline-regression] " << failures << " failure(s)" << std::endl;
        return 1;
    }
    std::cout << "[pipeline-regression] PASS" << std::endl;
    return 0;
}
