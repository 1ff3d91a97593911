#include "ddsync/app/sync_engine.hpp"

#include "ddsync/events/events.hpp"
#include "ddsync/remote/tree_fetcher.hpp"
#include "support/memory_remote_service.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ddsync;
using ddsync::app::DownloadOptions;
using ddsync::app::SyncEngine;
using ddsync::app::SyncOutcome;
using ddsync::app::UploadOptions;
using ddsync::sync::OperationKind;
using ddsync::sync::OutcomeStatus;
using ddsync::sync::SessionState;
using ddsync::test_support::Call;
using ddsync::test_support::MemoryRemoteService;
using ddsync::test_support::create_temp_dir;
using ddsync::test_support::read_file;
using ddsync::test_support::write_file;

namespace {

/**
 * Passes everything through, but can rewrite or fail listings. The tests
 * upload into a project that does not exist yet, so the only listing is
 * the one taken to verify the upload.
 */
class ListingTamperer : public remote::RemoteService {
public:
    explicit ListingTamperer(MemoryRemoteService& inner) : inner_(inner) {}

    void tamper_with(std::string name) { tampered_name_ = std::move(name); }
    void fail_listings() { fail_listings_ = true; }

    Result<std::optional<std::string>> find_project(const std::string& name) override {
        return inner_.find_project(name);
    }
    Result<std::string> create_project(const std::string& name) override { return inner_.create_project(name); }
    Result<std::string> create_folder(const remote::ParentRef& parent, const std::string& name) override {
        return inner_.create_folder(parent, name);
    }
    Result<std::string> initiate_upload(const remote::UploadRequest& request) override {
        return inner_.initiate_upload(request);
    }
    Result<void> upload_chunk(const std::string& upload_id, uint64_t number, const std::vector<uint8_t>& data,
                              const content::Fingerprint& chunk_fingerprint) override {
        return inner_.upload_chunk(upload_id, number, data, chunk_fingerprint);
    }
    Result<std::string> finalize_upload(const std::string& upload_id, const remote::ParentRef& parent,
                                        const content::Fingerprint& fingerprint,
                                        const std::optional<std::string>& replaces) override {
        return inner_.finalize_upload(upload_id, parent, fingerprint, replaces);
    }
    Result<std::vector<remote::RemoteEntry>> list_project_tree(const std::string& project_id) override {
        if (fail_listings_) {
            return Err<std::vector<remote::RemoteEntry>>(Error::network("connection reset"));
        }
        auto listing = inner_.list_project_tree(project_id);
        if (listing.is_error()) {
            return listing;
        }
        for (auto& entry : listing.value()) {
            if (entry.name == tampered_name_ && entry.fingerprint) {
                entry.fingerprint->value = "00000000000000000000000000000000";
            }
        }
        return listing;
    }
    Result<std::vector<uint8_t>> fetch_range(const std::string& file_id, uint64_t offset, uint64_t length) override {
        return inner_.fetch_range(file_id, offset, length);
    }

private:
    MemoryRemoteService& inner_;
    std::string tampered_name_;
    bool fail_listings_ = false;
};

} // namespace

class SyncEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = create_temp_dir();
        work_ = create_temp_dir();
        config_.upload_workers = 3;
        config_.download_workers = 2;
        config_.upload_bytes_per_chunk = 2;
        config_.download_bytes_per_chunk = 3;
        config_.retry.max_attempts = 4;

        write_file(source_ / "README.md", "hello");
        write_file(source_ / "docs" / "a.txt", "x");
    }

    void TearDown() override {
        fs::remove_all(source_);
        fs::remove_all(work_);
    }

    SyncEngine engine(remote::RemoteService& service) {
        return SyncEngine(config_, service, bus_, [](std::chrono::milliseconds) {});
    }

    UploadOptions scenario_upload() const {
        UploadOptions options;
        options.project = "demo";
        options.paths = {source_ / "README.md", source_ / "docs"};
        return options;
    }

    SyncOutcome upload_ok(const UploadOptions& options) {
        auto outcome = engine(service_).upload(options);
        EXPECT_TRUE(outcome.is_ok()) << (outcome.is_error() ? outcome.error().describe() : "");
        return outcome.is_ok() ? std::move(outcome.value()) : SyncOutcome{};
    }

    DownloadOptions download_to(const fs::path& destination) const {
        DownloadOptions options;
        options.project = "demo";
        options.destination = destination;
        return options;
    }

    Config config_;
    MemoryRemoteService service_;
    events::EventBus bus_;
    fs::path source_;
    fs::path work_;
};

TEST_F(SyncEngineTest, UploadsScenarioAndVerifies) {
    auto outcome = upload_ok(scenario_upload());

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_TRUE(outcome.verified);
    EXPECT_EQ(outcome.session.state, SessionState::Complete);
    EXPECT_EQ(outcome.report.count(OutcomeStatus::Succeeded), 4u);
    EXPECT_EQ(service_.calls(Call::UploadChunk), 4u);

    auto remote = remote::RemoteTreeFetcher(service_).fetch("demo");
    ASSERT_TRUE(remote.is_ok());
    ASSERT_NE(remote.value(), nullptr);
    EXPECT_EQ(remote.value()->find({"README.md"})->size(), 5u);
    EXPECT_EQ(remote.value()->find({"docs", "a.txt"})->size(), 1u);
}

TEST_F(SyncEngineTest, SecondUploadSkipsEverything) {
    upload_ok(scenario_upload());
    const size_t chunks_after_first = service_.calls(Call::UploadChunk);

    auto again = upload_ok(scenario_upload());

    EXPECT_TRUE(again.succeeded());
    EXPECT_EQ(service_.calls(Call::UploadChunk), chunks_after_first);
    EXPECT_EQ(service_.calls(Call::InitiateUpload), 2u);
    EXPECT_EQ(again.plan.count(OperationKind::UploadFile), 0u);
    EXPECT_EQ(again.report.find("README.md")->status, OutcomeStatus::Skipped);
    EXPECT_EQ(again.report.find("docs/a.txt")->status, OutcomeStatus::Skipped);
}

TEST_F(SyncEngineTest, ChangedFileReplacesRemoteCopy) {
    upload_ok(scenario_upload());
    const auto id_before = service_.node_id("demo", "README.md");

    write_file(source_ / "README.md", "hello again");
    auto outcome = upload_ok(scenario_upload());

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(service_.file_content("demo", "README.md"), std::optional<std::string>("hello again"));
    EXPECT_EQ(service_.node_id("demo", "README.md"), id_before);
    EXPECT_EQ(outcome.report.find("docs/a.txt")->status, OutcomeStatus::Skipped);
}

TEST_F(SyncEngineTest, RoundTripIsByteIdentical) {
    write_file(source_ / "docs" / "nested" / "deep.bin", std::string("\x00\x01\x02\xff payload", 12));
    upload_ok(scenario_upload());

    const fs::path destination = work_ / "copy";
    auto outcome = engine(service_).download(download_to(destination));

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(read_file(destination / "README.md"), "hello");
    EXPECT_EQ(read_file(destination / "docs" / "a.txt"), "x");
    EXPECT_EQ(read_file(destination / "docs" / "nested" / "deep.bin"),
              std::string("\x00\x01\x02\xff payload", 12));
}

TEST_F(SyncEngineTest, DownloadIntoMatchingCopyFetchesNothing) {
    upload_ok(scenario_upload());
    const fs::path destination = work_ / "copy";
    ASSERT_TRUE(engine(service_).download(download_to(destination)).is_ok());
    const size_t ranges = service_.calls(Call::FetchRange);

    auto again = engine(service_).download(download_to(destination));

    ASSERT_TRUE(again.is_ok()) << again.error().describe();
    EXPECT_TRUE(again.value().succeeded());
    EXPECT_EQ(service_.calls(Call::FetchRange), ranges);
    EXPECT_EQ(again.value().plan.count(OperationKind::FetchFile), 0u);
}

TEST_F(SyncEngineTest, DownloadResumesAfterInterruption) {
    upload_ok(scenario_upload());
    const fs::path destination = work_ / "copy";
    ASSERT_TRUE(engine(service_).download(download_to(destination)).is_ok());

    // An interrupted run leaves the partial file instead of the final one
    fs::remove(destination / "docs" / "a.txt");
    write_file(destination / "docs" / "a.txt.ddsync-partial", "?");

    auto resumed = engine(service_).download(download_to(destination));

    ASSERT_TRUE(resumed.is_ok()) << resumed.error().describe();
    EXPECT_TRUE(resumed.value().succeeded());
    EXPECT_EQ(resumed.value().plan.count(OperationKind::FetchFile), 1u);
    EXPECT_EQ(resumed.value().report.find("docs/a.txt")->status, OutcomeStatus::Succeeded);
    EXPECT_EQ(resumed.value().report.find("README.md")->status, OutcomeStatus::Skipped);
    EXPECT_EQ(read_file(destination / "docs" / "a.txt"), "x");
    EXPECT_FALSE(fs::exists(destination / "docs" / "a.txt.ddsync-partial"));
}

TEST_F(SyncEngineTest, StalePartialBesideCompleteFileIsIgnored) {
    upload_ok(scenario_upload());
    const fs::path destination = work_ / "copy";
    ASSERT_TRUE(engine(service_).download(download_to(destination)).is_ok());
    write_file(destination / "README.md.ddsync-partial", "hel");

    auto again = engine(service_).download(download_to(destination));

    ASSERT_TRUE(again.is_ok()) << again.error().describe();
    EXPECT_TRUE(again.value().succeeded());
    EXPECT_EQ(again.value().plan.count(OperationKind::FetchFile), 0u);
}

TEST_F(SyncEngineTest, DownloadRefusesStrayLocalFiles) {
    upload_ok(scenario_upload());
    const fs::path destination = work_ / "copy";
    write_file(destination / "notes.txt", "mine");

    auto outcome = engine(service_).download(download_to(destination));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Validation);
    EXPECT_EQ(service_.calls(Call::FetchRange), 0u);
    EXPECT_EQ(read_file(destination / "notes.txt"), "mine");
}

TEST_F(SyncEngineTest, DownloadHonoursIncludeFilter) {
    upload_ok(scenario_upload());
    auto options = download_to(work_ / "copy");
    options.include = {"docs"};

    auto outcome = engine(service_).download(options);

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_TRUE(fs::exists(work_ / "copy" / "docs" / "a.txt"));
    EXPECT_FALSE(fs::exists(work_ / "copy" / "README.md"));
}

TEST_F(SyncEngineTest, DownloadOfMissingProjectIsNotFound) {
    auto outcome = engine(service_).download(download_to(work_ / "copy"));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::NotFound);
    EXPECT_FALSE(fs::exists(work_ / "copy"));
}

TEST_F(SyncEngineTest, DownloadOntoAFileIsRejected) {
    upload_ok(scenario_upload());
    write_file(work_ / "copy", "not a directory");

    auto outcome = engine(service_).download(download_to(work_ / "copy"));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Validation);
}

TEST_F(SyncEngineTest, EmptyProjectNameIsRejected) {
    auto options = scenario_upload();
    options.project.clear();

    auto outcome = engine(service_).upload(options);

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Validation);
    EXPECT_EQ(service_.calls(Call::FindProject), 0u);
}

TEST_F(SyncEngineTest, AuthFailureStopsBeforeTransfers) {
    service_.fail_next(Call::FindProject, 1, Error::auth("invalid token"));

    auto outcome = engine(service_).upload(scenario_upload());

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Auth);
    EXPECT_EQ(service_.calls(Call::CreateProject), 0u);
    EXPECT_EQ(service_.calls(Call::UploadChunk), 0u);
}

TEST_F(SyncEngineTest, FatalFileFailureIsIsolated) {
    write_file(source_ / "bad.txt", "rejected");
    auto options = scenario_upload();
    options.paths.push_back(source_ / "bad.txt");
    service_.fail_finalize("bad.txt", Error::service(422, "quota exceeded"));

    auto outcome = upload_ok(options);

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.session.state, SessionState::Failed);
    EXPECT_EQ(outcome.report.find("bad.txt")->status, OutcomeStatus::Failed);
    EXPECT_EQ(outcome.report.find("README.md")->status, OutcomeStatus::Succeeded);
    EXPECT_EQ(outcome.report.find("docs/a.txt")->status, OutcomeStatus::Succeeded);
    EXPECT_EQ(service_.file_content("demo", "README.md"), std::optional<std::string>("hello"));
}

TEST_F(SyncEngineTest, TransientChunkFailuresConverge) {
    service_.fail_chunk("README.md", 1, 2, Error::service(503, "busy"));

    auto outcome = upload_ok(scenario_upload());

    EXPECT_TRUE(outcome.succeeded());
    const auto* readme = outcome.report.find("README.md");
    ASSERT_NE(readme, nullptr);
    EXPECT_EQ(readme->chunk_attempts, (std::vector<uint32_t>{1, 3, 1}));
    EXPECT_EQ(service_.chunk_attempts("README.md", 1), 3u);
}

TEST_F(SyncEngineTest, FailedFolderCancelsItsSubtree) {
    write_file(source_ / "docs" / "b.txt", "yy");
    service_.fail_folder("docs", Error::service(409, "name reserved"));

    auto outcome = upload_ok(scenario_upload());

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.report.find("docs")->status, OutcomeStatus::Failed);
    EXPECT_EQ(outcome.report.find("docs/a.txt")->status, OutcomeStatus::Cancelled);
    EXPECT_EQ(outcome.report.find("docs/b.txt")->status, OutcomeStatus::Cancelled);
    EXPECT_EQ(outcome.report.find("README.md")->status, OutcomeStatus::Succeeded);
}

TEST_F(SyncEngineTest, DryRunTouchesNothing) {
    auto options = scenario_upload();
    options.dry_run = true;

    auto outcome = upload_ok(options);

    EXPECT_TRUE(outcome.dry_run);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.report.find("README.md")->status, OutcomeStatus::Planned);
    EXPECT_EQ(outcome.plan.count(OperationKind::UploadFile), 2u);
    EXPECT_EQ(service_.calls(Call::CreateProject), 0u);
    EXPECT_EQ(service_.calls(Call::CreateFolder), 0u);
    EXPECT_EQ(service_.calls(Call::InitiateUpload), 0u);
    EXPECT_EQ(service_.calls(Call::UploadChunk), 0u);
}

TEST_F(SyncEngineTest, VerificationCatchesMismatchedRemoteCopy) {
    ListingTamperer tamperer(service_);
    tamperer.tamper_with("a.txt");

    auto outcome = engine(tamperer).upload(scenario_upload());

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_FALSE(outcome.value().succeeded());
    const auto* a = outcome.value().report.find("docs/a.txt");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->status, OutcomeStatus::Failed);
    ASSERT_TRUE(a->error.has_value());
    EXPECT_EQ(a->error->kind, ErrorKind::Integrity);
    EXPECT_EQ(outcome.value().report.find("README.md")->status, OutcomeStatus::Succeeded);
}

TEST_F(SyncEngineTest, UnverifiableUploadIsNotASuccess) {
    ListingTamperer tamperer(service_);
    tamperer.fail_listings();

    auto outcome = engine(tamperer).upload(scenario_upload());

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_FALSE(outcome.value().report.has_failures());
    EXPECT_FALSE(outcome.value().verified);
    EXPECT_FALSE(outcome.value().succeeded());
    EXPECT_EQ(outcome.value().session.state, SessionState::Failed);
}

TEST_F(SyncEngineTest, PublishesRunMilestones) {
    std::vector<std::string> seen;
    bus_.subscribe<events::RunStartedEvent>([&](const events::RunStartedEvent& e) { seen.push_back("start " + e.project); });
    bus_.subscribe<events::PlanReadyEvent>([&](const events::PlanReadyEvent& e) {
        seen.push_back("plan " + std::to_string(e.transfer_files) + " " + std::to_string(e.transfer_bytes));
    });
    bus_.subscribe<events::RunFinishedEvent>([&](const events::RunFinishedEvent& e) {
        seen.push_back("finish " + std::to_string(e.succeeded));
    });

    upload_ok(scenario_upload());

    EXPECT_EQ(seen, (std::vector<std::string>{"start demo", "plan 2 6", "finish 4"}));
}
