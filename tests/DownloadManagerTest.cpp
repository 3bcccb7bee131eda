#include "core/downloader/DownloadManager.hpp"
#include "core/downloader/DownloadEvents.hpp"
#include "utils/HashUtils.hpp"
#include "FakeHttpClient.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace heal::core::downloader;
using heal::core::EventBus;
using heal::core::json;
using heal::test::FakeHttpClient;
using heal::test::makeBody;
using heal::test::readFile;
using heal::test::waitUntil;

namespace fs = std::filesystem;

namespace {

constexpr auto kWait = std::chrono::seconds(10);

std::string urlFor(int n) {
    return "http://host/files/file" + std::to_string(n) + ".bin";
}

/**
 * Collects every download.* event as (name, payload)
 */
class EventRecorder {
public:
    explicit EventRecorder(EventBus& bus) : m_bus(bus) {
        for (const char* name : {events::Added, events::Started, events::Progress, events::StatusChanged,
                                 events::Completed, events::Failed, events::Removed}) {
            std::string event(name);
            m_subscriptions.push_back(bus.subscribe(event, [this, event](const json& data) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_events.emplace_back(event, data);
            }));
        }
    }

    ~EventRecorder() {
        for (const auto& subscription : m_subscriptions) {
            m_bus.unsubscribe(subscription);
        }
    }

    /**
     * Event names for one id, progress excluded, status events as "download.status:<status>"
     */
    std::vector<std::string> lifecycle(const std::string& id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> names;
        for (const auto& [event, data] : m_events) {
            if (data.value("id", "") != id || event == events::Progress) continue;
            if (event == events::StatusChanged) {
                names.push_back(event + ":" + data.value("status", ""));
            } else {
                names.push_back(event);
            }
        }
        return names;
    }

    std::vector<std::string> idsOf(const std::string& name) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> ids;
        for (const auto& [event, data] : m_events) {
            if (event == name) ids.push_back(data.value("id", ""));
        }
        return ids;
    }

private:
    EventBus& m_bus;
    std::vector<heal::core::SubscriptionPtr> m_subscriptions;
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, json>> m_events;
};

} // namespace

class DownloadManagerTest : public heal::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        m_settings.downloadDirectory = dir() / "dl";
        m_settings.maxConcurrentDownloads = 2;
        m_settings.retrySweepInterval = std::chrono::milliseconds(50);
        m_settings.progressInterval = std::chrono::milliseconds(5);
        m_settings.chunkSize = 1024;
        m_settings.bufferChunks = 4;
    }

    void TearDown() override {
        m_http.releaseAll();
        m_manager.reset();
        TempDirTest::TearDown();
    }

    DownloadManager& manager() {
        if (!m_manager) {
            m_manager = std::make_unique<DownloadManager>(m_settings, m_http, m_bus);
            m_manager->initialize();
        }
        return *m_manager;
    }

    void restart() {
        m_manager.reset();
        manager();
    }

    TransferStatus statusOf(const std::string& id) {
        auto info = manager().getInfo(id);
        EXPECT_TRUE(info) << "unknown id " << id;
        return info ? info->status : TransferStatus::Failed;
    }

    bool waitForStatus(const std::string& id, TransferStatus status) {
        return waitUntil([&]() { return statusOf(id) == status; });
    }

    bool waitForBytes(const std::string& id, int64_t bytes) {
        return waitUntil([&]() {
            auto info = manager().getInfo(id);
            return info && info->downloadedBytes >= bytes;
        });
    }

    FakeHttpClient m_http;
    EventBus m_bus;
    DownloadSettings m_settings;
    std::unique_ptr<DownloadManager> m_manager;
};

TEST_F(DownloadManagerTest, AddDerivesDestinationAndCompletes) {
    std::string body = makeBody(30000);
    m_http.serve(urlFor(1), body);

    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(manager().waitForAll(kWait));

    EXPECT_EQ(id.size(), 12u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);

    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->status, TransferStatus::Completed);
    EXPECT_EQ(fs::path(info->destination), dir() / "dl" / "file1.bin");
    EXPECT_EQ(info->downloadedBytes, 30000);
    EXPECT_EQ(info->totalBytes, 30000);
    EXPECT_TRUE(info->startedAt);
    EXPECT_TRUE(info->endedAt);
    EXPECT_EQ(readFile(info->destination), body);
}

TEST_F(DownloadManagerTest, FallbackDestinationWithoutBasename) {
    m_http.serve("http://host/", "index");

    std::string id = manager().add("http://host/");
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    std::string expected = "download_" + heal::utils::HashUtils::md5String("http://host/").substr(0, 8);
    EXPECT_EQ(fs::path(info->destination).filename().string(), expected);
    EXPECT_EQ(info->status, TransferStatus::Completed);
}

TEST_F(DownloadManagerTest, ExplicitDestinationAndOptionsAreKept) {
    m_http.serve(urlFor(1), "payload");
    AddOptions options;
    options.maxRetries = 7;
    options.chunkSize = 16;
    options.headers["X-Token"] = "t";

    std::string target = (dir() / "custom" / "name.dat").string();
    std::string id = manager().add(urlFor(1), target, options);
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->destination, target);
    EXPECT_EQ(info->maxRetries, 7);
    EXPECT_EQ(info->chunkSize, 16u);
    EXPECT_EQ(readFile(target), "payload");
    EXPECT_EQ(m_http.requests().at(0).headers.at("x-token"), "t");
}

TEST_F(DownloadManagerTest, AddRejectsMalformedInput) {
    EXPECT_THROW(manager().add(""), std::invalid_argument);

    AddOptions options;
    options.chunkSize = 0;
    EXPECT_THROW(manager().add(urlFor(1), "", options), std::invalid_argument);
    EXPECT_TRUE(manager().list().empty());
}

TEST_F(DownloadManagerTest, ConcurrencyCapAndFifoOrder) {
    EventRecorder recorder(m_bus);
    m_http.hold();
    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) {
        m_http.serve(urlFor(i), makeBody(5000, static_cast<unsigned>(i)));
        ids.push_back(manager().add(urlFor(i)));
    }

    EXPECT_EQ(manager().activeDownloads(), (std::vector<std::string>{ids[0], ids[1]}));
    EXPECT_EQ(statusOf(ids[2]), TransferStatus::Pending);
    EXPECT_EQ(statusOf(ids[3]), TransferStatus::Pending);

    auto stats = manager().getStatistics();
    EXPECT_EQ(stats.total, 4u);
    EXPECT_EQ(stats.downloading, 2u);
    EXPECT_EQ(stats.pending, 2u);
    EXPECT_EQ(stats.downloading, manager().activeDownloads().size());

    m_http.releaseAll();
    ASSERT_TRUE(manager().waitForAll(kWait));

    for (const auto& id : ids) {
        EXPECT_EQ(statusOf(id), TransferStatus::Completed);
    }
    EXPECT_EQ(recorder.idsOf(events::Started), ids);
}

TEST_F(DownloadManagerTest, PauseThenResumeProducesIdenticalFile) {
    std::string body = makeBody(200000);
    auto& resource = m_http.serve(urlFor(1), body);
    resource.sliceDelay = std::chrono::milliseconds(2);

    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(waitForBytes(id, 20000));

    EXPECT_TRUE(manager().pause(id));
    EXPECT_EQ(statusOf(id), TransferStatus::Paused);
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto paused = manager().getInfo(id);
    ASSERT_TRUE(paused);
    EXPECT_EQ(paused->status, TransferStatus::Paused);
    EXPECT_GT(paused->downloadedBytes, 0);
    EXPECT_LT(paused->downloadedBytes, 200000);
    EXPECT_EQ(static_cast<int64_t>(fs::file_size(paused->destination)), paused->downloadedBytes);

    EXPECT_TRUE(manager().resume(id));
    ASSERT_TRUE(manager().waitForAll(kWait));

    EXPECT_EQ(statusOf(id), TransferStatus::Completed);
    EXPECT_EQ(readFile(paused->destination), body);

    auto ranges = m_http.rangeHeaders(urlFor(1));
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[1], "bytes=" + std::to_string(paused->downloadedBytes) + "-");
}

TEST_F(DownloadManagerTest, InvalidTransitionsReturnFalse) {
    m_http.serve(urlFor(1), "done");
    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(manager().waitForAll(kWait));

    EXPECT_FALSE(manager().pause(id));
    EXPECT_FALSE(manager().resume(id));
    EXPECT_TRUE(manager().start(id));
    EXPECT_EQ(statusOf(id), TransferStatus::Completed);

    EXPECT_FALSE(manager().pause("unknown"));
    EXPECT_FALSE(manager().resume("unknown"));
    EXPECT_FALSE(manager().start("unknown"));
    EXPECT_FALSE(manager().cancel("unknown"));
    EXPECT_FALSE(manager().remove("unknown"));
    EXPECT_FALSE(manager().getInfo("unknown"));
}

TEST_F(DownloadManagerTest, CancelPendingNeverStartsWorker) {
    m_settings.maxConcurrentDownloads = 1;
    m_http.hold();
    m_http.serve(urlFor(1), makeBody(1000));
    m_http.serve(urlFor(2), makeBody(1000));

    std::string first = manager().add(urlFor(1));
    std::string second = manager().add(urlFor(2));
    ASSERT_EQ(statusOf(second), TransferStatus::Pending);

    EXPECT_TRUE(manager().cancel(second));
    EXPECT_EQ(statusOf(second), TransferStatus::Cancelled);

    m_http.releaseAll();
    ASSERT_TRUE(manager().waitForAll(kWait));

    EXPECT_EQ(statusOf(first), TransferStatus::Completed);
    EXPECT_EQ(statusOf(second), TransferStatus::Cancelled);
    EXPECT_EQ(m_http.requestCount(urlFor(2)), 0u);

    EXPECT_FALSE(manager().start(second));
    EXPECT_FALSE(manager().cancel(second));
}

TEST_F(DownloadManagerTest, CancelDeletesPartialFile) {
    auto& resource = m_http.serve(urlFor(1), makeBody(200000));
    resource.sliceDelay = std::chrono::milliseconds(2);

    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(waitForBytes(id, 5000));
    std::string destination = manager().getInfo(id)->destination;

    EXPECT_TRUE(manager().cancel(id));
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->status, TransferStatus::Cancelled);
    EXPECT_EQ(info->downloadedBytes, 0);
    EXPECT_FALSE(fs::exists(destination));
}

TEST_F(DownloadManagerTest, CancelCanKeepPartialFile) {
    auto& resource = m_http.serve(urlFor(1), makeBody(200000));
    resource.sliceDelay = std::chrono::milliseconds(2);

    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(waitForBytes(id, 5000));

    EXPECT_TRUE(manager().cancel(id, false));
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    EXPECT_TRUE(fs::exists(info->destination));
    EXPECT_EQ(static_cast<int64_t>(fs::file_size(info->destination)), info->downloadedBytes);
}

TEST_F(DownloadManagerTest, CancelKeepThenStartResumesIdentically) {
    std::string body = makeBody(200000);
    auto& resource = m_http.serve(urlFor(1), body);
    resource.sliceDelay = std::chrono::milliseconds(2);

    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(waitForBytes(id, 20000));

    EXPECT_TRUE(manager().cancel(id, false));
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto cancelled = manager().getInfo(id);
    ASSERT_TRUE(cancelled);
    EXPECT_EQ(cancelled->status, TransferStatus::Cancelled);
    EXPECT_GT(cancelled->downloadedBytes, 0);
    EXPECT_LT(cancelled->downloadedBytes, 200000);
    EXPECT_EQ(static_cast<int64_t>(fs::file_size(cancelled->destination)), cancelled->downloadedBytes);

    // Resume stays limited to paused and failed records
    EXPECT_FALSE(manager().resume(id));

    EXPECT_TRUE(manager().start(id));
    ASSERT_TRUE(manager().waitForAll(kWait));

    EXPECT_EQ(statusOf(id), TransferStatus::Completed);
    EXPECT_EQ(readFile(cancelled->destination), body);

    auto ranges = m_http.rangeHeaders(urlFor(1));
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[1], "bytes=" + std::to_string(cancelled->downloadedBytes) + "-");
}

TEST_F(DownloadManagerTest, CancelOfCompletedKeepsFile) {
    m_http.serve(urlFor(1), "complete");
    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(manager().waitForAll(kWait));

    EXPECT_TRUE(manager().cancel(id));
    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->status, TransferStatus::Cancelled);
    EXPECT_EQ(info->downloadedBytes, 8);
    EXPECT_EQ(readFile(info->destination), "complete");

    EXPECT_TRUE(manager().cancel(id));
    EXPECT_EQ(statusOf(id), TransferStatus::Cancelled);
}

TEST_F(DownloadManagerTest, RemoveForgetsRecordAndStartsNext) {
    EventRecorder recorder(m_bus);
    m_settings.maxConcurrentDownloads = 1;
    m_http.hold();
    m_http.serve(urlFor(1), makeBody(1000));
    m_http.serve(urlFor(2), makeBody(1000));

    std::string first = manager().add(urlFor(1));
    std::string second = manager().add(urlFor(2));
    ASSERT_EQ(statusOf(second), TransferStatus::Pending);

    EXPECT_TRUE(manager().remove(first));
    EXPECT_FALSE(manager().getInfo(first));
    EXPECT_EQ(statusOf(second), TransferStatus::Downloading);

    m_http.releaseAll();
    ASSERT_TRUE(manager().waitForAll(kWait));

    EXPECT_EQ(statusOf(second), TransferStatus::Completed);
    EXPECT_EQ(manager().list().size(), 1u);
    EXPECT_EQ(recorder.idsOf(events::Removed), std::vector<std::string>{first});
}

TEST_F(DownloadManagerTest, RemoveCanDeleteCompletedFile) {
    m_http.serve(urlFor(1), "bytes");
    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(manager().waitForAll(kWait));
    std::string destination = manager().getInfo(id)->destination;

    EXPECT_TRUE(manager().remove(id, true));
    EXPECT_FALSE(fs::exists(destination));
    EXPECT_TRUE(manager().list().empty());
}

TEST_F(DownloadManagerTest, RetryBudgetIsRespected) {
    auto& resource = m_http.serve(urlFor(1), makeBody(1000));
    resource.failuresRemaining = 1000;

    AddOptions options;
    options.maxRetries = 2;
    std::string id = manager().add(urlFor(1), "", options);
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->status, TransferStatus::Failed);
    EXPECT_EQ(info->retryCount, 2);
    ASSERT_TRUE(info->lastError);
    EXPECT_EQ(info->lastError->rfind("Network error", 0), 0u) << *info->lastError;
    EXPECT_EQ(m_http.requestCount(urlFor(1)), 2u);

    // Several more sweep intervals: no further automatic attempt
    manager().retryFailedNow();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(m_http.requestCount(urlFor(1)), 2u);
    EXPECT_EQ(statusOf(id), TransferStatus::Failed);
}

TEST_F(DownloadManagerTest, DisconnectIsRetriedWithRangeAndCompletes) {
    EventRecorder recorder(m_bus);
    std::string body = makeBody(1000);
    auto& resource = m_http.serve("http://host/file.bin", body);
    resource.sliceSize = 100;
    resource.disconnectAfter = 400;

    std::string id = manager().add("http://host/file.bin");
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->status, TransferStatus::Completed);
    EXPECT_EQ(info->downloadedBytes, 1000);
    EXPECT_EQ(info->totalBytes, 1000);
    EXPECT_EQ(info->retryCount, 1);
    EXPECT_FALSE(info->lastError);
    EXPECT_EQ(readFile(info->destination), body);
    EXPECT_EQ(m_http.rangeHeaders("http://host/file.bin"), (std::vector<std::string>{"", "bytes=400-"}));

    std::vector<std::string> expected = {
        events::Added,
        std::string(events::StatusChanged) + ":downloading",
        events::Started,
        std::string(events::StatusChanged) + ":failed",
        events::Failed,
        std::string(events::StatusChanged) + ":pending",
        std::string(events::StatusChanged) + ":downloading",
        events::Started,
        std::string(events::StatusChanged) + ":completed",
        events::Completed,
    };
    EXPECT_EQ(recorder.lifecycle(id), expected);
}

TEST_F(DownloadManagerTest, ResumeOfFailedRecordResetsRetries) {
    auto& resource = m_http.serve(urlFor(1), makeBody(2000));
    resource.failuresRemaining = 2;

    AddOptions options;
    options.maxRetries = 2;
    std::string id = manager().add(urlFor(1), "", options);
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto failed = manager().getInfo(id);
    ASSERT_TRUE(failed);
    EXPECT_EQ(failed->status, TransferStatus::Failed);
    EXPECT_EQ(failed->retryCount, 2);
    EXPECT_EQ(m_http.requestCount(urlFor(1)), 2u);

    EXPECT_TRUE(manager().resume(id));
    auto resumed = manager().getInfo(id);
    EXPECT_EQ(resumed->retryCount, 0);
    EXPECT_FALSE(resumed->lastError);

    ASSERT_TRUE(manager().waitForAll(kWait));
    EXPECT_EQ(statusOf(id), TransferStatus::Completed);
}

TEST_F(DownloadManagerTest, ChecksumMismatchFailsAndRestartsFromZero) {
    std::string body = makeBody(3000);
    m_http.serve(urlFor(1), body);

    AddOptions options;
    options.maxRetries = 0;
    options.checksum = Checksum{std::string(40, 'f'), heal::utils::HashAlgorithm::Sha1};
    std::string id = manager().add(urlFor(1), "", options);
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto info = manager().getInfo(id);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->status, TransferStatus::Failed);
    ASSERT_TRUE(info->lastError);
    EXPECT_EQ(info->lastError->rfind("Checksum error", 0), 0u) << *info->lastError;
    EXPECT_FALSE(info->resumable);
    EXPECT_EQ(readFile(info->destination), body);

    EXPECT_TRUE(manager().resume(id));
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto ranges = m_http.rangeHeaders(urlFor(1));
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[1], "");
}

TEST_F(DownloadManagerTest, MatchingChecksumCompletes) {
    std::string body = makeBody(3000);
    m_http.serve(urlFor(1), body);

    AddOptions options;
    options.checksum = Checksum{heal::utils::HashUtils::hashString(body, heal::utils::HashAlgorithm::Sha256),
                                heal::utils::HashAlgorithm::Sha256};
    std::string id = manager().add(urlFor(1), "", options);
    ASSERT_TRUE(manager().waitForAll(kWait));

    EXPECT_EQ(statusOf(id), TransferStatus::Completed);
}

TEST_F(DownloadManagerTest, StatisticsAggregateRecords) {
    m_http.serve(urlFor(1), makeBody(1000));
    m_http.serve(urlFor(2), makeBody(3000));
    auto& failing = m_http.serve(urlFor(3), makeBody(10));
    failing.failuresRemaining = 1000;

    AddOptions noRetry;
    noRetry.maxRetries = 0;
    manager().add(urlFor(1));
    manager().add(urlFor(2));
    manager().add(urlFor(3), "", noRetry);
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto stats = manager().getStatistics();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.completed, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.downloading, 0u);
    EXPECT_EQ(stats.totalBytes, 4000);
    EXPECT_EQ(stats.downloadedBytes, 4000);
    EXPECT_DOUBLE_EQ(stats.progress, 100.0);
    EXPECT_DOUBLE_EQ(stats.totalSpeed, 0.0);
}

TEST_F(DownloadManagerTest, ClearCompletedKeepsFiles) {
    m_http.serve(urlFor(1), "one");
    m_http.serve(urlFor(2), "two");
    std::string first = manager().add(urlFor(1));
    manager().add(urlFor(2));
    ASSERT_TRUE(manager().waitForAll(kWait));
    std::string destination = manager().getInfo(first)->destination;

    EXPECT_EQ(manager().clearCompleted(), 2u);
    EXPECT_TRUE(manager().list().empty());
    EXPECT_TRUE(fs::exists(destination));
}

TEST_F(DownloadManagerTest, SetMaxConcurrentFillsCapacity) {
    m_settings.maxConcurrentDownloads = 1;
    m_http.hold();
    for (int i = 0; i < 3; ++i) {
        m_http.serve(urlFor(i), makeBody(100));
        manager().add(urlFor(i));
    }
    EXPECT_EQ(manager().activeDownloads().size(), 1u);

    manager().setMaxConcurrent(3);
    EXPECT_EQ(manager().getMaxConcurrent(), 3u);
    EXPECT_EQ(manager().activeDownloads().size(), 3u);

    EXPECT_THROW(manager().setMaxConcurrent(0), std::invalid_argument);
    m_http.releaseAll();
    ASSERT_TRUE(manager().waitForAll(kWait));
}

TEST_F(DownloadManagerTest, PauseAllAndResumeAll) {
    m_http.hold();
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        m_http.serve(urlFor(i), makeBody(5000, static_cast<unsigned>(i)));
        ids.push_back(manager().add(urlFor(i)));
    }

    EXPECT_EQ(manager().pauseAll(), 3u);
    for (const auto& id : ids) {
        EXPECT_EQ(statusOf(id), TransferStatus::Paused);
    }

    m_http.releaseAll();
    ASSERT_TRUE(manager().waitForAll(kWait));
    EXPECT_EQ(manager().getStatistics().paused, 3u);

    EXPECT_EQ(manager().resumeAll(), 3u);
    ASSERT_TRUE(manager().waitForAll(kWait));
    for (const auto& id : ids) {
        EXPECT_EQ(statusOf(id), TransferStatus::Completed);
    }
}

TEST_F(DownloadManagerTest, StatePersistedOnEveryChange) {
    m_http.serve(urlFor(1), "persist me");
    std::string id = manager().add(urlFor(1));
    ASSERT_TRUE(manager().waitForAll(kWait));

    auto state = json::parse(readFile(m_settings.resolvedStateFile()));
    ASSERT_TRUE(state["downloads"].contains(id));
    EXPECT_EQ(state["downloads"][id]["status"], "completed");

    EXPECT_TRUE(manager().remove(id));
    state = json::parse(readFile(m_settings.resolvedStateFile()));
    EXPECT_FALSE(state["downloads"].contains(id));
}

TEST_F(DownloadManagerTest, RestartRestoresRecords) {
    m_settings.maxConcurrentDownloads = 1;
    std::string slowBody = makeBody(300000);
    auto& slow = m_http.serve(urlFor(1), slowBody);
    slow.sliceDelay = std::chrono::milliseconds(3);
    m_http.serve(urlFor(2), makeBody(2000));

    std::string running = manager().add(urlFor(1));
    std::string queued = manager().add(urlFor(2));
    ASSERT_TRUE(waitForBytes(running, 5000));

    // Shutdown pauses the running transfer and keeps the queued one
    manager().shutdown();
    EXPECT_EQ(statusOf(running), TransferStatus::Paused);
    EXPECT_EQ(statusOf(queued), TransferStatus::Pending);

    m_http.resource(urlFor(1)).sliceDelay = std::chrono::milliseconds(0);
    restart();

    auto restored = manager().list();
    ASSERT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored[0].id, running);
    EXPECT_EQ(restored[1].id, queued);
    EXPECT_EQ(statusOf(running), TransferStatus::Paused);

    // The queued transfer is scheduled again, the paused one waits for resume
    ASSERT_TRUE(manager().waitForAll(kWait));
    EXPECT_EQ(statusOf(queued), TransferStatus::Completed);
    EXPECT_EQ(statusOf(running), TransferStatus::Paused);

    EXPECT_TRUE(manager().resume(running));
    ASSERT_TRUE(manager().waitForAll(kWait));
    EXPECT_EQ(statusOf(running), TransferStatus::Completed);
    EXPECT_EQ(readFile(manager().getInfo(running)->destination), slowBody);
}

TEST_F(DownloadManagerTest, DownloadingRecordInStateFileComesBackPaused) {
    m_http.serve(urlFor(1), makeBody(100));
    fs::create_directories(dir() / "dl");

    TransferRecord record;
    record.id = "abcdefabcdef";
    record.url = urlFor(1);
    record.destination = (dir() / "dl" / "file1.bin").string();
    record.status = TransferStatus::Downloading;
    record.downloadedBytes = 0;
    record.createdAt = std::chrono::system_clock::now();
    json state = {{"downloads", {{record.id, record}}}};
    heal::test::writeFile(m_settings.resolvedStateFile(), state.dump());

    EXPECT_EQ(statusOf(record.id), TransferStatus::Paused);
    ASSERT_TRUE(manager().waitForAll(kWait));
    EXPECT_EQ(m_http.requestCount(urlFor(1)), 0u);
}
