/**
 * DownloadEngine.cpp
 *
 * Implementation of the transfer lifecycle engine.
 */

#include "DownloadEngine.hpp"
#include "ResumeDataValidator.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathUtils.hpp"

#include <algorithm>
#include <filesystem>

namespace tether::core::downloader {

namespace {

using Clock = DownloadRecord::Clock;

DownloadStatus statusFromTaskState(TaskState state) {
    switch (state) {
        case TaskState::Running:   return DownloadStatus::Downloading;
        case TaskState::Suspended: return DownloadStatus::Paused;
        default:                   return DownloadStatus::Failed;
    }
}

RemainingTime splitSeconds(int64_t totalSeconds) {
    RemainingTime remaining;
    remaining.hours = static_cast<int>(totalSeconds / 3600);
    remaining.minutes = static_cast<int>((totalSeconds % 3600) / 60);
    remaining.seconds = static_cast<int>(totalSeconds % 60);
    return remaining;
}

} // namespace

template<typename Fn>
void DownloadEngine::notify(const char* event, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        LOG_ERROR("Observer threw from {} callback: {}", event, e.what());
    }
}

DownloadEngine::DownloadEngine(Transport& transport,
                               DownloadObserver& observer,
                               CompletionHandler backgroundCompletion)
    : m_transport(transport)
    , m_observer(observer)
    , m_backgroundCompletion(std::move(backgroundCompletion))
    , m_dispatcher(std::make_shared<ThreadPool>(1, "dispatch")) {

    m_defaultDirectory = Config::instance().get<std::string>("downloads.defaultDirectory", "");
    if (m_defaultDirectory.empty()) {
        m_defaultDirectory = utils::PathUtils::getDocumentsPath().string();
    }
}

DownloadEngine::~DownloadEngine() {
    shutdown();
}

void DownloadEngine::initialize() {
    if (m_initialized.exchange(true)) return;

    LOG_INFO("Initializing DownloadEngine (default directory: {})", defaultDirectory());

    // No timeout: relies on the transport answering
    std::vector<TaskInfo> tasks = m_transport.existingTasks().get();
    LOG_DEBUG("Transport reported {} existing task(s)", tasks.size());

    dispatch([this, tasks]() {
        reconcile(tasks);
    });
    waitIdle();

    m_transport.setDelegate(this);
}

void DownloadEngine::shutdown() {
    std::shared_ptr<ThreadPool> dispatcher;
    {
        std::lock_guard<std::mutex> lock(m_dispatchMutex);
        if (!m_dispatcher) return;
    }

    LOG_INFO("Shutting down DownloadEngine");

    m_transport.setDelegate(nullptr);
    waitIdle();

    {
        std::lock_guard<std::mutex> lock(m_dispatchMutex);
        dispatcher = std::move(m_dispatcher);
    }
    // Destroying the pool runs anything still queued
    dispatcher.reset();
}

// -- Public operations --

RecordId DownloadEngine::start(const std::string& name,
                               const std::string& url,
                               const std::string& destinationPath) {
    TransferIdentity identity(name, url, destinationPath);
    RecordId id = ++m_nextId;

    dispatch([this, id, identity]() {
        handleStart(id, identity);
    });

    return id;
}

void DownloadEngine::pause(RecordId id) {
    dispatch([this, id]() {
        DownloadRecord record;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto index = indexOf(id);
            if (!index) {
                LOG_WARN("pause: no download with id {}", id);
                return;
            }
            record = m_records[*index];
        }

        if (record.status == DownloadStatus::Paused) return;

        if (record.handle != kNoTask) {
            m_transport.suspend(record.handle);
        }

        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            index = *indexOf(id);
            auto& stored = m_records[index];
            stored.status = DownloadStatus::Paused;
            stored.startTime = Clock::now();
            record = stored;
        }

        LOG_INFO("Paused {}", record.identity.name());
        notify("paused", [&] { m_observer.onPaused(record, index); });
    });
}

void DownloadEngine::resume(RecordId id) {
    dispatch([this, id]() {
        DownloadRecord record;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto index = indexOf(id);
            if (!index) {
                LOG_WARN("resume: no download with id {}", id);
                return;
            }
            record = m_records[*index];
        }

        if (record.status == DownloadStatus::Downloading) return;

        TaskHandle handle = ensureHandle(record);
        m_transport.resume(handle);

        // startTime stays at the original attempt start
        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            index = *indexOf(id);
            auto& stored = m_records[index];
            stored.handle = handle;
            stored.status = DownloadStatus::Downloading;
            record = stored;
        }

        LOG_INFO("Resumed {}", record.identity.name());
        notify("resumed", [&] { m_observer.onResumed(record, index); });
    });
}

void DownloadEngine::retry(RecordId id) {
    dispatch([this, id]() {
        DownloadRecord record;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto index = indexOf(id);
            if (!index) {
                LOG_WARN("retry: no download with id {}", id);
                return;
            }
            record = m_records[*index];
        }

        if (record.status == DownloadStatus::Downloading) return;

        TaskHandle handle = ensureHandle(record);
        m_transport.resume(handle);

        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            index = *indexOf(id);
            auto& stored = m_records[index];
            stored.handle = handle;
            stored.status = DownloadStatus::Downloading;
            stored.startTime = Clock::now();
            record = stored;
        }

        LOG_INFO("Retrying {}", record.identity.name());
        notify("retried", [&] { m_observer.onRetried(record, index); });
    });
}

void DownloadEngine::cancel(RecordId id) {
    dispatch([this, id]() {
        DownloadRecord record;
        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto found = indexOf(id);
            if (!found) {
                LOG_WARN("cancel: no download with id {}", id);
                return;
            }
            index = *found;
            record = m_records[index];

            // Nothing in flight: no transport confirmation will come
            if (record.handle == kNoTask) {
                m_records.erase(m_records.begin() + static_cast<std::ptrdiff_t>(index));
            }
        }

        if (record.handle != kNoTask) {
            LOG_INFO("Canceling {}", record.identity.name());
            m_transport.cancel(record.handle);
            return;
        }

        record.status = DownloadStatus::Canceled;
        LOG_INFO("Canceled {} (no active task)", record.identity.name());
        notify("canceled", [&] { m_observer.onCanceled(record, index); });
    });
}

// -- Queries --

std::vector<DownloadRecord> DownloadEngine::records() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

std::optional<DownloadRecord> DownloadEngine::find(RecordId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto index = indexOf(id);
    if (!index) return std::nullopt;
    return m_records[*index];
}

size_t DownloadEngine::count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

void DownloadEngine::waitIdle() {
    std::shared_ptr<ThreadPool> dispatcher;
    {
        std::lock_guard<std::mutex> lock(m_dispatchMutex);
        if (!m_dispatcher || m_dispatcher->isWorkerThread()) return;
        dispatcher = m_dispatcher;
    }
    dispatcher->waitAll();
}

void DownloadEngine::setDefaultDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_defaultDirectory = directory;
}

std::string DownloadEngine::defaultDirectory() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_defaultDirectory;
}

// -- TransportDelegate (transport threads) --

void DownloadEngine::onTaskProgress(const TaskInfo& task,
                                    int64_t /*bytesWritten*/,
                                    int64_t totalBytesWritten,
                                    int64_t totalBytesExpected) {
    TaskHandle handle = task.handle;
    dispatch([this, handle, totalBytesWritten, totalBytesExpected]() {
        handleProgress(handle, totalBytesWritten, totalBytesExpected);
    });
}

void DownloadEngine::onTaskFinishedDownloading(const TaskInfo& task, const std::string& location) {
    TaskHandle handle = task.handle;
    dispatch([this, handle, location]() {
        handleFinishedDownloading(handle, location);
    });
}

void DownloadEngine::onTaskCompleted(const TaskInfo& task, const std::optional<TransportError>& error) {
    dispatch([this, task, error]() {
        handleCompleted(task, error);
    });
}

void DownloadEngine::onAllEventsDelivered() {
    dispatch([this]() {
        LOG_DEBUG("Transport delivered all background events");
        if (!m_backgroundCompletion) return;

        auto completion = std::move(m_backgroundCompletion);
        m_backgroundCompletion = nullptr;
        completion();
    });
}

// -- Dispatch-thread handlers --

void DownloadEngine::reconcile(const std::vector<TaskInfo>& tasks) {
    std::vector<DownloadRecord> snapshot;
    size_t restored = 0;

    for (const auto& task : tasks) {
        TransferIdentity identity;
        try {
            identity = TransferIdentity::deserialize(task.tag);
        } catch (const MalformedIdentity& e) {
            LOG_WARN("Discarding transport task {}: {}", task.handle, e.what());
            m_transport.cancel(task.handle);
            continue;
        }

        DownloadRecord record;
        record.id = ++m_nextId;
        record.identity = identity;
        record.handle = task.handle;
        record.status = statusFromTaskState(task.state);
        record.startTime = Clock::now();

        std::lock_guard<std::mutex> lock(m_mutex);
        if (indexOfHandle(task.handle)) {
            LOG_DEBUG("Transport task {} already tracked", task.handle);
            continue;
        }
        m_records.push_back(record);
        ++restored;

        LOG_INFO("Restored {} as {}", identity.name(), toString(record.status));
    }

    if (restored == 0) return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot = m_records;
    }

    LOG_INFO("Reconciled {} transfer(s) from a previous session", restored);
    notify("interruptedTasksPopulated", [&] { m_observer.onInterruptedTasksPopulated(snapshot); });
}

void DownloadEngine::handleStart(RecordId id, const TransferIdentity& identity) {
    TaskHandle handle = m_transport.createTask(identity.sourceUrl(), identity.serialize());
    m_transport.resume(handle);

    DownloadRecord record;
    record.id = id;
    record.identity = identity;
    record.status = DownloadStatus::Downloading;
    record.startTime = Clock::now();
    record.handle = handle;

    size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records.push_back(record);
        index = m_records.size() - 1;
    }

    LOG_INFO("Started {} <- {}", identity.name(), identity.sourceUrl());
    notify("started", [&] { m_observer.onStarted(record, index); });
}

void DownloadEngine::handleProgress(TaskHandle handle, int64_t totalBytesWritten, int64_t totalBytesExpected) {
    DownloadRecord record;
    size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto found = indexOfHandle(handle);
        if (!found) {
            LOG_DEBUG("Progress for untracked task {}", handle);
            return;
        }
        index = *found;
        auto& stored = m_records[index];

        auto now = Clock::now();
        auto startTime = stored.startTime.value_or(now);
        double elapsed = std::chrono::duration<double>(now - startTime).count();

        stored.bytesDownloaded = totalBytesWritten;
        stored.speed = elapsed > 0.0 ? static_cast<double>(totalBytesWritten) / elapsed : 0.0;

        if (totalBytesExpected > 0) {
            stored.bytesTotal = std::max(totalBytesExpected, totalBytesWritten);
            stored.progress = std::clamp(
                static_cast<double>(totalBytesWritten) / static_cast<double>(totalBytesExpected), 0.0, 1.0);
        } else if (stored.bytesTotal > 0) {
            // Known total from earlier progress never falls below what was written
            stored.bytesTotal = std::max(stored.bytesTotal, totalBytesWritten);
        }

        if (stored.speed > 0.0 && totalBytesExpected > 0) {
            int64_t remainingBytes = std::max<int64_t>(totalBytesExpected - totalBytesWritten, 0);
            stored.remainingTime = splitSeconds(static_cast<int64_t>(remainingBytes / stored.speed));
        } else {
            stored.remainingTime.reset();
        }

        record = stored;
    }

    notify("progress", [&] { m_observer.onProgress(record, index); });
}

void DownloadEngine::handleFinishedDownloading(TaskHandle handle, const std::string& location) {
    DownloadRecord record;
    size_t index = 0;
    std::string baseDirectory;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto found = indexOfHandle(handle);
        if (!found) {
            LOG_WARN("Finished file for untracked task {} left at {}", handle, location);
            return;
        }
        index = *found;
        record = m_records[index];
        baseDirectory = record.identity.destinationPath().empty()
            ? m_defaultDirectory
            : record.identity.destinationPath();
    }

    if (!utils::FileUtils::directoryExists(baseDirectory)) {
        LOG_WARN("Destination {} for {} does not exist", baseDirectory, record.identity.name());
        notify("destinationMissing", [&] { m_observer.onDestinationMissing(record, index, location); });
        return;
    }

    auto destination = std::filesystem::path(baseDirectory) / record.identity.name();

    std::error_code ec;
    if (!utils::FileUtils::moveFile(location, destination, ec)) {
        LOG_ERROR("Failed to move {} to {}: {}", location, destination.string(), ec.message());
        DownloadError error(ec, "Could not move downloaded file to " + destination.string() + ": " + ec.message());
        notify("failed", [&] { m_observer.onFailed(error, record, index); });
        return;
    }

    LOG_DEBUG("Moved {} to {}", location, destination.string());
}

void DownloadEngine::handleCompleted(const TaskInfo& task, const std::optional<TransportError>& error) {
    if (error && error->isBackgroundInterruption()) {
        handleInterruption(task, *error);
        return;
    }

    DownloadRecord record;
    size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto found = indexOfHandle(task.handle);
        if (!found) {
            LOG_DEBUG("Completion for untracked task {}", task.handle);
            return;
        }
        index = *found;
        record = m_records[index];
    }

    bool cancelled = error && error->code == DownloadErrc::cancelled;

    if (!error || cancelled) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_records.erase(m_records.begin() + static_cast<std::ptrdiff_t>(index));
        }

        record.handle = kNoTask;
        if (!error) {
            record.status = DownloadStatus::Finished;
            LOG_INFO("Finished {}", record.identity.name());
            notify("finished", [&] { m_observer.onFinished(record, index); });
        } else {
            record.status = DownloadStatus::Canceled;
            LOG_INFO("Canceled {}", record.identity.name());
            notify("canceled", [&] { m_observer.onCanceled(record, index); });
        }
        return;
    }

    TaskHandle handle = rearm(record.identity, error->resumeData);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& stored = m_records[index];
        stored.handle = handle;
        stored.status = DownloadStatus::Failed;
        record = stored;
    }

    DownloadError failure = error->code
        ? DownloadError(error->code, error->message)
        : DownloadError::unknown();

    LOG_ERROR("Download {} failed: {}", record.identity.name(), failure.message);
    notify("failed", [&] { m_observer.onFailed(failure, record, index); });
}

void DownloadEngine::handleInterruption(const TaskInfo& task, const TransportError& error) {
    TransferIdentity identity;
    try {
        identity = TransferIdentity::deserialize(task.tag);
    } catch (const MalformedIdentity& e) {
        LOG_WARN("Dropping interrupted task {}: {}", task.handle, e.what());
        return;
    }

    LOG_INFO("Recovering interrupted transfer {}", identity.name());

    TaskHandle handle = rearm(identity, error.resumeData);

    std::vector<DownloadRecord> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto existing = indexOfHandle(task.handle);
        if (existing) {
            auto& stored = m_records[*existing];
            stored.handle = handle;
            stored.status = DownloadStatus::Failed;
        } else {
            DownloadRecord record;
            record.id = ++m_nextId;
            record.identity = identity;
            record.status = DownloadStatus::Failed;
            record.handle = handle;
            m_records.push_back(record);
        }

        snapshot = m_records;
    }

    notify("interruptedTasksPopulated", [&] { m_observer.onInterruptedTasksPopulated(snapshot); });
}

TaskHandle DownloadEngine::rearm(const TransferIdentity& identity, const ResumeData& resumeData) {
    auto tag = identity.serialize();

    if (ResumeDataValidator::isResumable(resumeData)) {
        LOG_INFO("Re-arming {} from resume data", identity.name());
        return m_transport.createTaskWithResumeData(resumeData, tag);
    }

    LOG_INFO("Re-arming {} from {}", identity.name(), identity.sourceUrl());
    return m_transport.createTask(identity.sourceUrl(), tag);
}

TaskHandle DownloadEngine::ensureHandle(const DownloadRecord& record) {
    if (record.handle != kNoTask) {
        return record.handle;
    }
    return m_transport.createTask(record.identity.sourceUrl(), record.identity.serialize());
}

// -- Helpers --

void DownloadEngine::dispatch(std::function<void()> work) {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);

    if (!m_dispatcher || !m_dispatcher->post(std::move(work))) {
        LOG_WARN("DownloadEngine is shut down; dropping work");
    }
}

std::optional<size_t> DownloadEngine::indexOf(RecordId id) const {
    auto it = std::find_if(m_records.begin(), m_records.end(),
        [id](const DownloadRecord& record) { return record.id == id; });
    if (it == m_records.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(m_records.begin(), it));
}

std::optional<size_t> DownloadEngine::indexOfHandle(TaskHandle handle) const {
    if (handle == kNoTask) return std::nullopt;

    auto it = std::find_if(m_records.begin(), m_records.end(),
        [handle](const DownloadRecord& record) { return record.handle == handle; });
    if (it == m_records.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(m_records.begin(), it));
}

} // namespace tether::core::downloader
