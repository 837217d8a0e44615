/**
 * HttpTransport.cpp
 *
 * HTTP transport built on cpr, with Range-based continuation and a
 * persisted task table.
 */

#include "HttpTransport.hpp"
#include "DownloadError.hpp"
#include "ResumeDataValidator.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathUtils.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

namespace tether::core::downloader {

using json = nlohmann::json;

namespace {

/**
 * One row of the persisted task table
 */
struct PersistedTask {
    TaskHandle handle{kNoTask};
    std::string url;
    std::string tag;
    std::string tempPath;
    std::string state;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(PersistedTask, handle, url, tag, tempPath, state)
};

constexpr const char* kStateRunning = "running";
constexpr const char* kStateSuspended = "suspended";

TransportError cancelledError() {
    TransportError error;
    error.code = make_error_code(DownloadErrc::cancelled);
    error.message = "Download cancelled";
    return error;
}

} // namespace

template<typename Fn>
void HttpTransport::deliver(Fn&& fn) {
    std::lock_guard<std::mutex> lock(m_delegateMutex);
    if (!m_delegate) return;

    try {
        fn(*m_delegate);
    } catch (const std::exception& e) {
        LOG_ERROR("Transport delegate threw: {}", e.what());
    }
}

HttpTransport::Options HttpTransport::optionsFromConfig() {
    auto& config = Config::instance();

    Options options;
    options.workers = static_cast<size_t>(std::max(1, config.get<int>("downloads.workers", 4)));
    options.connectTimeoutMs = config.get<int32_t>("downloads.connectTimeout", 10000);
    options.timeoutMs = config.get<int32_t>("downloads.timeout", 0);
    options.userAgent = config.get<std::string>("downloads.userAgent", "Tether/1.0");

    auto stateFile = config.get<std::string>("downloads.stateFile", "");
    options.stateFile = stateFile.empty() ? utils::PathUtils::getStatePath() : std::filesystem::path(stateFile);
    options.tempDirectory = utils::PathUtils::getTempPath();

    return options;
}

HttpTransport::HttpTransport()
    : HttpTransport(optionsFromConfig()) {
}

HttpTransport::HttpTransport(Options options)
    : m_options(std::move(options)) {

    if (m_options.tempDirectory.empty()) {
        m_options.tempDirectory = utils::PathUtils::getTempPath();
    }

    m_pool = std::make_unique<ThreadPool>(m_options.workers, "http");

    std::lock_guard<std::mutex> lock(m_mutex);
    loadState();
    saveState();

    LOG_INFO("HttpTransport ready ({} worker(s), {} stored task(s), {} interrupted)",
             m_options.workers, m_tasks.size(), m_pendingInterruptions.size());
}

HttpTransport::~HttpTransport() {
    {
        std::lock_guard<std::mutex> lock(m_delegateMutex);
        m_delegate = nullptr;
    }

    suspendAll();

    // Joins workers; aborted transfers return as Stopped
    m_pool.reset();

    std::lock_guard<std::mutex> lock(m_mutex);
    saveState();
}

void HttpTransport::setDelegate(TransportDelegate* delegate) {
    {
        std::lock_guard<std::mutex> lock(m_delegateMutex);
        m_delegate = delegate;
    }

    if (!delegate || pendingInterruptions() == 0) return;

    if (!m_pool->post([this]() { reportInterruptions(); })) {
        LOG_ERROR("Could not schedule interrupted task report");
    }
}

size_t HttpTransport::pendingInterruptions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pendingInterruptions.size();
}

void HttpTransport::reportInterruptions() {
    // Held across the hand-over so the delegate cannot be detached midway
    std::lock_guard<std::mutex> delegateLock(m_delegateMutex);
    if (!m_delegate) {
        LOG_DEBUG("No delegate; interrupted tasks stay persisted");
        return;
    }

    std::vector<std::pair<std::shared_ptr<Task>, TransportError>> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pendingInterruptions.empty()) return;
        pending.swap(m_pendingInterruptions);
        saveState();
    }

    LOG_INFO("Reporting {} interrupted task(s)", pending.size());

    for (const auto& entry : pending) {
        try {
            m_delegate->onTaskCompleted(infoOf(*entry.first), entry.second);
        } catch (const std::exception& e) {
            LOG_ERROR("Transport delegate threw: {}", e.what());
        }
    }

    try {
        m_delegate->onAllEventsDelivered();
    } catch (const std::exception& e) {
        LOG_ERROR("Transport delegate threw: {}", e.what());
    }
}

// -- Task creation --

TaskHandle HttpTransport::createTask(const std::string& url, const std::string& tag) {
    return addTask(url, tag, {}, true);
}

TaskHandle HttpTransport::createTaskWithResumeData(const ResumeData& resumeData, const std::string& tag) {
    std::string url;
    try {
        json info = json::parse(resumeData.begin(), resumeData.end());
        url = info.value("url", std::string());
    } catch (const json::exception& e) {
        LOG_ERROR("Invalid resume data: {}", e.what());
    }

    auto partial = ResumeDataValidator::partialFilePath(resumeData);
    if (!partial || url.empty()) {
        LOG_WARN("Resume data unusable; task will start from scratch");
        return addTask(url, tag, {}, true);
    }

    return addTask(url, tag, *partial, false);
}

TaskHandle HttpTransport::addTask(const std::string& url, const std::string& tag,
                                  std::filesystem::path tempPath, bool freshFile) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto task = std::make_shared<Task>();
    task->handle = ++m_nextHandle;
    task->url = url;
    task->tag = tag;
    task->tempPath = tempPath.empty() ? tempPathFor(task->handle) : std::move(tempPath);
    task->state = TaskState::Suspended;

    if (freshFile) {
        utils::FileUtils::deleteFile(task->tempPath);
    }

    m_tasks.emplace(task->handle, task);
    saveState();

    LOG_DEBUG("Created task {} for {}", task->handle, url);
    return task->handle;
}

// -- Control --

void HttpTransport::suspend(TaskHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(handle);
    if (it == m_tasks.end()) {
        LOG_DEBUG("suspend: unknown task {}", handle);
        return;
    }

    auto& task = it->second;
    if (task->state != TaskState::Running) return;

    task->state = TaskState::Suspended;
    task->suspendRequested = true;
    saveState();
}

void HttpTransport::resume(TaskHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(handle);
    if (it == m_tasks.end()) {
        LOG_WARN("resume: unknown task {}", handle);
        return;
    }

    auto task = it->second;
    if (task->state != TaskState::Suspended) return;

    task->state = TaskState::Running;
    task->suspendRequested = false;
    saveState();

    if (task->active) return;

    task->active = m_pool->post([this, task]() { run(task); });
    if (!task->active) {
        task->state = TaskState::Suspended;
        LOG_ERROR("Could not schedule task {}; transport is shutting down", handle);
    }
}

void HttpTransport::cancel(TaskHandle handle) {
    std::shared_ptr<Task> task;
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_tasks.find(handle);
        if (it == m_tasks.end()) {
            LOG_DEBUG("cancel: unknown task {}", handle);
            return;
        }

        task = it->second;
        if (task->state == TaskState::Canceling) return;

        task->state = TaskState::Canceling;
        task->cancelRequested = true;

        // A worker that owns the task reports the cancellation itself
        idle = !task->active;
    }

    if (!idle) return;

    utils::FileUtils::deleteFile(task->tempPath);

    if (!m_pool->post([this, task]() { complete(task, cancelledError()); })) {
        LOG_ERROR("Could not report cancellation of task {}", handle);
    }
}

void HttpTransport::suspendAll() {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto& [handle, task] : m_tasks) {
        if (task->state == TaskState::Running) {
            task->state = TaskState::Suspended;
            task->suspendRequested = true;
        }
    }
    saveState();
}

std::future<std::vector<TaskInfo>> HttpTransport::existingTasks() {
    std::promise<std::vector<TaskInfo>> promise;

    std::vector<TaskInfo> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tasks.reserve(m_tasks.size());
        for (const auto& [handle, task] : m_tasks) {
            tasks.push_back(infoOf(*task));
        }
    }

    std::sort(tasks.begin(), tasks.end(),
        [](const TaskInfo& a, const TaskInfo& b) { return a.handle < b.handle; });

    promise.set_value(std::move(tasks));
    return promise.get_future();
}

// -- Worker side --

void HttpTransport::run(const std::shared_ptr<Task>& task) {
    while (true) {
        Attempt attempt = transfer(task);

        std::lock_guard<std::mutex> lock(m_mutex);
        if (attempt == Attempt::Stopped &&
            (task->state == TaskState::Running || task->cancelRequested)) {
            // Resumed or canceled while the request was winding down
            continue;
        }
        task->active = false;
        return;
    }
}

HttpTransport::Attempt HttpTransport::transfer(const std::shared_ptr<Task>& task) {
    TaskInfo info;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!task->cancelRequested && task->state != TaskState::Running) {
            return Attempt::Stopped;
        }
        info = infoOf(*task);
    }

    if (task->cancelRequested) {
        utils::FileUtils::deleteFile(task->tempPath);
        complete(task, cancelledError());
        return Attempt::Completed;
    }

    const int64_t offset = std::max<int64_t>(utils::FileUtils::getFileSize(task->tempPath), 0);

    utils::FileUtils::createDirectories(task->tempPath.parent_path());
    std::ofstream file(task->tempPath, std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        TransportError error;
        error.code = make_error_code(DownloadErrc::io_error);
        error.message = "Failed to open " + task->tempPath.string();
        complete(task, error);
        return Attempt::Completed;
    }

    cpr::Header header;
    if (offset > 0) {
        header["Range"] = "bytes=" + std::to_string(offset) + "-";
        LOG_DEBUG("Continuing task {} from byte {}", task->handle, offset);
    }

    int64_t reported = offset;
    bool aborted = false;

    cpr::Response response = cpr::Download(
        file,
        cpr::Url{task->url},
        cpr::ConnectTimeout{m_options.connectTimeoutMs},
        cpr::Timeout{m_options.timeoutMs},
        cpr::UserAgent{m_options.userAgent},
        header,
        cpr::ProgressCallback([&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                                  cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                  intptr_t /*userdata*/) -> bool {
            if (task->cancelRequested || task->suspendRequested) {
                aborted = true;
                return false;
            }

            int64_t written = offset + static_cast<int64_t>(downloadNow);
            int64_t expected = downloadTotal > 0 ? offset + static_cast<int64_t>(downloadTotal) : 0;

            if (written > reported) {
                int64_t delta = written - reported;
                reported = written;
                deliver([&](TransportDelegate& d) { d.onTaskProgress(info, delta, written, expected); });
            }
            return true;
        })
    );

    file.close();

    if (task->cancelRequested) {
        utils::FileUtils::deleteFile(task->tempPath);
        complete(task, cancelledError());
        return Attempt::Completed;
    }

    // A resume may already have cleared the request flag
    if (task->suspendRequested || aborted) {
        LOG_DEBUG("Task {} suspended at {} bytes", task->handle, reported);
        return Attempt::Stopped;
    }

    if (response.error) {
        TransportError error;
        error.code = make_error_code(DownloadErrc::network_error);
        error.message = response.error.message;
        error.resumeData = makeResumeData(*task);
        complete(task, error);
        return Attempt::Completed;
    }

    const long status = response.status_code;

    if (offset > 0 && (status == 200 || status == 416)) {
        // Whole body was appended to the partial file, or the range is gone
        utils::FileUtils::deleteFile(task->tempPath);

        TransportError error;
        error.code = make_error_code(DownloadErrc::range_not_satisfiable);
        error.httpStatus = static_cast<int>(status);
        error.message = "Server did not honor the range request (HTTP " + std::to_string(status) + ")";
        complete(task, error);
        return Attempt::Completed;
    }

    if (status >= 400) {
        utils::FileUtils::deleteFile(task->tempPath);

        TransportError error;
        error.code = make_error_code(DownloadErrc::server_error);
        error.httpStatus = static_cast<int>(status);
        error.message = "HTTP " + std::to_string(status);
        complete(task, error);
        return Attempt::Completed;
    }

    const std::string location = task->tempPath.string();
    deliver([&](TransportDelegate& d) { d.onTaskFinishedDownloading(info, location); });
    complete(task, std::nullopt);
    return Attempt::Completed;
}

void HttpTransport::complete(const std::shared_ptr<Task>& task, const std::optional<TransportError>& error) {
    TaskInfo info;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        task->state = TaskState::Completed;
        m_tasks.erase(task->handle);
        saveState();
        info = infoOf(*task);
    }

    if (error) {
        LOG_WARN("Task {} ended: {}", task->handle, error->message);
    } else {
        LOG_DEBUG("Task {} completed", task->handle);
    }

    deliver([&](TransportDelegate& d) { d.onTaskCompleted(info, error); });
}

// -- Helpers --

ResumeData HttpTransport::makeResumeData(const Task& task) const {
    int64_t size = utils::FileUtils::getFileSize(task.tempPath);
    if (size <= 0) {
        return {};
    }

    json info = {
        {ResumeDataValidator::kLocalPathKey, task.tempPath.string()},
        {ResumeDataValidator::kTempFileNameKey, task.tempPath.filename().string()},
        {"url", task.url},
        {"bytesReceived", size}
    };

    std::string encoded = info.dump();
    return ResumeData(encoded.begin(), encoded.end());
}

TaskInfo HttpTransport::infoOf(const Task& task) const {
    TaskInfo info;
    info.handle = task.handle;
    info.state = task.state;
    info.tag = task.tag;
    return info;
}

std::filesystem::path HttpTransport::tempPathFor(TaskHandle handle) const {
    return m_options.tempDirectory / ("tether-" + std::to_string(handle) + ".part");
}

void HttpTransport::loadState() {
    if (m_options.stateFile.empty() || !utils::FileUtils::fileExists(m_options.stateFile)) {
        return;
    }

    std::ifstream in(m_options.stateFile);
    if (!in.is_open()) {
        LOG_WARN("Cannot read transport state {}", m_options.stateFile.string());
        return;
    }

    try {
        json state = json::parse(in);

        for (const auto& entry : state.value("tasks", json::array())) {
            auto persisted = entry.get<PersistedTask>();
            m_nextHandle = std::max(m_nextHandle, persisted.handle);

            auto task = std::make_shared<Task>();
            task->handle = persisted.handle;
            task->url = persisted.url;
            task->tag = persisted.tag;
            task->tempPath = persisted.tempPath.empty() ? tempPathFor(persisted.handle)
                                                        : std::filesystem::path(persisted.tempPath);

            if (persisted.state == kStateRunning) {
                // The previous process died while this task was transferring
                task->state = TaskState::Completed;

                TransportError error;
                error.code = make_error_code(DownloadErrc::interrupted);
                error.message = "Transfer was interrupted when the previous session ended";
                error.backgroundCancelReason = BackgroundCancelReason::UserForceQuit;
                error.resumeData = makeResumeData(*task);

                m_pendingInterruptions.emplace_back(task, std::move(error));
            } else {
                task->state = TaskState::Suspended;
                m_tasks.emplace(task->handle, task);
            }
        }
    } catch (const json::exception& e) {
        LOG_ERROR("Ignoring unreadable transport state {}: {}", m_options.stateFile.string(), e.what());
    }
}

void HttpTransport::saveState() const {
    if (m_options.stateFile.empty()) return;

    json tasks = json::array();
    for (const auto& [handle, task] : m_tasks) {
        if (task->state != TaskState::Running && task->state != TaskState::Suspended) {
            continue;
        }

        PersistedTask persisted;
        persisted.handle = handle;
        persisted.url = task->url;
        persisted.tag = task->tag;
        persisted.tempPath = task->tempPath.string();
        persisted.state = task->state == TaskState::Running ? kStateRunning : kStateSuspended;
        tasks.emplace_back(persisted);
    }

    for (const auto& entry : m_pendingInterruptions) {
        const auto& task = entry.first;

        PersistedTask persisted;
        persisted.handle = task->handle;
        persisted.url = task->url;
        persisted.tag = task->tag;
        persisted.tempPath = task->tempPath.string();
        persisted.state = kStateRunning;
        tasks.emplace_back(persisted);
    }

    auto target = m_options.stateFile;
    auto staging = target;
    staging += ".tmp";

    utils::FileUtils::createDirectories(target.parent_path());

    {
        std::ofstream out(staging);
        if (!out.is_open()) {
            LOG_ERROR("Cannot write transport state {}", staging.string());
            return;
        }
        out << json{{"version", 1}, {"tasks", tasks}}.dump(2);
    }

    std::error_code ec;
    if (!utils::FileUtils::moveFile(staging, target, ec)) {
        LOG_ERROR("Cannot replace transport state {}: {}", target.string(), ec.message());
    }
}

} // namespace tether::core::downloader
