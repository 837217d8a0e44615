#pragma once

/**
 * HttpTransport.hpp
 *
 * Transport over HTTP(S) using cpr. Tasks download into
 * <temp dir>/tether-<handle>.part, continue with Range requests after a
 * suspend or failure, and are persisted to a JSON state file so they
 * survive process restarts.
 */

#include "Transport.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tether::core::downloader {

class HttpTransport : public Transport {
public:
    struct Options {
        size_t workers{4};
        int32_t connectTimeoutMs{10000};
        int32_t timeoutMs{0};            // 0 = no overall timeout
        std::string userAgent{"Tether/1.0"};
        std::filesystem::path stateFile;
        std::filesystem::path tempDirectory;
    };

    /**
     * Options from the "downloads.*" configuration keys
     */
    static Options optionsFromConfig();

    /**
     * Loads the persisted task table. Tasks that were running when the
     * previous process ended are reported as interrupted once a delegate
     * is attached.
     */
    explicit HttpTransport(Options options);
    HttpTransport();

    /**
     * Suspends running tasks and persists them for the next run.
     */
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    void setDelegate(TransportDelegate* delegate) override;

    TaskHandle createTask(const std::string& url, const std::string& tag) override;
    TaskHandle createTaskWithResumeData(const ResumeData& resumeData, const std::string& tag) override;

    void suspend(TaskHandle handle) override;
    void resume(TaskHandle handle) override;
    void cancel(TaskHandle handle) override;

    std::future<std::vector<TaskInfo>> existingTasks() override;

    /**
     * Suspend every running task and persist the table
     */
    void suspendAll();

    /**
     * Interrupted tasks from the previous run not yet handed to a delegate
     */
    size_t pendingInterruptions() const;

private:
    struct Task {
        TaskHandle handle{kNoTask};
        std::string url;
        std::string tag;
        std::filesystem::path tempPath;
        TaskState state{TaskState::Suspended};
        bool active{false};   // a worker owns the task
        std::atomic<bool> suspendRequested{false};
        std::atomic<bool> cancelRequested{false};
    };

    enum class Attempt {
        Stopped,    // suspended; no notification sent
        Completed   // final notification sent
    };

    TaskHandle addTask(const std::string& url, const std::string& tag,
                       std::filesystem::path tempPath, bool freshFile);

    void run(const std::shared_ptr<Task>& task);
    Attempt transfer(const std::shared_ptr<Task>& task);
    void complete(const std::shared_ptr<Task>& task, const std::optional<TransportError>& error);
    void reportInterruptions();

    ResumeData makeResumeData(const Task& task) const;
    TaskInfo infoOf(const Task& task) const;
    std::filesystem::path tempPathFor(TaskHandle handle) const;

    // Callers hold m_mutex
    void loadState();
    void saveState() const;

    template<typename Fn>
    void deliver(Fn&& fn);

private:
    Options m_options;

    mutable std::mutex m_mutex;
    std::unordered_map<TaskHandle, std::shared_ptr<Task>> m_tasks;
    // Stay in the state file as running until a delegate received them
    std::vector<std::pair<std::shared_ptr<Task>, TransportError>> m_pendingInterruptions;
    TaskHandle m_nextHandle{0};

    std::mutex m_delegateMutex;
    TransportDelegate* m_delegate{nullptr};

    std::unique_ptr<ThreadPool> m_pool;
};

} // namespace tether::core::downloader
