#pragma once

/**
 * Transport.hpp
 *
 * Contract between the download engine and whatever moves the bytes.
 * A transport runs tasks, can suspend and resume them, hands back an
 * opaque resume blob when a task fails part way, and remembers a string
 * tag per task for as long as the task exists (across restarts if the
 * transport persists its tasks).
 */

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace tether::core::downloader {

/**
 * Opaque task reference. 0 is never a live task.
 */
using TaskHandle = uint64_t;
constexpr TaskHandle kNoTask = 0;

using ResumeData = std::vector<uint8_t>;

enum class TaskState {
    Running,
    Suspended,
    Canceling,
    Completed
};

struct TaskInfo {
    TaskHandle handle{kNoTask};
    TaskState state{TaskState::Suspended};
    std::string tag;
};

/**
 * Why the system, rather than the user or the network, stopped a task
 */
enum class BackgroundCancelReason {
    UserForceQuit,
    BackgroundUpdatesDisabled,
    InsufficientSystemResources
};

struct TransportError {
    std::error_code code;
    std::string message;
    int httpStatus{0};
    std::optional<BackgroundCancelReason> backgroundCancelReason;
    ResumeData resumeData;

    /**
     * The task died with the process (or its background session) rather
     * than failing on its own.
     */
    bool isBackgroundInterruption() const {
        return backgroundCancelReason == BackgroundCancelReason::UserForceQuit ||
               backgroundCancelReason == BackgroundCancelReason::BackgroundUpdatesDisabled;
    }
};

/**
 * Notification sink. Called from the transport's own threads.
 */
class TransportDelegate {
public:
    virtual ~TransportDelegate() = default;

    /**
     * @param bytesWritten Bytes written since the previous notification
     * @param totalBytesWritten Bytes written so far
     * @param totalBytesExpected Expected size, 0 when unknown
     */
    virtual void onTaskProgress(const TaskInfo& task,
                                int64_t bytesWritten,
                                int64_t totalBytesWritten,
                                int64_t totalBytesExpected) = 0;

    /**
     * The task finished writing to a temporary file. Ownership of the file
     * passes to the delegate.
     */
    virtual void onTaskFinishedDownloading(const TaskInfo& task, const std::string& location) = 0;

    /**
     * Final notification for a task. error is empty on success.
     */
    virtual void onTaskCompleted(const TaskInfo& task, const std::optional<TransportError>& error) = 0;

    /**
     * Every queued background event has been delivered.
     */
    virtual void onAllEventsDelivered() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual void setDelegate(TransportDelegate* delegate) = 0;

    /**
     * Create a suspended task for url. Call resume() to start it.
     */
    virtual TaskHandle createTask(const std::string& url, const std::string& tag) = 0;

    /**
     * Create a suspended task that continues from a resume blob.
     */
    virtual TaskHandle createTaskWithResumeData(const ResumeData& resumeData, const std::string& tag) = 0;

    virtual void suspend(TaskHandle handle) = 0;
    virtual void resume(TaskHandle handle) = 0;
    virtual void cancel(TaskHandle handle) = 0;

    /**
     * Tasks still known to the transport, e.g. survivors of a previous
     * process lifetime.
     */
    virtual std::future<std::vector<TaskInfo>> existingTasks() = 0;
};

} // namespace tether::core::downloader
