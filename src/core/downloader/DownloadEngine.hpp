#pragma once

/**
 * DownloadEngine.hpp
 *
 * Tracks a pool of resumable transfers on top of a Transport.
 * Decides resume vs restart after failures, derives progress/speed/ETA
 * from raw byte counters, rebuilds transfers that outlived the previous
 * process, and reports everything to a DownloadObserver.
 */

#include "DownloadObserver.hpp"
#include "DownloadRecord.hpp"
#include "Transport.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether::core::downloader {

/**
 * DownloadEngine - transfer lifecycle and resumability
 *
 * Threading: every operation and every transport notification is queued
 * onto one internal dispatch thread, so records are only ever mutated
 * there and observer callbacks never overlap. Public operations are
 * fire-and-forget; their outcome arrives through the observer.
 *
 * Lifecycle per record:
 *   Preparing -> Downloading <-> Paused
 *   Downloading -> Failed (re-armed, back to Downloading through retry)
 *   Downloading -> Finished | Canceled (record removed)
 */
class DownloadEngine : public TransportDelegate {
public:
    using CompletionHandler = std::function<void()>;

    /**
     * @param transport Transport performing the transfers (must outlive the engine)
     * @param observer Event sink (must outlive the engine)
     * @param backgroundCompletion Invoked once when the transport reports
     *        that every queued background event was delivered
     */
    DownloadEngine(Transport& transport,
                   DownloadObserver& observer,
                   CompletionHandler backgroundCompletion = nullptr);

    ~DownloadEngine() override;

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    /**
     * Rebuild records for tasks the transport still knows, then start
     * receiving notifications. Blocks until the transport has enumerated
     * its tasks and the records are in place.
     */
    void initialize();

    /**
     * Drain pending work and detach from the transport.
     */
    void shutdown();

    /**
     * Start a new transfer. Emits onStarted.
     * @param destinationPath Target directory, empty for the default one
     * @return Id of the record that will hold the transfer
     * @throws MalformedIdentity if a field contains the tag delimiter
     */
    RecordId start(const std::string& name,
                   const std::string& url,
                   const std::string& destinationPath = "");

    /** Suspend. No-op if already paused. Emits onPaused. */
    void pause(RecordId id);

    /** Continue a paused transfer. No-op if downloading. Emits onResumed. */
    void resume(RecordId id);

    /** Re-run a failed (or paused) transfer with a fresh clock. Emits onRetried. */
    void retry(RecordId id);

    /** Ask the transport to cancel. onCanceled follows when it confirms. */
    void cancel(RecordId id);

    /**
     * Snapshot of the tracked records, in collection order
     */
    std::vector<DownloadRecord> records() const;

    std::optional<DownloadRecord> find(RecordId id) const;

    size_t count() const;

    /**
     * Block until every queued operation and notification was processed.
     * Returns immediately when called from an observer callback.
     */
    void waitIdle();

    void setDefaultDirectory(const std::string& directory);
    std::string defaultDirectory() const;

    // TransportDelegate
    void onTaskProgress(const TaskInfo& task,
                        int64_t bytesWritten,
                        int64_t totalBytesWritten,
                        int64_t totalBytesExpected) override;
    void onTaskFinishedDownloading(const TaskInfo& task, const std::string& location) override;
    void onTaskCompleted(const TaskInfo& task, const std::optional<TransportError>& error) override;
    void onAllEventsDelivered() override;

private:
    void dispatch(std::function<void()> work);

    // Dispatch-thread handlers
    void reconcile(const std::vector<TaskInfo>& tasks);
    void handleStart(RecordId id, const TransferIdentity& identity);
    void handleProgress(TaskHandle handle, int64_t totalBytesWritten, int64_t totalBytesExpected);
    void handleFinishedDownloading(TaskHandle handle, const std::string& location);
    void handleCompleted(const TaskInfo& task, const std::optional<TransportError>& error);
    void handleInterruption(const TaskInfo& task, const TransportError& error);

    /**
     * Prepare a suspended replacement task: from the resume data if its
     * partial file still exists, otherwise from the source URL.
     */
    TaskHandle rearm(const TransferIdentity& identity, const ResumeData& resumeData);

    /**
     * Handle usable for resume/retry; creates one from the source URL when
     * the record has none.
     */
    TaskHandle ensureHandle(const DownloadRecord& record);

    // Callers hold m_mutex
    std::optional<size_t> indexOf(RecordId id) const;
    std::optional<size_t> indexOfHandle(TaskHandle handle) const;

    template<typename Fn>
    void notify(const char* event, Fn&& fn);

private:
    Transport& m_transport;
    DownloadObserver& m_observer;
    CompletionHandler m_backgroundCompletion;

    // Single worker: the dispatch thread
    std::mutex m_dispatchMutex;
    std::shared_ptr<ThreadPool> m_dispatcher;

    mutable std::mutex m_mutex;
    std::vector<DownloadRecord> m_records;
    std::string m_defaultDirectory;

    std::atomic<RecordId> m_nextId{0};
    std::atomic<bool> m_initialized{false};
};

} // namespace tether::core::downloader
