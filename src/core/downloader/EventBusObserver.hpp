#pragma once

/**
 * EventBusObserver.hpp
 *
 * Republishes download lifecycle events on the EventBus as
 * "download.<event>" with a JSON payload.
 */

#include "DownloadObserver.hpp"

namespace tether::core::downloader {

class EventBusObserver : public DownloadObserver {
public:
    void onProgress(const DownloadRecord& record, size_t index) override;
    void onFailed(const DownloadError& error, const DownloadRecord& record, size_t index) override;
    void onInterruptedTasksPopulated(const std::vector<DownloadRecord>& records) override;

    void onStarted(const DownloadRecord& record, size_t index) override;
    void onFinished(const DownloadRecord& record, size_t index) override;
    void onCanceled(const DownloadRecord& record, size_t index) override;
    void onPaused(const DownloadRecord& record, size_t index) override;
    void onResumed(const DownloadRecord& record, size_t index) override;
    void onRetried(const DownloadRecord& record, size_t index) override;
    void onDestinationMissing(const DownloadRecord& record, size_t index,
                              const std::string& location) override;
};

} // namespace tether::core::downloader
