#pragma once

/**
 * DownloadObserver.hpp
 *
 * Lifecycle callbacks raised by DownloadEngine. All callbacks run on the
 * engine's dispatch thread, one at a time. `index` is the record's
 * position in DownloadEngine::records() at the time of the event.
 *
 * The first three callbacks must be implemented; the rest default to
 * no-ops.
 */

#include "DownloadError.hpp"
#include "DownloadRecord.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tether::core::downloader {

class DownloadObserver {
public:
    virtual ~DownloadObserver() = default;

    virtual void onProgress(const DownloadRecord& record, size_t index) = 0;

    /**
     * The transfer failed and was re-armed for retry, or its finished file
     * could not be moved into place.
     */
    virtual void onFailed(const DownloadError& error, const DownloadRecord& record, size_t index) = 0;

    /**
     * Transfers cut short by a previous process (or by the system) were
     * rebuilt. Receives the whole collection.
     */
    virtual void onInterruptedTasksPopulated(const std::vector<DownloadRecord>& records) = 0;

    virtual void onStarted(const DownloadRecord& /*record*/, size_t /*index*/) {}
    virtual void onFinished(const DownloadRecord& /*record*/, size_t /*index*/) {}
    virtual void onCanceled(const DownloadRecord& /*record*/, size_t /*index*/) {}
    virtual void onPaused(const DownloadRecord& /*record*/, size_t /*index*/) {}
    virtual void onResumed(const DownloadRecord& /*record*/, size_t /*index*/) {}
    virtual void onRetried(const DownloadRecord& /*record*/, size_t /*index*/) {}

    /**
     * The finished file could not be moved because its destination
     * directory is missing. The file is left at `location`; the observer
     * may create the directory and move it.
     */
    virtual void onDestinationMissing(const DownloadRecord& /*record*/, size_t /*index*/,
                                      const std::string& /*location*/) {}
};

} // namespace tether::core::downloader
