/**
 * EventBusObserver.cpp
 */

#include "EventBusObserver.hpp"
#include "../EventBus.hpp"

namespace tether::core::downloader {

namespace {

void publish(const std::string& event, const DownloadRecord& record, size_t index) {
    EventBus::instance().emit(event, {
        {"index", index},
        {"record", record}
    });
}

} // namespace

void EventBusObserver::onProgress(const DownloadRecord& record, size_t index) {
    publish("download.progress", record, index);
}

void EventBusObserver::onFailed(const DownloadError& error, const DownloadRecord& record, size_t index) {
    EventBus::instance().emit("download.failed", {
        {"index", index},
        {"record", record},
        {"error", {
            {"category", error.code.category().name()},
            {"code", error.code.value()},
            {"message", error.message}
        }}
    });
}

void EventBusObserver::onInterruptedTasksPopulated(const std::vector<DownloadRecord>& records) {
    json list = json::array();
    for (const auto& record : records) {
        list.push_back(record);
    }
    EventBus::instance().emit("download.interruptedTasksPopulated", {{"records", list}});
}

void EventBusObserver::onStarted(const DownloadRecord& record, size_t index) {
    publish("download.started", record, index);
}

void EventBusObserver::onFinished(const DownloadRecord& record, size_t index) {
    publish("download.finished", record, index);
}

void EventBusObserver::onCanceled(const DownloadRecord& record, size_t index) {
    publish("download.canceled", record, index);
}

void EventBusObserver::onPaused(const DownloadRecord& record, size_t index) {
    publish("download.paused", record, index);
}

void EventBusObserver::onResumed(const DownloadRecord& record, size_t index) {
    publish("download.resumed", record, index);
}

void EventBusObserver::onRetried(const DownloadRecord& record, size_t index) {
    publish("download.retried", record, index);
}

void EventBusObserver::onDestinationMissing(const DownloadRecord& record, size_t index,
                                            const std::string& location) {
    EventBus::instance().emit("download.destinationMissing", {
        {"index", index},
        {"record", record},
        {"location", location}
    });
}

} // namespace tether::core::downloader
