/**
 * DownloadRecord.cpp
 */

#include "DownloadRecord.hpp"

namespace tether::core::downloader {

using utils::ByteUnitConverter;

std::string toString(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Preparing:   return "Preparing";
        case DownloadStatus::Downloading: return "Downloading";
        case DownloadStatus::Paused:      return "Paused";
        case DownloadStatus::Failed:      return "Failed";
        case DownloadStatus::Finished:    return "Finished";
        case DownloadStatus::Canceled:    return "Canceled";
    }
    return "Unknown";
}

utils::ScaledSize DownloadRecord::fileSize() const {
    return ByteUnitConverter::scale(bytesTotal);
}

utils::ScaledSize DownloadRecord::downloadedSize() const {
    return ByteUnitConverter::scale(bytesDownloaded);
}

utils::ScaledSize DownloadRecord::speedSize() const {
    return ByteUnitConverter::scale(static_cast<int64_t>(speed));
}

void to_json(nlohmann::json& j, const DownloadRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"name", record.identity.name()},
        {"url", record.identity.sourceUrl()},
        {"destination", record.identity.destinationPath()},
        {"status", toString(record.status)},
        {"progress", record.progress},
        {"bytesTotal", record.bytesTotal},
        {"bytesDownloaded", record.bytesDownloaded},
        {"speed", record.speed}
    };

    if (record.remainingTime) {
        j["remainingTime"] = {
            {"hours", record.remainingTime->hours},
            {"minutes", record.remainingTime->minutes},
            {"seconds", record.remainingTime->seconds}
        };
    } else {
        j["remainingTime"] = nullptr;
    }
}

} // namespace tether::core::downloader
