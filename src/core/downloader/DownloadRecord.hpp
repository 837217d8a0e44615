#pragma once

/**
 * DownloadRecord.hpp
 *
 * State of one tracked transfer.
 */

#include "TransferIdentity.hpp"
#include "Transport.hpp"
#include "../../utils/ByteUnitConverter.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tether::core::downloader {

/**
 * Stable key of a record inside the engine. 0 is never assigned.
 */
using RecordId = uint64_t;

/**
 * Download status
 */
enum class DownloadStatus {
    Preparing,
    Downloading,
    Paused,
    Failed,
    Finished,
    Canceled
};

std::string toString(DownloadStatus status);

struct RemainingTime {
    int hours{0};
    int minutes{0};
    int seconds{0};

    bool operator==(const RemainingTime& other) const {
        return hours == other.hours && minutes == other.minutes && seconds == other.seconds;
    }
};

/**
 * DownloadRecord - one transfer as the engine sees it
 *
 * Records handed to observers and returned by DownloadEngine::records()
 * are copies; mutating them does not affect the engine.
 */
struct DownloadRecord {
    using Clock = std::chrono::system_clock;

    RecordId id{0};
    TransferIdentity identity;
    DownloadStatus status{DownloadStatus::Preparing};

    // Fraction in [0, 1]; unchanged while the total size is unknown
    double progress{0.0};

    int64_t bytesTotal{0};
    int64_t bytesDownloaded{0};

    // Bytes per second over the current attempt
    double speed{0.0};

    // Set only while speed > 0 and the total size is known
    std::optional<RemainingTime> remainingTime;

    // Start of the current attempt
    std::optional<Clock::time_point> startTime;

    TaskHandle handle{kNoTask};

    utils::ScaledSize fileSize() const;
    utils::ScaledSize downloadedSize() const;
    utils::ScaledSize speedSize() const;
};

void to_json(nlohmann::json& j, const DownloadRecord& record);

} // namespace tether::core::downloader
