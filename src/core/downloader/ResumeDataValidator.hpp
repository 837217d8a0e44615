#pragma once

/**
 * ResumeDataValidator.hpp
 *
 * Decides whether a resume blob can still be used, i.e. whether the
 * partial file it points at is still on disk.
 *
 * The blob is a JSON object written by the transport:
 *   { "localPath": "...", "tempFileName": "...", ... }
 * "localPath" wins when present and non-empty; otherwise the partial file
 * is looked up as <temp dir>/<tempFileName>.
 */

#include "Transport.hpp"

#include <filesystem>
#include <optional>

namespace tether::core::downloader {

class ResumeDataValidator {
public:
    static constexpr const char* kLocalPathKey = "localPath";
    static constexpr const char* kTempFileNameKey = "tempFileName";

    /**
     * @return true iff the blob is non-empty, parses, and its partial file
     *         is a regular file. Never throws.
     */
    static bool isResumable(const ResumeData& resumeData);

    /**
     * Partial file referenced by the blob, or nullopt if the blob cannot be
     * parsed.
     */
    static std::optional<std::filesystem::path> partialFilePath(const ResumeData& resumeData);
};

} // namespace tether::core::downloader
