/**
 * ResumeDataValidator.cpp
 */

#include "ResumeDataValidator.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathUtils.hpp"

#include <nlohmann/json.hpp>

namespace tether::core::downloader {

using json = nlohmann::json;

std::optional<std::filesystem::path> ResumeDataValidator::partialFilePath(const ResumeData& resumeData) {
    if (resumeData.empty()) {
        return std::nullopt;
    }

    try {
        json info = json::parse(resumeData.begin(), resumeData.end());
        if (!info.is_object()) {
            return std::nullopt;
        }

        auto localPath = info.value(kLocalPathKey, std::string());
        if (!localPath.empty()) {
            return std::filesystem::path(localPath);
        }

        return utils::PathUtils::getTempPath() / info.value(kTempFileNameKey, std::string());

    } catch (const json::exception& e) {
        LOG_DEBUG("Unreadable resume data: {}", e.what());
        return std::nullopt;
    }
}

bool ResumeDataValidator::isResumable(const ResumeData& resumeData) {
    auto path = partialFilePath(resumeData);
    if (!path) {
        return false;
    }

    bool exists = utils::FileUtils::fileExists(*path);
    LOG_DEBUG("Resume data partial file {} exists: {}", path->string(), exists);
    return exists;
}

} // namespace tether::core::downloader
