/**
 * FileUtils.cpp
 *
 * Filesystem operations.
 */

#include "FileUtils.hpp"

namespace tether::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::directoryExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? -1 : static_cast<int64_t>(size);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination, std::error_code& ec) {
    ec.clear();
    fs::rename(source, destination, ec);
    if (!ec) return true;

    if (ec != std::errc::cross_device_link) return false;

    ec.clear();
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) return false;

    fs::remove(source, ec);
    return !ec;
}

} // namespace tether::utils
