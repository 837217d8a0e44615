// Tether - File Utilities
// Filesystem operations used to hand finished downloads over to their destination

#pragma once

#include <string>
#include <filesystem>
#include <system_error>
#include <cstdint>

namespace fs = std::filesystem;

namespace tether::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool directoryExists(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);
    static int64_t getFileSize(const fs::path& path);

    /**
     * @brief Move a file, replacing an existing destination.
     * Falls back to copy + remove when source and destination live on
     * different filesystems.
     * @param ec Set to the failure reason
     * @return true on success
     */
    static bool moveFile(const fs::path& source, const fs::path& destination, std::error_code& ec);
};

} // namespace tether::utils
