#pragma once

/**
 * DownloadError.hpp
 *
 * Error codes reported to download observers.
 */

#include <string>
#include <stdexcept>
#include <system_error>

namespace tether::core::downloader {

enum class DownloadErrc {
    success = 0,
    malformed_identity,
    io_error,
    destination_missing,
    transport_error,
    network_error,
    server_error,
    cancelled,
    interrupted,
    range_not_satisfiable,
    unknown = 1000,
};

const std::error_category& downloadErrorCategory() noexcept;

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), downloadErrorCategory()};
}

/**
 * Error payload handed to DownloadObserver::onFailed
 */
struct DownloadError {
    std::error_code code;
    std::string message;

    DownloadError() = default;
    DownloadError(std::error_code code_, std::string message_ = {})
        : code(code_), message(message_.empty() ? code_.message() : std::move(message_)) {}

    static DownloadError unknown() {
        return DownloadError(make_error_code(DownloadErrc::unknown));
    }
};

/**
 * Thrown when an identity tag cannot be decoded, or a field would not
 * survive encoding.
 */
class MalformedIdentity : public std::runtime_error {
public:
    explicit MalformedIdentity(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace tether::core::downloader

namespace std {
template <>
struct is_error_code_enum<tether::core::downloader::DownloadErrc> : true_type {};
} // namespace std
