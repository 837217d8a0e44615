/**
 * DownloadError.cpp
 */

#include "DownloadError.hpp"

namespace tether::core::downloader {

namespace {

struct DownloadErrorCategory : std::error_category {
    const char* name() const noexcept override {
        return "tether::download";
    }

    std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:               return "Success";
            case DownloadErrc::malformed_identity:    return "Malformed task identity";
            case DownloadErrc::io_error:              return "File system error";
            case DownloadErrc::destination_missing:   return "Destination directory does not exist";
            case DownloadErrc::transport_error:       return "Transport error";
            case DownloadErrc::network_error:         return "Network error";
            case DownloadErrc::server_error:          return "Server returned an error status";
            case DownloadErrc::cancelled:             return "Download cancelled";
            case DownloadErrc::interrupted:           return "Download interrupted";
            case DownloadErrc::range_not_satisfiable: return "Server cannot continue a partial download";
            case DownloadErrc::unknown:
            default:                                  return "Unknown error occurred";
        }
    }
};

} // namespace

const std::error_category& downloadErrorCategory() noexcept {
    static DownloadErrorCategory category;
    return category;
}

} // namespace tether::core::downloader
