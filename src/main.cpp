/**
 * Tether - resumable download pool
 *
 * Command line entry point. Downloads the given URLs through the
 * DownloadEngine and picks up transfers left over from a previous run.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadEngine.hpp"
#include "core/downloader/EventBusObserver.hpp"
#include "core/downloader/HttpTransport.hpp"
#include "utils/ByteUnitConverter.hpp"
#include "utils/PathUtils.hpp"

namespace fs = std::filesystem;

using tether::core::Config;
using tether::core::EventBus;
using tether::core::Logger;
using tether::core::json;
namespace downloader = tether::core::downloader;
namespace utils = tether::utils;

namespace {

std::atomic<bool> g_stopRequested{false};

struct Options {
    bool debug{false};
    std::string configPath;
    std::string directory;
    std::vector<std::string> urls;
};

/**
 * Signal handler: only flags the main loop, which suspends and persists
 */
void signalHandler(int /*signal*/) {
    g_stopRequested = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

void printUsage(const char* program) {
    std::cout << "Tether - resumable downloads\n"
              << "\nUsage: " << program << " [options] <url> [<url>...]\n"
              << "\nOptions:\n"
              << "  -d, --debug           Enable debug logging\n"
              << "  -c, --config <path>   Use this configuration file\n"
              << "      --dir <directory> Save finished files here\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version information\n"
              << "\nTransfers interrupted by a previous run are resumed automatically.\n"
              << std::endl;
}

/**
 * Load configuration, creating a default file on first run
 */
bool loadConfiguration(const std::string& requestedPath) {
    fs::path configPath = requestedPath.empty() ? utils::PathUtils::getConfigPath() : fs::path(requestedPath);

    auto& config = Config::instance();
    config.setDefaults();
    if (!config.loadOrCreate(configPath)) {
        std::cerr << "Cannot use configuration file: " << configPath.string() << std::endl;
        return false;
    }
    return true;
}

void initializeLogging(bool debug) {
    auto& config = Config::instance();

    tether::core::LogOptions logOptions;
    logOptions.level = debug ? tether::core::LogLevel::Debug
                             : tether::core::logLevelFromString(config.get<std::string>("logging.level", "info"));
    logOptions.maxFileSize = config.get<size_t>("logging.maxFileSize", logOptions.maxFileSize);
    logOptions.maxFiles = config.get<size_t>("logging.maxFiles", logOptions.maxFiles);

    auto logDir = config.get<std::string>("logging.directory", "");
    logOptions.directory = logDir.empty() ? utils::PathUtils::getLogsPath() : fs::path(logDir);

    Logger::instance().initialize(logOptions);
}

/**
 * Last path segment of a URL, without query or fragment
 */
std::string fileNameFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));

    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        path = path.substr(scheme + 3);
        auto slash = path.find('/');
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.empty() ? "download" : name;
}

std::string formatSize(int64_t bytes) {
    auto size = utils::ByteUnitConverter::scale(bytes);

    std::ostringstream out;
    out << std::fixed << std::setprecision(size.unit == utils::ByteUnit::Bytes ? 0 : 1)
        << size.magnitude << ' ' << utils::ByteUnitConverter::unitLabel(size.unit);
    return out.str();
}

std::string describeProgress(const json& record) {
    std::ostringstream out;
    out << record.value("name", std::string()) << "  "
        << formatSize(record.value("bytesDownloaded", int64_t{0}));

    auto total = record.value("bytesTotal", int64_t{0});
    if (total > 0) {
        out << " / " << formatSize(total)
            << " (" << static_cast<int>(record.value("progress", 0.0) * 100.0) << "%)";
    }

    out << "  " << formatSize(static_cast<int64_t>(record.value("speed", 0.0))) << "/s";

    auto remaining = record.find("remainingTime");
    if (remaining != record.end() && remaining->is_object()) {
        out << "  ETA " << remaining->value("hours", 0) << "h"
            << std::setw(2) << std::setfill('0') << remaining->value("minutes", 0) << "m"
            << std::setw(2) << std::setfill('0') << remaining->value("seconds", 0) << "s";
    }
    return out.str();
}

bool hasActiveTransfers(const downloader::DownloadEngine& engine) {
    for (const auto& record : engine.records()) {
        if (record.status == downloader::DownloadStatus::Downloading ||
            record.status == downloader::DownloadStatus::Preparing) {
            return true;
        }
    }
    return false;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--dir" && i + 1 < argc) {
            options.directory = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "Tether v1.0.0" << std::endl;
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            options.urls.push_back(arg);
        }
    }

    if (!loadConfiguration(options.configPath)) {
        return 1;
    }

    initializeLogging(options.debug);
    LOG_INFO("Tether v1.0.0 starting...");

    setupSignalHandlers();

    std::atomic<int> failures{0};

    auto& bus = EventBus::instance();

    try {
        downloader::HttpTransport transport;
        downloader::EventBusObserver observer;

        // Fulfilled once the transport delivered what the last run left behind
        std::promise<void> recovered;
        auto recoveredFuture = recovered.get_future();
        bool recovering = transport.pendingInterruptions() > 0;

        downloader::DownloadEngine engine(transport, observer, [&recovered]() {
            recovered.set_value();
        });

        if (!options.directory.empty()) {
            engine.setDefaultDirectory(options.directory);
        }

        std::vector<tether::core::Subscription> subscriptions;

        subscriptions.push_back(bus.subscribe("download.started", [](const json& data) {
            std::cout << "Started  " << data["record"].value("name", std::string()) << std::endl;
        }));

        subscriptions.push_back(bus.subscribe("download.progress", [](const json& data) {
            std::cout << "\r" << describeProgress(data["record"]) << "    " << std::flush;
        }));

        subscriptions.push_back(bus.subscribe("download.finished", [](const json& data) {
            std::cout << "\nFinished " << data["record"].value("name", std::string()) << std::endl;
        }));

        subscriptions.push_back(bus.subscribe("download.failed", [&failures](const json& data) {
            ++failures;
            std::cerr << "\nFailed   " << data["record"].value("name", std::string())
                      << ": " << data["error"].value("message", std::string()) << std::endl;
        }));

        subscriptions.push_back(bus.subscribe("download.canceled", [&failures](const json& data) {
            ++failures;
            std::cerr << "\nCanceled " << data["record"].value("name", std::string()) << std::endl;
        }));

        subscriptions.push_back(bus.subscribe("download.destinationMissing", [&failures](const json& data) {
            ++failures;
            std::cerr << "\nDestination missing for " << data["record"].value("name", std::string())
                      << "; file kept at " << data.value("location", std::string()) << std::endl;
        }));

        // Pick up whatever the previous run left behind
        subscriptions.push_back(bus.subscribe("download.interruptedTasksPopulated", [&engine](const json& data) {
            for (const auto& record : data["records"]) {
                auto status = record.value("status", std::string());
                if (status == "Paused" || status == "Failed") {
                    std::cout << "Resuming " << record.value("name", std::string()) << std::endl;
                    engine.retry(record.value("id", downloader::RecordId{0}));
                }
            }
        }));

        engine.initialize();

        for (const auto& url : options.urls) {
            try {
                engine.start(fileNameFromUrl(url), url);
            } catch (const downloader::MalformedIdentity& e) {
                LOG_ERROR("Cannot download {}: {}", url, e.what());
                ++failures;
            }
        }

        if (recovering) {
            LOG_INFO("Waiting for transfers interrupted in the previous run");
            while (!g_stopRequested &&
                   recoveredFuture.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
            }
        }

        engine.waitIdle();

        while (!g_stopRequested && hasActiveTransfers(engine)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        engine.shutdown();

        bool interrupted = g_stopRequested;
        if (interrupted) {
            LOG_INFO("Interrupted; suspending transfers for the next run");
            transport.suspendAll();
        }

        bool complete = !interrupted && failures == 0 && engine.count() == 0;
        subscriptions.clear();

        LOG_INFO("Tether shutdown complete");
        Logger::instance().flush();
        return complete ? 0 : 1;

    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        return 1;
    }
}
