/**
 * TransferIdentity.cpp
 */

#include "TransferIdentity.hpp"
#include "DownloadError.hpp"

#include <vector>

namespace tether::core::downloader {

namespace {

constexpr size_t kNameIndex = 0;
constexpr size_t kUrlIndex = 1;
constexpr size_t kDestinationIndex = 2;
constexpr size_t kFieldCount = 3;

std::vector<std::string> splitTag(const std::string& tag) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;

    while (true) {
        auto pos = tag.find(TransferIdentity::kDelimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(tag.substr(start));
            break;
        }
        parts.push_back(tag.substr(start, pos - start));
        start = pos + 1;
    }

    return parts;
}

void checkField(const std::string& field, const char* label) {
    if (field.find(TransferIdentity::kDelimiter) != std::string::npos) {
        throw MalformedIdentity(std::string("Transfer ") + label + " contains the tag delimiter");
    }
}

} // namespace

TransferIdentity::TransferIdentity(std::string name, std::string sourceUrl, std::string destinationPath)
    : m_name(std::move(name))
    , m_sourceUrl(std::move(sourceUrl))
    , m_destinationPath(std::move(destinationPath)) {
    checkField(m_name, "name");
    checkField(m_sourceUrl, "URL");
    checkField(m_destinationPath, "destination");
}

std::string TransferIdentity::serialize() const {
    std::string tag;
    tag.reserve(m_name.size() + m_sourceUrl.size() + m_destinationPath.size() + 2);
    tag += m_name;
    tag += kDelimiter;
    tag += m_sourceUrl;
    tag += kDelimiter;
    tag += m_destinationPath;
    return tag;
}

TransferIdentity TransferIdentity::deserialize(const std::string& tag) {
    auto parts = splitTag(tag);

    if (parts.size() < kFieldCount) {
        throw MalformedIdentity("Task tag has " + std::to_string(parts.size()) +
                                " field(s), expected " + std::to_string(kFieldCount));
    }

    return TransferIdentity(parts[kNameIndex], parts[kUrlIndex], parts[kDestinationIndex]);
}

} // namespace tether::core::downloader
