#pragma once

/**
 * TransferIdentity.hpp
 *
 * Logical identity of a transfer: {name, source URL, destination path}.
 * Encoded into the transport task's tag so the transfer can be rebuilt
 * after a restart, when only the transport still knows the task.
 */

#include <string>

namespace tether::core::downloader {

class TransferIdentity {
public:
    /**
     * Field separator inside a tag (ASCII unit separator). Not allowed in
     * any field.
     */
    static constexpr char kDelimiter = '\x1f';

    TransferIdentity() = default;

    /**
     * @param destinationPath Directory for the finished file, empty for
     *        the default download directory
     * @throws MalformedIdentity if a field contains kDelimiter
     */
    TransferIdentity(std::string name, std::string sourceUrl, std::string destinationPath = {});

    const std::string& name() const { return m_name; }
    const std::string& sourceUrl() const { return m_sourceUrl; }
    const std::string& destinationPath() const { return m_destinationPath; }

    std::string serialize() const;

    /**
     * Decode a tag produced by serialize(). Fields beyond the third are
     * ignored.
     * @throws MalformedIdentity if fewer than three fields are present
     */
    static TransferIdentity deserialize(const std::string& tag);

    bool operator==(const TransferIdentity& other) const {
        return m_name == other.m_name &&
               m_sourceUrl == other.m_sourceUrl &&
               m_destinationPath == other.m_destinationPath;
    }

    bool operator!=(const TransferIdentity& other) const {
        return !(*this == other);
    }

private:
    std::string m_name;
    std::string m_sourceUrl;
    std::string m_destinationPath;
};

} // namespace tether::core::downloader
