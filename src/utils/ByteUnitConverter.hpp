// Tether - Byte Unit Converter
// Maps raw byte counts onto a binary unit ladder

#pragma once

#include <cstdint>
#include <string>

namespace tether::utils {

enum class ByteUnit {
    Bytes,
    KB,
    MB,
    GB
};

/**
 * @brief A byte count expressed in its largest fitting unit
 */
struct ScaledSize {
    double magnitude{0.0};
    ByteUnit unit{ByteUnit::Bytes};
};

class ByteUnitConverter {
public:
    static constexpr double kKiloByte = 1024.0;
    static constexpr double kMegaByte = 1024.0 * 1024.0;
    static constexpr double kGigaByte = 1024.0 * 1024.0 * 1024.0;

    /**
     * @brief Scale a byte count: >= 1 GiB -> GB, >= 1 MiB -> MB,
     * >= 1 KiB -> KB, otherwise Bytes. No rounding is applied.
     */
    static ScaledSize scale(int64_t byteCount);

    static std::string unitLabel(ByteUnit unit);
};

} // namespace tether::utils
