/**
 * ByteUnitConverter.cpp
 */

#include "ByteUnitConverter.hpp"

namespace tether::utils {

ScaledSize ByteUnitConverter::scale(int64_t byteCount) {
    const double length = static_cast<double>(byteCount);

    if (length >= kGigaByte) {
        return {length / kGigaByte, ByteUnit::GB};
    } else if (length >= kMegaByte) {
        return {length / kMegaByte, ByteUnit::MB};
    } else if (length >= kKiloByte) {
        return {length / kKiloByte, ByteUnit::KB};
    }
    return {length, ByteUnit::Bytes};
}

std::string ByteUnitConverter::unitLabel(ByteUnit unit) {
    switch (unit) {
        case ByteUnit::GB: return "GB";
        case ByteUnit::MB: return "MB";
        case ByteUnit::KB: return "KB";
        case ByteUnit::Bytes:
        default:           return "Bytes";
    }
}

} // namespace tether::utils
