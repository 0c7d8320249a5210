#include "StringUtils.hpp"
#include <QString>
#include <iomanip>
#include <sstream>

namespace ironwatch {

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return QString::fromStdString(haystack).contains(
        QString::fromStdString(needle), Qt::CaseInsensitive);
}

std::optional<uint16_t> parseHexId(const std::string& text) {
    QString trimmed = QString::fromStdString(text).trimmed();
    if (trimmed.startsWith("0x", Qt::CaseInsensitive)) {
        trimmed = trimmed.mid(2);
    }
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    bool ok = false;
    uint value = trimmed.toUInt(&ok, 16);
    if (!ok || value > 0xFFFF) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::string toHex(uint16_t value, int width) {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setw(width) << std::setfill('0') << value;
    return ss.str();
}

}
