// Formatting helpers shared by the loader, the cache and the CLI.
// Backed by {fmt}, the copy spdlog links against.

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace mediacache {

template <typename... Args>
inline std::string fmt_format(fmt::format_string<Args...> fmt, Args&&... args) {
    return fmt::format(fmt, std::forward<Args>(args)...);
}

// Decimal (1000-based) byte count in the style of a file browser: "812 bytes",
// "3.4 MB", "1.2 GB".
inline std::string formatByteCount(std::uint64_t bytes) {
    if (bytes < 1000) {
        return fmt::format("{} bytes", bytes);
    }
    static constexpr const char* kUnits[] = {"KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes) / 1000.0;
    std::size_t unit = 0;
    while (value >= 1000.0 && unit + 1 < std::size(kUnits)) {
        value /= 1000.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{:.0f} {}", value, kUnits[unit]);
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

// "12.5% of 3.4 MB"
inline std::string formatProgress(double fraction, std::uint64_t totalBytes) {
    return fmt::format("{:.1f}% of {}", fraction * 100.0, formatByteCount(totalBytes));
}

} // namespace mediacache
