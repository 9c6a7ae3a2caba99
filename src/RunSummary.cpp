#include "RunSummary.hpp"

#include <array>
#include <cstdio>
#include <filesystem>
#include <map>
#include <system_error>

std::string formatSize(std::uintmax_t bytes) {
    static constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + "B";
    }

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%s", value, kUnits[unit]);
    return buffer;
}

std::string summarize(const std::vector<PlacementRecord>& records) {
    std::map<std::string, std::size_t> counts;
    std::uintmax_t totalBytes = 0;

    for (const auto& record : records) {
        ++counts[toString(record.action)];

        // Placed files are measured where they landed, planned and skipped ones where they still are.
        const auto& measured = isUndoable(record.action) || record.action == PlacementAction::Undo
                                   ? record.destination
                                   : record.source;
        std::error_code ec;
        const auto size = std::filesystem::file_size(measured, ec);
        if (!ec) {
            totalBytes += size;
        }
    }

    std::string summary = std::to_string(records.size()) + " file(s)";
    for (const auto& [action, count] : counts) {
        summary += ", " + std::to_string(count) + " " + action;
    }
    summary += ", " + formatSize(totalBytes) + " total";
    return summary;
}
