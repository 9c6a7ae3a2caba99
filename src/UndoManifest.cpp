#include "UndoManifest.hpp"

#include "FileMover.hpp"
#include "OrganizerErrors.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr const char* kOperationsKey = "operations";

std::error_code lastErrorOr(std::errc fallback) {
    return errno != 0 ? std::error_code(errno, std::generic_category()) : std::make_error_code(fallback);
}
} // namespace

std::size_t writeManifest(const std::filesystem::path& path, const std::vector<PlacementRecord>& records) {
    json operations = json::array();
    for (const auto& record : records) {
        if (!isUndoable(record.action)) {
            continue;
        }
        operations.push_back({
            {"src", record.source.string()},
            {"dst", record.destination.string()},
            {"action", toString(record.action)},
        });
    }

    json document;
    document[kOperationsKey] = operations;

    std::string text;
    try {
        text = document.dump(2);
    } catch (const json::exception& e) {
        throw OrganizerError("Unable to serialize undo manifest: " + std::string(e.what()));
    }

    ensureDirectory(path.parent_path());

    std::filesystem::path tempPath = path;
    tempPath += ".tmp";
    {
        errno = 0;
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throwIoError("Unable to write undo manifest", tempPath, lastErrorOr(std::errc::io_error));
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            throwIoError("Unable to write undo manifest", tempPath, lastErrorOr(std::errc::io_error));
        }
    }

    std::error_code renameErr;
    std::filesystem::rename(tempPath, path, renameErr);
    if (renameErr) {
        std::error_code cleanupErr;
        std::filesystem::remove(tempPath, cleanupErr);
        throwIoError("Unable to replace undo manifest", path, renameErr);
    }

    return operations.size();
}

std::vector<PlacementRecord> readManifest(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throwIoError("Unable to access undo manifest", path, ec);
        }
        throw NotFoundError("Undo manifest not found: " + path.string());
    }

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throwIoError("Unable to open undo manifest", path, lastErrorOr(std::errc::io_error));
    }

    json data;
    try {
        in >> data;
    } catch (const json::parse_error& e) {
        throw ParseError("Failed to parse undo manifest `" + path.string() + "`: " + e.what());
    }

    if (!data.is_object()) {
        throw ParseError("Undo manifest `" + path.string() + "` must be a JSON object.");
    }

    std::vector<PlacementRecord> records;
    auto operationsIt = data.find(kOperationsKey);
    if (operationsIt == data.end()) {
        return records;
    }
    if (!operationsIt->is_array()) {
        throw ParseError("Undo manifest `" + path.string() + "`: `operations` must be an array.");
    }

    for (const auto& entry : *operationsIt) {
        if (!entry.is_object()) {
            throw ParseError("Undo manifest `" + path.string() + "`: each operation must be an object.");
        }

        auto srcIt = entry.find("src");
        auto dstIt = entry.find("dst");
        if (srcIt == entry.end() || !srcIt->is_string() || dstIt == entry.end() || !dstIt->is_string()) {
            throw ParseError("Undo manifest `" + path.string() + "`: operation is missing `src` or `dst`.");
        }

        PlacementAction action = PlacementAction::Move;
        if (auto actionIt = entry.find("action"); actionIt != entry.end()) {
            const auto parsed = actionIt->is_string() ? actionFromString(actionIt->get<std::string>()) : std::nullopt;
            if (!parsed) {
                throw ParseError("Undo manifest `" + path.string() + "`: unrecognized action " + actionIt->dump() + ".");
            }
            action = *parsed;
        }

        records.push_back({srcIt->get<std::string>(), dstIt->get<std::string>(), action});
    }

    return records;
}
