#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "EventSink.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <sys/time.h>

// Fresh directory under the system temp folder, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "tidytree-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        m_path = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Local-time noon on the given day, matching how date folders are derived.
inline std::time_t localNoon(int year, int month, int day) {
    std::tm tm {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

inline void setModifiedTime(const std::filesystem::path& path, std::time_t when) {
    timeval times[2] {};
    times[0].tv_sec = when;
    times[1].tv_sec = when;
    if (::utimes(path.c_str(), times) != 0) {
        throw std::runtime_error("utimes failed for " + path.string());
    }
}

// Keeps every event for later inspection.
class RecordingSink : public EventSink {
public:
    void onEvent(const OrganizerEvent& event) override { events.push_back(event); }

    std::size_t count(EventKind kind) const {
        std::size_t n = 0;
        for (const auto& event : events) {
            if (event.kind == kind) {
                ++n;
            }
        }
        return n;
    }

    std::vector<OrganizerEvent> events;
};

#endif
