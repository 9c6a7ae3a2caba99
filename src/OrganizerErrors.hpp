#ifndef ORGANIZER_ERRORS_HPP
#define ORGANIZER_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

// Base class for every failure the organizer reports to its caller.
class OrganizerError : public std::runtime_error {
public:
    explicit OrganizerError(const std::string& message) : std::runtime_error(message) {}
};

// A required input (source folder, undo manifest) does not exist.
class NotFoundError : public OrganizerError {
public:
    using OrganizerError::OrganizerError;
};

// The requested source/destination layout cannot be organized safely.
class ConfigurationError : public OrganizerError {
public:
    using OrganizerError::OrganizerError;
};

// A configuration document or manifest could not be understood.
class ParseError : public OrganizerError {
public:
    using OrganizerError::OrganizerError;
};

// A filesystem operation failed.
class IoError : public OrganizerError {
public:
    IoError(const std::string& message, std::filesystem::path path, std::error_code code)
        : OrganizerError(message + " `" + path.string() + "`: " + code.message()),
          m_path(std::move(path)),
          m_code(code) {}

    const std::filesystem::path& path() const { return m_path; }
    std::error_code code() const { return m_code; }

private:
    std::filesystem::path m_path;
    std::error_code m_code;
};

// The operating system refused access to a path.
class PermissionError : public IoError {
public:
    using IoError::IoError;
};

// Throws PermissionError or IoError depending on what the OS reported.
[[noreturn]] void throwIoError(const std::string& message, const std::filesystem::path& path, std::error_code code);

#endif
