#include "OrganizerErrors.hpp"

void throwIoError(const std::string& message, const std::filesystem::path& path, std::error_code code) {
    if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted) {
        throw PermissionError(message, path, code);
    }
    throw IoError(message, path, code);
}
