#ifndef CONTENT_HASHER_HPP
#define CONTENT_HASHER_HPP

#include <cstddef>
#include <filesystem>
#include <string>

// Files are streamed through the digest in chunks of this size.
constexpr std::size_t kHashChunkSize = 2 * 1024 * 1024;

// SHA-256 of the file contents as 64 lowercase hex characters.
// Throws IoError/PermissionError when the file cannot be opened or read.
std::string hashFile(const std::filesystem::path& path);

#endif
