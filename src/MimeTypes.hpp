#ifndef MIME_TYPES_HPP
#define MIME_TYPES_HPP

#include <filesystem>
#include <optional>
#include <string>

// Guess a MIME type from the file name alone; the file is never opened.
// Encoding suffixes (.gz, .bz2, .xz, .br, .Z) are looked through: "notes.txt.gz" is text/plain.
std::optional<std::string> guessMimeType(const std::filesystem::path& file);

#endif
