#ifndef CONFLICT_NAMER_HPP
#define CONFLICT_NAMER_HPP

#include <filesystem>

// Return path unchanged when nothing exists there, otherwise the first free
// "<stem>(<n>)<extension>" sibling counting up from 1. Never creates anything.
std::filesystem::path nextNonConflictingName(const std::filesystem::path& path);

#endif
