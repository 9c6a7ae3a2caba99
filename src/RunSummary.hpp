#ifndef RUN_SUMMARY_HPP
#define RUN_SUMMARY_HPP

#include "PlacementRecord.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Human-readable byte count: "512B", "1.5KB", "2.0MB", ... up to TB.
std::string formatSize(std::uintmax_t bytes);

// One-line summary of a run: count per action and the total size of the files involved.
std::string summarize(const std::vector<PlacementRecord>& records);

#endif
