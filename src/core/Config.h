#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "logging/Log.h"
#include "powergrid/grid/GridConfig.hpp"

namespace core {

struct Config {
    powergrid::GridConfig grid;
    logsys::LogConfig     log;
};

// Reads <dir>/powergrid.ini. Missing file -> false and `cfg` untouched.
// Unknown keys and unparsable values are skipped, keeping the current value.
// Inline comments (#, ;, //) are stripped from every value except log_file.
bool LoadConfig(Config& cfg, const std::filesystem::path& dir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& dir);

// Applies one key=value pair; false for unknown keys or bad values.
bool ApplyConfigValue(Config& cfg, std::string_view key, std::string_view value);

std::filesystem::path ConfigPath(const std::filesystem::path& dir);

} // namespace core
