#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ibmcloud_mcp {

// Parse dotenv-style text: KEY=VALUE per line. Blank lines and lines whose
// first non-blank character is '#' are skipped, as are lines without '='.
// An optional leading "export " is ignored. Keys and values are trimmed and
// one layer of matching single or double quotes is removed from the value.
// A later duplicate key wins.
std::map<std::string, std::string> ParseDotenv(std::string_view text);

// Read and parse a dotenv file. Returns nullopt if it cannot be opened.
std::optional<std::map<std::string, std::string>> LoadDotenvFile(
    const std::string& path);

} // namespace ibmcloud_mcp
