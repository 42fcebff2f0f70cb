#pragma once

#include <optional>
#include <string>
#include <vector>

namespace platmon::sysfs
{

// Read the first line of a sysfs node with trailing whitespace removed.
// Returns nullopt if the node cannot be opened or a read fails after opening.
// An empty node yields "".
std::optional<std::string> readFirstLine(const std::string& path);

// Parse a decimal integer such as "45250". Leading/trailing whitespace is
// allowed, anything else is not.
std::optional<long> parseLong(const std::string& text);

// Expand a glob pattern (e.g. ".../hwmon/hwmon*/temp1_input") into the
// sorted list of matching paths. Empty when nothing matches.
std::vector<std::string> expandPattern(const std::string& pattern);

// Strip trailing whitespace and newlines.
std::string rstrip(const std::string& s);

} // namespace platmon::sysfs
