#include "sysfs_io.hpp"

#include "logging.hpp"

#include <glob.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace platmon::sysfs
{

std::string rstrip(const std::string& s)
{
    auto end = s.find_last_not_of(" \t\r\n\v\f");
    if (end == std::string::npos)
        return {};
    return s.substr(0, end + 1);
}

std::optional<std::string> readFirstLine(const std::string& path)
{
    std::ifstream ifs(path);
    if (!ifs.is_open())
    {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(ifs, line) && ifs.bad())
    {
        // opened but unreadable, e.g. EISDIR or EIO from the driver
        return std::nullopt;
    }
    return rstrip(line);
}

std::optional<long> parseLong(const std::string& text)
{
    const char* begin = text.c_str();
    while (std::isspace(static_cast<unsigned char>(*begin)))
        ++begin;
    if (*begin == '\0')
        return std::nullopt;

    char* end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (end == begin || errno == ERANGE)
        return std::nullopt;

    while (std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (*end != '\0')
        return std::nullopt;

    return value;
}

std::vector<std::string> expandPattern(const std::string& pattern)
{
    glob_t g{};

    // Always release the glob buffer, including on GLOB_NOMATCH.
    struct ScopeExit
    {
        glob_t* g;
        ~ScopeExit()
        {
            globfree(g);
        }
    } guard{&g};

    std::vector<std::string> out;
    int rc = glob(pattern.c_str(), 0, nullptr, &g);
    if (rc == GLOB_NOMATCH)
    {
        return out;
    }
    if (rc != 0)
    {
        log::debug(log::concat("glob failed for ", pattern, " rc=", rc));
        return out;
    }

    out.reserve(g.gl_pathc);
    for (size_t i = 0; i < g.gl_pathc; ++i)
    {
        out.emplace_back(g.gl_pathv[i]);
    }
    return out;
}

} // namespace platmon::sysfs
