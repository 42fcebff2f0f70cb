#pragma once

#include "numeric.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

namespace platmon::units
{

// Millidegree C as "41.50C", rounded to the nearest hundredth in integer
// arithmetic so that no reading picks up binary float error.
inline std::string celsiusFromMilli(long milli)
{
    const long centi = numeric::roundedDivide(milli, 10);
    const long mag = std::labs(centi);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%ld.%02ldC", centi < 0 ? "-" : "",
                  mag / 100, mag % 100);
    return std::string(buf);
}

} // namespace platmon::units
