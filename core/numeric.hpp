#pragma once

namespace platmon::numeric
{

// Integer division rounded to nearest, ties away from zero.
// divisor must be > 0.
inline long roundedDivide(long dividend, long divisor)
{
    const long half = divisor / 2;
    if (dividend >= 0)
    {
        return (dividend + half) / divisor;
    }
    return -((-dividend + half) / divisor);
}

} // namespace platmon::numeric
