#pragma once

#include <cmath>
#include <cstddef>
#include <functional>

inline constexpr bool float_equals(float val1, float val2, float epsilon = 1e-6f)
{
    return std::abs(val1 - val2) < epsilon;
}

inline constexpr bool float_equals(double val1, double val2, double epsilon = 1e-6)
{
    return std::abs(val1 - val2) < epsilon;
}

namespace o2d
{

// Mixes the hash of value into seed (boost::hash_combine constant)
template <typename T>
inline void hashCombine(std::size_t& seed, const T& value)
{
    seed ^= std::hash<T>{}(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

} // namespace o2d
