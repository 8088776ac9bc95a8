#pragma once

namespace o2d
{

constexpr float PI = 3.14159265358979323846f;

} // namespace o2d
