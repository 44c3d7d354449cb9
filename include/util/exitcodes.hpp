#pragma once

namespace exitc
{

inline constexpr int ok       = 0;
inline constexpr int failed   = 1;  // command ran but reported a negative result
inline constexpr int bad_args = 2;
inline constexpr int config   = 3;  // unusable configuration, nothing processed
inline constexpr int fatal    = 4;  // run stopped on a critical item failure

}  // namespace exitc
