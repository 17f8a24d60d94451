#pragma once

namespace exitc
{
inline constexpr int ok         = 0;
inline constexpr int bad_args   = 2;
inline constexpr int io_error   = 3;
inline constexpr int incomplete = 4;  // ran out of rounds before every file was acked
}  // namespace exitc
