#pragma once

namespace sprout {

inline constexpr const char* VERSION = "0.1.0";

}  // namespace sprout
