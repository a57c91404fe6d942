#pragma once

namespace hideez {

constexpr const char* VERSION = "0.1.0";

} // namespace hideez
