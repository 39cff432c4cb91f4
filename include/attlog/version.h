#pragma once

#include <string_view>

namespace attlog {

std::string_view version();

} // namespace attlog
