#include "attlog/version.h"

namespace attlog {

std::string_view version()
{
    return "0.3.0";
}

} // namespace attlog
