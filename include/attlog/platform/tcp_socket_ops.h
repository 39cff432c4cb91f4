#pragma once

#include "attlog/net/tcp_socket_ops.h"

namespace attlog::platform {

// The platform's default TCP socket operations implementation.
attlog::net::ITcpSocketOps& default_tcp_socket_ops();

} // namespace attlog::platform
