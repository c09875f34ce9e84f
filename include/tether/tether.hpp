// include/tether/tether.hpp
// Convenience header: everything an application needs.

#pragma once

#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "platform.hpp"
#include "socket.hpp"
#include "types.hpp"
