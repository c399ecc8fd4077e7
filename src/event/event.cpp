/// @file event.cpp
/// @brief relay_event module version information
///
/// relay_event is header-only apart from the routing worker. This unit
/// gives the library target its version symbols.

#include <relay/event/event.hpp>

namespace relay_event {

/// Module version
static constexpr const char* k_version = "1.0.0";

/// Module name
static constexpr const char* k_module_name = "relay_event";

const char* version() noexcept {
    return k_version;
}

const char* module_name() noexcept {
    return k_module_name;
}

} // namespace relay_event
