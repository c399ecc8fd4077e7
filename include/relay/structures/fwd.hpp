#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_structures types

namespace relay_structures {

/// Generational key for SlotMap
template<typename T>
struct SlotKey;

/// Generational index-based storage
template<typename T>
class SlotMap;

} // namespace relay_structures
