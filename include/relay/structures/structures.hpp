#pragma once

/// @file structures.hpp
/// @brief Main include file for relay_structures module

#include "fwd.hpp"
#include "slot_map.hpp"
