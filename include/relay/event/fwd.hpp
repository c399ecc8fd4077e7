#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_event types

#include <cstddef>
#include <memory>

namespace relay_event {

// =============================================================================
// Logs and Listeners
// =============================================================================

template<typename T>
class EmitResult;

template<typename T>
class RawQueue;

template<typename Inner>
class ExclusiveCell;

template<typename Inner>
class LocalCell;

template<typename Inner>
class SyncCell;

template<typename T, typename Cell>
class Queue;

template<typename T, typename Cell>
class Listener;

template<typename T>
class TokenLog;

template<typename T>
class DirectLog;

template<typename T>
class TokenQueue;

template<typename T>
class DirectQueue;

template<typename T>
class MergedListener;

// =============================================================================
// Channels
// =============================================================================

struct Token;

template<typename T>
class Sender;

template<typename T>
class Receiver;

class Select;
class SelectedOperation;

// =============================================================================
// Cascades
// =============================================================================

template<typename T>
class RouteChain;

class CascadeBase;

template<typename T>
class TokenCascade;

template<typename T>
class DirectCascade;

template<typename T>
class BlackHole;

/// Owning handle to a type-erased cascade
using CascadeBox = std::unique_ptr<CascadeBase>;

class CascadeWorker;

} // namespace relay_event
