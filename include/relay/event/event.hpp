#pragma once

/// @file event.hpp
/// @brief Main include file for relay_event module

#include "fwd.hpp"
#include "emit_result.hpp"
#include "raw_queue.hpp"
#include "cell.hpp"
#include "queue.hpp"
#include "channel.hpp"
#include "cascade.hpp"
#include "token_queue.hpp"
#include "direct_queue.hpp"
#include "worker.hpp"
#include "bidir.hpp"
#include "merge.hpp"

/// @namespace relay_event
/// @brief Broadcast event queues and routing cascades
///
/// - **Queues**: ExclusiveQueue, LocalQueue and SyncQueue share one broadcast
///   log; every Listener reads each event once
/// - **Notifying queues**: TokenQueue wakes subscribers with tokens,
///   DirectQueue hands them copies
/// - **Cascades**: filter chains forwarding events between queues, driven
///   by a CascadeWorker thread
/// - **Bidirectional**: BidirQueue and BidirSingleQueue for 1:1 links
///
/// Example usage:
/// @code
/// relay_event::TokenQueue<Input> input;
/// relay_event::TokenQueue<Input> clicks;
/// auto on_click = clicks.listen();
///
/// auto cascade = input.cascade()
///     .attach_route(clicks, false, [](const Input& e) { return e.is_click(); })
///     .wrap();
///
/// relay_event::CascadeWorker worker;
/// worker.submit(std::move(cascade).value());
/// input.push(Input::click(10, 20));
/// @endcode

namespace relay_event {

/// Module version string
const char* version() noexcept;

/// Module name
const char* module_name() noexcept;

} // namespace relay_event
