#pragma once

/// @file worker.hpp
/// @brief Cascade routing worker
///
/// One thread multiplexes readiness across its cascades and a control
/// inlet. New cascades arrive through the inlet; closing the inlet (the
/// last Sender<CascadeBox> released) is the only stop signal. A cascade
/// leaves the worker when its input is exhausted or when cleanup reports
/// that no live route and no finalizer remain.
///
/// Forwarding between cascades goes through queues, so a cycle in the
/// cascade graph shows up as sustained traffic rather than recursion. It can
/// still starve other cascades on the same worker; avoiding cycles is the
/// caller's job.

#include "fwd.hpp"
#include "cascade.hpp"
#include "channel.hpp"
#include <relay/core/config.hpp>

#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace relay_event {

/// Run a routing worker on the calling thread until `control` is closed.
/// Callbacks of the cascades (filters, transforms, finalizers) must not throw.
void run_worker(Receiver<CascadeBox> control,
                std::vector<CascadeBox> cascades,
                const relay_core::WorkerConfig& config = {});

// =============================================================================
// CascadeWorker
// =============================================================================

/// Owns a worker thread and the sending side of its control inlet.
/// Not thread-safe itself; submit from one owner thread.
class CascadeWorker {
public:
    explicit CascadeWorker(std::vector<CascadeBox> initial = {},
                           relay_core::WorkerConfig config = {});

    /// Stops the worker
    ~CascadeWorker();

    CascadeWorker(const CascadeWorker&) = delete;
    CascadeWorker& operator=(const CascadeWorker&) = delete;
    CascadeWorker(CascadeWorker&&) = delete;
    CascadeWorker& operator=(CascadeWorker&&) = delete;

    /// Hand a cascade to the worker thread
    /// @return false if the worker was stopped
    bool submit(CascadeBox cascade);

    /// Close the control inlet and join the thread (idempotent)
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return m_control.has_value(); }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

private:
    std::string m_name;
    std::optional<Sender<CascadeBox>> m_control;
    std::thread m_thread;
};

} // namespace relay_event
