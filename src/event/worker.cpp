/// @file worker.cpp
/// @brief Cascade routing worker implementation

#include <relay/event/worker.hpp>
#include <relay/core/log.hpp>

#include <exception>
#include <utility>

namespace relay_event {

// =============================================================================
// run_worker
// =============================================================================

void run_worker(Receiver<CascadeBox> control,
                std::vector<CascadeBox> cascades,
                const relay_core::WorkerConfig& config)
{
    auto log = relay_core::get_logger(config.name);
    if (config.log_level) {
        relay_core::set_logger_level(config.name, *config.log_level);
    }
    log->info("started with {} cascade(s)", cascades.size());

    for (;;) {
        // The wait-set is rebuilt every round from the current cascades
        Select sel;
        sel.recv(control);
        for (const auto& cascade : cascades) {
            cascade->register_input(sel);
        }

        SelectedOperation oper = sel.select();

        if (oper.index() == 0) {
            auto incoming = oper.recv(control);
            if (incoming.is_err()) {
                log->info("control inlet closed, stopping with {} cascade(s)", cascades.size());
                return;
            }
            CascadeBox cascade = std::move(incoming).value();
            if (!cascade) {
                log->warn("ignored empty cascade handle");
                continue;
            }
            cascades.push_back(std::move(cascade));
            log->debug("cascade admitted ({} active)", cascades.size());
            continue;
        }

        const std::size_t idx = oper.index() - 1;
        auto clx = cascades[idx]->try_run(oper);

        if (!clx) {
            // Source exhausted: release resources, then drop unconditionally
            cascades[idx]->cleanup({});
            cascades.erase(cascades.begin() + static_cast<std::ptrdiff_t>(idx));
            log->debug("cascade retired: input exhausted ({} active)", cascades.size());
            continue;
        }

        if (clx->empty()) {
            continue;
        }

        if (!cascades[idx]->cleanup(std::move(*clx))) {
            cascades.erase(cascades.begin() + static_cast<std::ptrdiff_t>(idx));
            log->debug("cascade retired: no routes left ({} active)", cascades.size());
        }
    }
}

// =============================================================================
// CascadeWorker
// =============================================================================

CascadeWorker::CascadeWorker(std::vector<CascadeBox> initial, relay_core::WorkerConfig config)
    : m_name(config.name)
{
    auto [tx, rx] = channel_unbounded<CascadeBox>();
    m_control.emplace(std::move(tx));
    m_thread = std::thread(
        [rx = std::move(rx), initial = std::move(initial), config = std::move(config)]() mutable {
            try {
                run_worker(std::move(rx), std::move(initial), config);
            } catch (const std::exception& e) {
                relay_core::get_logger(config.name)->critical("worker terminated: {}", e.what());
            }
        });
}

CascadeWorker::~CascadeWorker() {
    stop();
}

bool CascadeWorker::submit(CascadeBox cascade) {
    if (!m_control) {
        return false;
    }
    return m_control->send(std::move(cascade)).is_ok();
}

void CascadeWorker::stop() {
    m_control.reset();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

} // namespace relay_event
