#pragma once

/// @file merge.hpp
/// @brief One read handle over several listeners of the same event type
///
/// Listeners may come from different queue kinds. Reads visit them in the
/// order they were added and concatenate what each one has pending.

#include "fwd.hpp"
#include "queue.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace relay_event {

template<typename T>
class MergedListener {
public:
    MergedListener() = default;

    /// Take ownership of a listener; it is read after the ones added before
    template<typename Cell>
    MergedListener& add(Listener<T, Cell> listener) {
        m_sources.push_back(std::make_unique<Source<Cell>>(std::move(listener)));
        return *this;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_sources.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_sources.empty(); }

    // =========================================================================
    // Consumption
    // =========================================================================

    /// Pending events of every listener, in listener order
    [[nodiscard]] std::vector<T> peek() const {
        return collect(m_sources.size());
    }

    template<typename F>
    decltype(auto) with(F&& f) const {
        return with_n(m_sources.size(), std::forward<F>(f));
    }

    template<typename F>
    auto map(F&& f) const -> std::vector<std::invoke_result_t<F&, const T&>> {
        return map_n(m_sources.size(), std::forward<F>(f));
    }

    /// Like with(), reading only the first n listeners
    template<typename F>
    decltype(auto) with_n(std::size_t n, F&& f) const {
        std::vector<T> events = collect(n);
        return std::invoke(std::forward<F>(f), std::span<const T>(events));
    }

    /// Like map(), reading only the first n listeners
    template<typename F>
    auto map_n(std::size_t n, F&& f) const -> std::vector<std::invoke_result_t<F&, const T&>> {
        std::vector<std::invoke_result_t<F&, const T&>> out;
        for (const T& event : collect(n)) {
            out.push_back(f(event));
        }
        return out;
    }

private:
    struct SourceBase {
        virtual ~SourceBase() = default;
        virtual void drain_into(std::vector<T>& out) const = 0;
    };

    template<typename Cell>
    struct Source final : SourceBase {
        explicit Source(Listener<T, Cell> l) : listener(std::move(l)) {}

        void drain_into(std::vector<T>& out) const override {
            listener.with([&](std::span<const T> events) {
                out.insert(out.end(), events.begin(), events.end());
            });
        }

        Listener<T, Cell> listener;
    };

    std::vector<T> collect(std::size_t n) const {
        std::vector<T> out;
        const std::size_t count = std::min(n, m_sources.size());
        for (std::size_t i = 0; i < count; ++i) {
            m_sources[i]->drain_into(out);
        }
        return out;
    }

    std::vector<std::unique_ptr<SourceBase>> m_sources;
};

} // namespace relay_event
