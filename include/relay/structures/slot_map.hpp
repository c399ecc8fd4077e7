#pragma once

/// @file slot_map.hpp
/// @brief Generational key allocator for relay_structures
///
/// SlotMap hands out keys that stay valid across unrelated insertions and
/// removals. A removed slot bumps its generation before it is reused, so a
/// stale key never reaches the value that later occupies the same index.
/// Event logs use it as their cursor registry.

#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <limits>
#include <iterator>
#include <stdexcept>
#include <type_traits>

namespace relay_structures {

// =============================================================================
// SlotKey
// =============================================================================

/// Index plus generation. T only tags the key type.
template<typename T>
struct SlotKey {
    std::uint32_t index = std::numeric_limits<std::uint32_t>::max();
    std::uint32_t generation = 0;

    constexpr SlotKey() noexcept = default;

    constexpr SlotKey(std::uint32_t idx, std::uint32_t gen) noexcept
        : index(idx), generation(gen) {}

    [[nodiscard]] static constexpr SlotKey null() noexcept { return SlotKey{}; }

    [[nodiscard]] constexpr bool is_null() const noexcept {
        return index == std::numeric_limits<std::uint32_t>::max();
    }

    explicit constexpr operator bool() const noexcept { return !is_null(); }

    constexpr bool operator==(const SlotKey& other) const noexcept {
        return index == other.index && generation == other.generation;
    }

    constexpr bool operator!=(const SlotKey& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace relay_structures

namespace std {

template<typename T>
struct hash<relay_structures::SlotKey<T>> {
    std::size_t operator()(const relay_structures::SlotKey<T>& key) const noexcept {
        return (static_cast<std::size_t>(key.generation) << 32) ^ static_cast<std::size_t>(key.index);
    }
};

} // namespace std

namespace relay_structures {

// =============================================================================
// SlotMap
// =============================================================================

/// Generational storage with O(1) insert, remove and lookup
/// @tparam T Stored value type
template<typename T>
class SlotMap {
public:
    using key_type = SlotKey<T>;
    using value_type = T;
    using size_type = std::size_t;

private:
    struct Slot {
        std::uint32_t generation = 0;
        std::optional<T> value;
    };

    std::vector<Slot> slots_;
    std::vector<std::uint32_t> free_list_;
    size_type len_ = 0;

    /// Forward iterator over occupied values
    template<bool IsConst>
    class ValueIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = T;
        using pointer = std::conditional_t<IsConst, const T*, T*>;
        using reference = std::conditional_t<IsConst, const T&, T&>;
        using slot_iter = std::conditional_t<IsConst,
            typename std::vector<Slot>::const_iterator,
            typename std::vector<Slot>::iterator>;

        ValueIterator() = default;
        ValueIterator(slot_iter it, slot_iter end) : it_(it), end_(end) { skip_empty(); }

        reference operator*() const { return *it_->value; }
        pointer operator->() const { return &*it_->value; }

        ValueIterator& operator++() {
            ++it_;
            skip_empty();
            return *this;
        }

        ValueIterator operator++(int) {
            ValueIterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const ValueIterator& other) const { return it_ == other.it_; }
        bool operator!=(const ValueIterator& other) const { return it_ != other.it_; }

    private:
        void skip_empty() {
            while (it_ != end_ && !it_->value.has_value()) {
                ++it_;
            }
        }

        slot_iter it_{};
        slot_iter end_{};
    };

public:
    using iterator = ValueIterator<false>;
    using const_iterator = ValueIterator<true>;

    SlotMap() = default;

    // =========================================================================
    // Capacity
    // =========================================================================

    [[nodiscard]] size_type size() const noexcept { return len_; }
    [[nodiscard]] bool empty() const noexcept { return len_ == 0; }

    // =========================================================================
    // Insertion / Removal
    // =========================================================================

    /// Insert a value and return its key (reuses freed slots first)
    key_type insert(T value) {
        std::uint32_t idx;
        if (!free_list_.empty()) {
            idx = free_list_.back();
            free_list_.pop_back();
        } else {
            idx = static_cast<std::uint32_t>(slots_.size());
            slots_.emplace_back();
        }

        Slot& slot = slots_[idx];
        slot.value.emplace(std::move(value));
        ++len_;
        return key_type(idx, slot.generation);
    }

    /// Remove by key
    /// @return The removed value, or nullopt for a stale or null key
    std::optional<T> remove(key_type key) {
        if (!contains_key(key)) {
            return std::nullopt;
        }

        Slot& slot = slots_[key.index];
        std::optional<T> out = std::move(slot.value);
        slot.value.reset();
        ++slot.generation;
        free_list_.push_back(key.index);
        --len_;
        return out;
    }

    /// Remove every value; all outstanding keys become stale
    void clear() {
        free_list_.clear();
        for (std::uint32_t i = 0; i < slots_.size(); ++i) {
            if (slots_[i].value.has_value()) {
                slots_[i].value.reset();
                ++slots_[i].generation;
            }
            free_list_.push_back(i);
        }
        len_ = 0;
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    [[nodiscard]] bool contains_key(key_type key) const noexcept {
        if (key.is_null() || key.index >= slots_.size()) {
            return false;
        }
        const Slot& slot = slots_[key.index];
        return slot.value.has_value() && slot.generation == key.generation;
    }

    /// @return Pointer to the value or nullptr for a stale key
    [[nodiscard]] T* get(key_type key) noexcept {
        return contains_key(key) ? &*slots_[key.index].value : nullptr;
    }

    [[nodiscard]] const T* get(key_type key) const noexcept {
        return contains_key(key) ? &*slots_[key.index].value : nullptr;
    }

    /// @throws std::out_of_range for a stale key
    [[nodiscard]] T& at(key_type key) {
        T* ptr = get(key);
        if (!ptr) {
            throw std::out_of_range("SlotMap: stale or null key");
        }
        return *ptr;
    }

    [[nodiscard]] const T& at(key_type key) const {
        const T* ptr = get(key);
        if (!ptr) {
            throw std::out_of_range("SlotMap: stale or null key");
        }
        return *ptr;
    }

    // =========================================================================
    // Iteration (values only, slot order)
    // =========================================================================

    iterator begin() { return iterator(slots_.begin(), slots_.end()); }
    iterator end() { return iterator(slots_.end(), slots_.end()); }
    const_iterator begin() const { return const_iterator(slots_.cbegin(), slots_.cend()); }
    const_iterator end() const { return const_iterator(slots_.cend(), slots_.cend()); }
};

} // namespace relay_structures
