#pragma once

#include "types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <unordered_set>

namespace ferry
{
    /**
     * Number of settled inbound transfer ids remembered. An id older than this
     * many settlements is evicted and becomes settleable again; the horizon is a
     * storage bound, kept fixed so every deployment catches the same window.
     */
    inline constexpr std::size_t kReplayHorizon = 100;

    /**
     * Bounded record of processed transfer ids.
     * Fixed ring of slots plus a monotonic cursor; the slot at cursor % capacity
     * is evicted before it is overwritten.
     */
    class ReplayRegistry
    {
    public:
        static constexpr std::size_t capacity = kReplayHorizon;

        /** True if id is currently remembered */
        bool contains(const TransferId &id) const;

        /**
         * Remember id, evicting the oldest entry once capacity is reached.
         * Inserting an id that is already present is rejected.
         */
        Result<void> insert(const TransferId &id);

        std::size_t size() const { return present_.size(); }

        std::uint64_t total_inserted() const { return cursor_; }

    private:
        std::array<TransferId, capacity> slots_{};
        std::uint64_t cursor_{0};
        std::unordered_set<TransferId, ByteArrayHash> present_;
    };

} // namespace ferry
