#pragma once

#include "types.hpp"
#include <string>

namespace ferry
{
    enum class LifecycleState
    {
        Active,
        Paused,
        Halted
    };

    inline std::string lifecycle_state_to_string(LifecycleState state)
    {
        switch (state)
        {
        case LifecycleState::Active:
            return "active";
        case LifecycleState::Paused:
            return "paused";
        case LifecycleState::Halted:
            return "halted";
        }
        return "unknown";
    }

    /**
     * Reversible pause plus a terminal halt. Halted is entered once and never left;
     * the pause flag is kept independently so a halted ledger still reports it.
     */
    class Lifecycle
    {
    public:
        LifecycleState state() const
        {
            if (halted_)
                return LifecycleState::Halted;
            return paused_ ? LifecycleState::Paused : LifecycleState::Active;
        }

        bool paused() const { return paused_; }
        bool halted() const { return halted_; }

        /** Fails with "Enforced pause" if already paused */
        Result<void> pause();

        /** Fails with "Expected pause" if not paused */
        Result<void> unpause();

        /** Enter the terminal state */
        Result<void> halt();

        Result<void> require_not_halted() const;
        Result<void> require_not_paused() const;

    private:
        bool paused_{false};
        bool halted_{false};
    };

    /**
     * Scoped non-reentrancy lock over a flag owned by the guarded object.
     * A second guard on the same flag while the first is alive is not acquired.
     */
    class ReentrancyGuard
    {
    public:
        explicit ReentrancyGuard(bool &entered) : entered_(entered), acquired_(!entered)
        {
            if (acquired_)
                entered_ = true;
        }

        ~ReentrancyGuard()
        {
            if (acquired_)
                entered_ = false;
        }

        ReentrancyGuard(const ReentrancyGuard &) = delete;
        ReentrancyGuard &operator=(const ReentrancyGuard &) = delete;

        bool acquired() const { return acquired_; }

        Result<void> check() const
        {
            if (!acquired_)
                return std::unexpected(FerryError::lifecycle("Reentrant call"));
            return {};
        }

    private:
        bool &entered_;
        bool acquired_;
    };

} // namespace ferry
