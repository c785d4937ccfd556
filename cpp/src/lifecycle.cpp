#include "ferry/lifecycle.hpp"

namespace ferry
{

    Result<void> Lifecycle::pause()
    {
        if (paused_)
            return std::unexpected(FerryError::lifecycle("Enforced pause"));
        paused_ = true;
        return {};
    }

    Result<void> Lifecycle::unpause()
    {
        if (!paused_)
            return std::unexpected(FerryError::lifecycle("Expected pause"));
        paused_ = false;
        return {};
    }

    Result<void> Lifecycle::halt()
    {
        if (halted_)
            return std::unexpected(FerryError::lifecycle("Contract halted"));
        halted_ = true;
        return {};
    }

    Result<void> Lifecycle::require_not_halted() const
    {
        if (halted_)
            return std::unexpected(FerryError::lifecycle("Contract halted"));
        return {};
    }

    Result<void> Lifecycle::require_not_paused() const
    {
        if (paused_)
            return std::unexpected(FerryError::lifecycle("Enforced pause"));
        return {};
    }

} // namespace ferry
