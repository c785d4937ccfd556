#include "ferry/replay_registry.hpp"

namespace ferry
{

    bool ReplayRegistry::contains(const TransferId &id) const
    {
        return present_.contains(id);
    }

    Result<void> ReplayRegistry::insert(const TransferId &id)
    {
        if (contains(id))
        {
            return std::unexpected(FerryError::policy("Transaction already processed"));
        }

        auto slot = static_cast<std::size_t>(cursor_ % capacity);
        if (cursor_ >= capacity)
        {
            present_.erase(slots_[slot]);
        }

        slots_[slot] = id;
        present_.insert(id);
        ++cursor_;
        return {};
    }

} // namespace ferry
