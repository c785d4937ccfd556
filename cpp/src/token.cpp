#include "ferry/token.hpp"
#include <limits>

namespace ferry
{

    Amount TokenBalances::balance_of(const Identity &holder) const
    {
        auto it = balances_.find(holder);
        return it == balances_.end() ? Amount{0} : it->second;
    }

    Amount TokenBalances::allowance(const Identity &owner, const Identity &spender) const
    {
        auto it = allowances_.find({owner, spender});
        return it == allowances_.end() ? Amount{0} : it->second;
    }

    Result<void> TokenBalances::mint(const Identity &to, const Amount &amount)
    {
        if (is_zero(to))
            return std::unexpected(FerryError::invalid_input("Invalid receiver"));
        if (amount > std::numeric_limits<Amount>::max() - total_supply_)
            return std::unexpected(FerryError::policy("Supply overflow"));

        total_supply_ += amount;
        balances_[to] += amount;
        return {};
    }

    Result<void> TokenBalances::burn(const Identity &from, const Amount &amount)
    {
        auto balance = balance_of(from);
        if (balance < amount)
            return std::unexpected(FerryError::policy("Insufficient balance"));

        balances_[from] = balance - amount;
        total_supply_ -= amount;
        return {};
    }

    Result<void> TokenBalances::transfer(const Identity &from, const Identity &to, const Amount &amount)
    {
        if (is_zero(to))
            return std::unexpected(FerryError::invalid_input("Invalid receiver"));

        auto balance = balance_of(from);
        if (balance < amount)
            return std::unexpected(FerryError::policy("Insufficient balance"));

        balances_[from] = balance - amount;
        balances_[to] += amount;
        return {};
    }

    Result<void> TokenBalances::approve(const Identity &owner, const Identity &spender, const Amount &amount)
    {
        if (is_zero(spender))
            return std::unexpected(FerryError::invalid_input("Invalid spender"));
        allowances_[{owner, spender}] = amount;
        return {};
    }

    Result<void> TokenBalances::spend_allowance(const Identity &owner, const Identity &spender, const Amount &amount)
    {
        auto current = allowance(owner, spender);
        if (current < amount)
            return std::unexpected(FerryError::policy("Insufficient allowance"));
        allowances_[{owner, spender}] = current - amount;
        return {};
    }

} // namespace ferry
