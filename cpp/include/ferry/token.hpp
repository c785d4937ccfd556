#pragma once

#include "types.hpp"
#include <map>
#include <unordered_map>
#include <utility>

namespace ferry
{
    /**
     * Fungible token as seen by a custody ledger. Every mutating call names the
     * acting identity explicitly.
     */
    class Token
    {
    public:
        virtual ~Token() = default;

        /** The token's own account (where relinquished custody is returned) */
        virtual Identity account() const = 0;

        virtual Amount balance_of(const Identity &holder) const = 0;

        virtual Result<void> transfer(const Identity &from, const Identity &to, const Amount &amount) = 0;

        /** Move amount from owner to to, spending spender's allowance */
        virtual Result<void> transfer_from(const Identity &spender,
                                           const Identity &owner,
                                           const Identity &to,
                                           const Amount &amount) = 0;
    };

    /**
     * Balance and allowance book of a token: supply accounting plus
     * ERC-20 style transfer and allowance rules.
     */
    class TokenBalances
    {
    public:
        Amount balance_of(const Identity &holder) const;
        Amount allowance(const Identity &owner, const Identity &spender) const;
        const Amount &total_supply() const { return total_supply_; }

        Result<void> mint(const Identity &to, const Amount &amount);
        Result<void> burn(const Identity &from, const Amount &amount);
        Result<void> transfer(const Identity &from, const Identity &to, const Amount &amount);
        Result<void> approve(const Identity &owner, const Identity &spender, const Amount &amount);

        /** Decrease spender's allowance over owner's balance */
        Result<void> spend_allowance(const Identity &owner, const Identity &spender, const Amount &amount);

    private:
        std::unordered_map<Identity, Amount, ByteArrayHash> balances_;
        std::map<std::pair<Identity, Identity>, Amount> allowances_;
        Amount total_supply_{0};
    };

} // namespace ferry
