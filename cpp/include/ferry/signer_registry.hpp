#pragma once

#include "types.hpp"
#include <array>
#include <cstddef>

namespace ferry
{
    inline constexpr std::size_t kSignerCount = 4;

    /**
     * Fixed set of exactly four distinct, non-zero signer identities.
     * Membership is a linear scan; slot order is preserved across replacements.
     */
    class SignerRegistry
    {
    public:
        using Slots = std::array<Identity, kSignerCount>;

        /** Validate and build a registry (rejects zero or duplicate identities) */
        static Result<SignerRegistry> create(const Slots &signers);

        bool is_signer(const Identity &identity) const;

        /**
         * Replace old_signer with new_signer in place.
         * Fails if old_signer is not registered, or new_signer is zero or already registered.
         */
        Result<void> replace(const Identity &old_signer, const Identity &new_signer);

        const Slots &signers() const { return slots_; }

    private:
        explicit SignerRegistry(const Slots &signers) : slots_(signers) {}

        Slots slots_;
    };

} // namespace ferry
