#include "ferry/signer_registry.hpp"
#include <algorithm>

namespace ferry
{

    Result<SignerRegistry> SignerRegistry::create(const Slots &signers)
    {
        for (std::size_t i = 0; i < signers.size(); ++i)
        {
            if (is_zero(signers[i]))
            {
                return std::unexpected(FerryError::invalid_input("Invalid signer address"));
            }
            for (std::size_t j = i + 1; j < signers.size(); ++j)
            {
                if (signers[i] == signers[j])
                {
                    return std::unexpected(FerryError::invalid_input("Duplicate signer"));
                }
            }
        }
        return SignerRegistry(signers);
    }

    bool SignerRegistry::is_signer(const Identity &identity) const
    {
        return std::find(slots_.begin(), slots_.end(), identity) != slots_.end();
    }

    Result<void> SignerRegistry::replace(const Identity &old_signer, const Identity &new_signer)
    {
        auto it = std::find(slots_.begin(), slots_.end(), old_signer);
        if (it == slots_.end())
        {
            return std::unexpected(FerryError::invalid_input("Old signer not found"));
        }
        if (is_zero(new_signer))
        {
            return std::unexpected(FerryError::invalid_input("Invalid new signer"));
        }
        if (is_signer(new_signer))
        {
            return std::unexpected(FerryError::invalid_input("New signer already exists"));
        }

        *it = new_signer;
        return {};
    }

} // namespace ferry
