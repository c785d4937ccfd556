#include <catch2/catch_test_macros.hpp>
#include "ledger_fixture.hpp"
#include <functional>

using namespace ferry;
using ferry::test::LedgerFixture;
using ferry::test::transfer_id;

namespace
{
    /** In-memory token whose transfers can run caller-supplied code first */
    class HookedToken : public Token
    {
    public:
        explicit HookedToken(Identity account) : account_(account) {}

        Identity account() const override { return account_; }
        Amount balance_of(const Identity &holder) const override { return book.balance_of(holder); }

        Result<void> transfer(const Identity &from, const Identity &to, const Amount &amount) override
        {
            if (hook)
            {
                if (auto ok = hook(); !ok)
                    return ok;
            }
            return book.transfer(from, to, amount);
        }

        Result<void> transfer_from(const Identity &spender,
                                   const Identity &owner,
                                   const Identity &to,
                                   const Amount &amount) override
        {
            if (hook)
            {
                if (auto ok = hook(); !ok)
                    return ok;
            }
            if (book.allowance(owner, spender) < amount)
                return std::unexpected(FerryError::policy("Insufficient allowance"));
            auto moved = book.transfer(owner, to, amount);
            if (!moved)
                return moved;
            return book.spend_allowance(owner, spender, amount);
        }

        TokenBalances book;
        std::function<Result<void>()> hook;

    private:
        Identity account_;
    };

    struct VaultFixture : LedgerFixture
    {
        std::shared_ptr<HookedToken> token = std::make_shared<HookedToken>(crypto::SHA256::hash("token"));
        std::unique_ptr<VaultLedger> ledger = vault(1, token);

        VaultFixture()
        {
            approve(*ledger, OperationKind::SetBridgeInCaller, relayer.identity(), 0).value();
            token->book.mint(alice.identity(), 1000).value();
        }

        /** alice escrows amount with the vault */
        Result<void> lock(const Amount &amount)
        {
            auto approved = token->book.approve(alice.identity(), ledger->account(), amount);
            if (!approved)
                return approved;
            return ledger->lock_tokens(alice.identity(), amount, bob.identity(), 1, 2);
        }
    };

    std::string reason(const FerryError &e)
    {
        return e.what();
    }
}

TEST_CASE("Vault requires a token with an account", "[vault]")
{
    LedgerFixture f;
    auto none = VaultLedger::create(f.settings("v", 1), nullptr, f.clock, f.events);
    REQUIRE(reason(none.error()) == "Invalid token address");

    auto zero = VaultLedger::create(f.settings("v", 1), std::make_shared<HookedToken>(kZeroIdentity), f.clock, f.events);
    REQUIRE(reason(zero.error()) == "Invalid token address");
}

TEST_CASE("Vault defaults let settlements through a pause", "[vault]")
{
    VaultFixture f;
    REQUIRE(f.ledger->variant() == "vault");
    REQUIRE(f.ledger->policy().inbound_exempt_from_pause);
    REQUIRE(f.ledger->codes().supports(OperationKind::RelinquishTokens));
    REQUIRE_FALSE(f.ledger->codes().supports(OperationKind::Mint));
}

TEST_CASE("Locking escrows the caller's tokens", "[vault][bridge_out]")
{
    VaultFixture f;
    const auto &alice = f.alice.identity();

    // The vault pulls tokens; without an allowance the lock fails
    auto no_allowance = f.ledger->lock_tokens(alice, 100, f.bob.identity(), 1);
    REQUIRE(reason(no_allowance.error()) == "Insufficient allowance");
    REQUIRE(f.events->count("BridgedOut") == 0);

    REQUIRE(f.lock(100).has_value());
    REQUIRE(f.token->balance_of(alice) == 900);
    REQUIRE(f.ledger->get_vault_balance() == 100);
    REQUIRE(f.token->book.allowance(alice, f.ledger->account()) == 0);
    REQUIRE(f.events->last("BridgedOut")->fields["destination_chain_id"] == 2);

    REQUIRE(reason(f.lock(901).error()) == "Insufficient balance");
    REQUIRE(f.ledger->get_vault_balance() == 100);
}

TEST_CASE("Releasing pays out of custody", "[vault][bridge_in]")
{
    VaultFixture f;
    REQUIRE(f.lock(100).has_value());

    REQUIRE(f.ledger->release_tokens(f.relayer.identity(), f.bob.identity(), 40, 1, transfer_id("r1"), 2).has_value());
    REQUIRE(f.token->balance_of(f.bob.identity()) == 40);
    REQUIRE(f.ledger->get_vault_balance() == 60);

    f.clock->advance(std::chrono::minutes{1});
    auto short_funds = f.ledger->release_tokens(f.relayer.identity(), f.bob.identity(), 61, 1, transfer_id("r2"));
    REQUIRE(reason(short_funds.error()) == "Insufficient vault balance");
    REQUIRE_FALSE(f.ledger->is_processed(transfer_id("r2")));

    REQUIRE(f.ledger->release_tokens(f.relayer.identity(), f.bob.identity(), 60, 1, transfer_id("r2")).has_value());
    REQUIRE(f.ledger->get_vault_balance() == 0);
}

TEST_CASE("Paused vault still settles inbound transfers", "[vault][lifecycle]")
{
    VaultFixture f;
    REQUIRE(f.lock(100).has_value());
    REQUIRE(f.approve(*f.ledger, OperationKind::Pause, kZeroIdentity, 0).has_value());

    REQUIRE(reason(f.lock(10).error()) == "Enforced pause");
    REQUIRE(f.ledger->release_tokens(f.relayer.identity(), f.bob.identity(), 10, 1, transfer_id("r")).has_value());
    REQUIRE(f.token->balance_of(f.bob.identity()) == 10);
}

TEST_CASE("Relinquishing returns custody and halts the vault", "[vault][relinquish]")
{
    VaultFixture f;
    REQUIRE(f.lock(250).has_value());

    REQUIRE(f.approve(*f.ledger, OperationKind::RelinquishTokens, kZeroIdentity, 0).has_value());
    REQUIRE(f.ledger->halted());
    REQUIRE(f.ledger->lifecycle_state() == LifecycleState::Halted);
    REQUIRE(f.ledger->get_vault_balance() == 0);
    REQUIRE(f.token->balance_of(f.token->account()) == 250);

    auto relinquished = f.events->last("TokensRelinquished").value();
    REQUIRE(relinquished.fields["amount"] == "250");
    REQUIRE(relinquished.fields["to"] == to_hex(f.token->account()));
    REQUIRE(f.events->count("ContractHalted") == 1);

    // Nothing moves once halted, not even administration
    REQUIRE(reason(f.lock(1).error()) == "Contract halted");
    REQUIRE(reason(f.ledger->release_tokens(f.relayer.identity(), f.bob.identity(), 1, 1, transfer_id("x")).error()) ==
            "Contract halted");
    REQUIRE(reason(f.request(*f.ledger, OperationKind::Unpause, kZeroIdentity, 0).error()) == "Contract halted");
}

TEST_CASE("Relinquishing an empty vault fails", "[vault][relinquish]")
{
    VaultFixture f;
    auto empty = f.approve(*f.ledger, OperationKind::RelinquishTokens, kZeroIdentity, 0);
    REQUIRE(reason(empty.error()) == "No tokens to relinquish");
    REQUIRE(f.ledger->lifecycle_state() == LifecycleState::Active);
    REQUIRE(f.events->count("ContractHalted") == 0);
}

TEST_CASE("Token callbacks cannot re-enter the vault", "[vault][reentrancy]")
{
    VaultFixture f;
    REQUIRE(f.lock(100).has_value());

    std::optional<FerryError> nested;
    f.token->hook = [&]() -> Result<void>
    {
        auto again = f.ledger->release_tokens(f.relayer.identity(), f.bob.identity(), 1, 1, transfer_id("nested"));
        if (!again)
            nested = again.error();
        return {};
    };

    REQUIRE(f.ledger->release_tokens(f.relayer.identity(), f.alice.identity(), 10, 1, transfer_id("outer")).has_value());
    REQUIRE(nested.has_value());
    REQUIRE(reason(*nested) == "Reentrant call");
    REQUIRE_FALSE(f.ledger->is_processed(transfer_id("nested")));
    REQUIRE(f.ledger->is_processed(transfer_id("outer")));
}

TEST_CASE("Callbacks during relinquish find the vault halted", "[vault][reentrancy]")
{
    VaultFixture f;
    REQUIRE(f.lock(100).has_value());

    std::optional<FerryError> nested;
    f.token->hook = [&]() -> Result<void>
    {
        auto again = f.ledger->lock_tokens(f.alice.identity(), 1, f.bob.identity(), 1);
        if (!again)
            nested = again.error();
        return {};
    };

    REQUIRE(f.approve(*f.ledger, OperationKind::RelinquishTokens, kZeroIdentity, 0).has_value());
    REQUIRE(nested.has_value());
    REQUIRE(reason(*nested) == "Contract halted");
}

TEST_CASE("A failing token transfer leaves the vault untouched", "[vault][atomicity]")
{
    VaultFixture f;
    REQUIRE(f.lock(100).has_value());
    auto events_before = f.events->events().size();
    auto last_before = f.ledger->last_bridge_in();

    f.token->hook = []() -> Result<void>
    { return std::unexpected(FerryError::policy("Token rejected transfer")); };

    SECTION("inbound settlement")
    {
        auto failed = f.ledger->release_tokens(f.relayer.identity(), f.bob.identity(), 10, 1, transfer_id("t"));
        REQUIRE(reason(failed.error()) == "Token rejected transfer");
        REQUIRE_FALSE(f.ledger->is_processed(transfer_id("t")));
        REQUIRE(f.ledger->last_bridge_in() == last_before);
        REQUIRE(f.events->events().size() == events_before);
        REQUIRE(f.ledger->get_vault_balance() == 100);
    }

    SECTION("relinquish")
    {
        auto id = f.request(*f.ledger, OperationKind::RelinquishTokens, kZeroIdentity, 0).value();
        REQUIRE(f.sign(*f.ledger, id, f.signers[0]).value() == false);
        REQUIRE(f.sign(*f.ledger, id, f.signers[1]).value() == false);

        auto failed = f.sign(*f.ledger, id, f.signers[2]);
        REQUIRE(reason(failed.error()) == "Token rejected transfer");
        REQUIRE(f.ledger->lifecycle_state() == LifecycleState::Active);
        REQUIRE_FALSE(f.ledger->find_operation(id)->executed);
        REQUIRE(f.events->count("TokensRelinquished") == 0);
        REQUIRE(f.ledger->get_vault_balance() == 100);

        // Once the token recovers the same operation completes
        f.token->hook = nullptr;
        REQUIRE(f.sign(*f.ledger, id, f.signers[3]).value() == true);
        REQUIRE(f.ledger->halted());
    }
}
