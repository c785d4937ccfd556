#include <catch2/catch_test_macros.hpp>
#include "ledger_fixture.hpp"

using namespace ferry;
using ferry::test::LedgerFixture;

namespace
{
    /** Relayer-side transfer id: digest of the outbound event */
    TransferId observed_transfer(const EventLog &events)
    {
        auto out = events.last("BridgedOut").value();
        return crypto::SHA256::hash(out.to_json().dump());
    }
}

TEST_CASE("Tokens travel from the origin chain to the sibling and back", "[round_trip]")
{
    LedgerFixture f;
    const auto &alice = f.alice.identity();
    const auto &relayer = f.relayer.identity();
    auto amount = whole_tokens(100);

    auto origin = f.funded_primary(1, whole_tokens(1'000));
    auto sibling = f.secondary(2);
    REQUIRE(f.approve(*sibling, OperationKind::SetBridgeInCaller, relayer, 0).has_value());

    REQUIRE(origin->bridge_out(alice, amount, alice, 1, 2).has_value());
    auto outbound = observed_transfer(*f.events);
    REQUIRE(sibling->bridge_in(relayer, alice, amount, 2, outbound, 1).has_value());

    REQUIRE(origin->balance_of(alice) == whole_tokens(900));
    REQUIRE(sibling->balance_of(alice) == amount);
    REQUIRE(origin->total_supply() + sibling->total_supply() == primary_mint_tranche());

    // The relayer cannot settle the same observation twice
    f.clock->advance(std::chrono::minutes{1});
    REQUIRE(std::string(sibling->bridge_in(relayer, alice, amount, 2, outbound, 1).error().what()) ==
            "Transaction already processed");

    REQUIRE(sibling->bridge_out(alice, amount, alice, 2, 1).has_value());
    auto returning = observed_transfer(*f.events);
    REQUIRE(returning != outbound);
    REQUIRE(origin->bridge_in(relayer, alice, amount, 1, returning, 2).has_value());

    REQUIRE(origin->balance_of(alice) == whole_tokens(1'000));
    REQUIRE(sibling->total_supply() == 0);
    REQUIRE(origin->total_supply() == primary_mint_tranche());
    REQUIRE(f.events->verify_chain());
}

TEST_CASE("Custody on one chain backs minted supply on the other", "[round_trip]")
{
    LedgerFixture f;
    const auto &alice = f.alice.identity();
    const auto &relayer = f.relayer.identity();
    auto amount = whole_tokens(250);

    std::shared_ptr<PrimaryLedger> token = f.funded_primary(1, whole_tokens(1'000));
    auto custody = f.vault(1, token, "custody");
    auto sibling = f.secondary(2);
    REQUIRE(f.approve(*custody, OperationKind::SetBridgeInCaller, relayer, 0).has_value());
    REQUIRE(f.approve(*sibling, OperationKind::SetBridgeInCaller, relayer, 0).has_value());

    REQUIRE(token->approve(alice, custody->account(), amount).has_value());
    REQUIRE(custody->lock_tokens(alice, amount, alice, 1, 2).has_value());
    REQUIRE(sibling->bridge_in(relayer, alice, amount, 2, observed_transfer(*f.events), 1).has_value());

    REQUIRE(custody->get_vault_balance() == amount);
    REQUIRE(sibling->total_supply() == custody->get_vault_balance());

    REQUIRE(sibling->bridge_out(alice, whole_tokens(50), alice, 2, 1).has_value());
    REQUIRE(custody->release_tokens(relayer, alice, whole_tokens(50), 1, observed_transfer(*f.events), 2).has_value());

    REQUIRE(sibling->total_supply() == whole_tokens(200));
    REQUIRE(custody->get_vault_balance() == whole_tokens(200));
    REQUIRE(token->balance_of(alice) == whole_tokens(800));
}
