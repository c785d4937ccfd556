#include <catch2/catch_test_macros.hpp>
#include "ferry/events.hpp"
#include <filesystem>
#include <fstream>

using namespace ferry;

namespace
{
    const Timestamp kAt{std::chrono::seconds{1'700'000'000}};
}

TEST_CASE("Uncommitted batches leave no trace", "[events]")
{
    EventLog log(AuditConfig{false, ""});
    {
        auto batch = log.begin(7, kAt);
        batch.emit("Paused", {{"operation_id", "0x01"}});
        REQUIRE(batch.size() == 1);
    }
    REQUIRE(log.events().empty());
    REQUIRE_FALSE(log.head().has_value());
}

TEST_CASE("Committed events carry the chain and timestamp", "[events]")
{
    EventLog log(AuditConfig{false, ""});
    auto batch = log.begin(7, kAt);
    batch.emit("Paused", {{"operation_id", "0x01"}});
    batch.emit("Unpaused", {{"operation_id", "0x02"}});
    batch.commit();
    batch.commit();

    auto events = log.events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].name == "Paused");
    REQUIRE(events[0].chain_id == 7);
    REQUIRE(events[0].ts == format_timestamp(kAt));
    REQUIRE(events[0].fields["timestamp"] == format_timestamp(kAt));
    REQUIRE(log.count("Paused") == 1);
    REQUIRE(log.last("Unpaused")->fields["operation_id"] == "0x02");
    REQUIRE_FALSE(log.last("Halted").has_value());
    REQUIRE(log.verify_chain());
}

TEST_CASE("Audit chain detects altered history", "[events][audit]")
{
    AuditChain chain;
    std::vector<Event> events{
        Event{"t0", "BridgedOut", 1, {{"amount", "5"}}},
        Event{"t1", "BridgedIn", 2, {{"amount", "5"}}},
    };
    auto first = chain.append(events[0]);
    auto second = chain.append(events[1]);
    REQUIRE(first != second);
    REQUIRE(chain.head() == second);
    REQUIRE(chain.verify(events));

    events[0].fields["amount"] = "6";
    REQUIRE_FALSE(chain.verify(events));

    events.pop_back();
    REQUIRE_FALSE(chain.verify(events));
}

TEST_CASE("Audit file receives one JSON line per event", "[events][audit]")
{
    auto path = std::filesystem::temp_directory_path() / "ferry_events_test.log";
    std::filesystem::remove(path);
    {
        EventLog log(AuditConfig{true, path.string()});
        auto batch = log.begin(3, kAt);
        batch.emit("BridgeInCallerSet", {{"caller", "0xab"}});
        batch.commit();
    }

    std::ifstream in(path);
    std::string line;
    REQUIRE(std::getline(in, line));
    auto j = nlohmann::json::parse(line);
    REQUIRE(j["name"] == "BridgeInCallerSet");
    REQUIRE(j["chain_id"] == 3);
    REQUIRE(j.contains("chain_hash"));
    REQUIRE_FALSE(std::getline(in, line));
    std::filesystem::remove(path);
}
