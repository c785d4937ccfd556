#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry
{
    struct AuditConfig
    {
        bool enabled{true};
        std::string log_path{}; // empty: spdlog only
    };

    /**
     * Structured record of a successful mutation. Carries every input field of
     * the call that produced it; this is the only audit trail a ledger keeps.
     */
    struct Event
    {
        std::string ts;
        std::string name;
        ChainId chain_id{0};
        nlohmann::json fields;

        nlohmann::json to_json() const;
    };

    /**
     * AuditChain links events with hashes for tamper detection. Each link is
     * SHA-256 over the previous link and the canonical JSON of the event.
     */
    class AuditChain
    {
    public:
        AuditChain();

        /** Append an event, returning its chain hash */
        std::string append(const Event &event);

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        const std::vector<std::string> &hashes() const { return hashes_; }

        /** Recompute the chain over events and compare with the stored links */
        bool verify(const std::vector<Event> &events) const;

    private:
        std::vector<std::string> hashes_;
    };

    /**
     * Sink for ledger events. Entry points stage events in a Batch and commit it
     * only once the whole call has succeeded, so a rejected call leaves no trace.
     */
    class EventLog
    {
    public:
        explicit EventLog(AuditConfig cfg = {});
        ~EventLog();

        EventLog(const EventLog &) = delete;
        EventLog &operator=(const EventLog &) = delete;

        class Batch
        {
        public:
            Batch(EventLog &log, ChainId chain_id, Timestamp ts);
            ~Batch();

            Batch(const Batch &) = delete;
            Batch &operator=(const Batch &) = delete;

            void emit(std::string name, nlohmann::json fields);

            /** Publish staged events; discarded on destruction otherwise */
            void commit();

            std::size_t size() const { return pending_.size(); }

        private:
            EventLog &log_;
            ChainId chain_id_;
            std::string ts_;
            std::vector<Event> pending_;
            bool committed_{false};
        };

        Batch begin(ChainId chain_id, Timestamp ts);

        std::vector<Event> events() const;
        std::optional<Event> last(std::string_view name) const;
        std::size_t count(std::string_view name) const;
        std::optional<std::string> head() const;

        /** Verify the recorded events against their chain hashes */
        bool verify_chain() const;

    private:
        void publish(std::vector<Event> events);

        AuditConfig cfg_;
        mutable std::mutex mutex_;
        std::vector<Event> events_;
        AuditChain chain_;
        std::ofstream file_;
    };

} // namespace ferry
