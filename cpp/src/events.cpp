#include "ferry/events.hpp"
#include "ferry/crypto.hpp"
#include "ferry/json_canonicalization.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace ferry
{

    namespace
    {
        std::string link_hash(const std::string &previous, const Event &event)
        {
            auto canonical = json::RFC8785Canonicalizer::canonicalize(event.to_json());
            return crypto::SHA256::to_hex(crypto::SHA256::hash(previous + canonical));
        }
    } // namespace

    nlohmann::json Event::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"name", name},
                              {"chain_id", chain_id},
                              {"fields", fields}};
    }

    AuditChain::AuditChain() = default;

    std::string AuditChain::append(const Event &event)
    {
        auto hash = link_hash(head().value_or(""), event);
        hashes_.push_back(hash);
        return hash;
    }

    std::optional<std::string> AuditChain::head() const
    {
        if (hashes_.empty())
            return std::nullopt;
        return hashes_.back();
    }

    bool AuditChain::verify(const std::vector<Event> &events) const
    {
        if (events.size() != hashes_.size())
            return false;

        std::string previous;
        for (std::size_t i = 0; i < events.size(); ++i)
        {
            auto expected = link_hash(previous, events[i]);
            if (expected != hashes_[i])
                return false;
            previous = expected;
        }
        return true;
    }

    // ========== EventLog::Batch ==========

    EventLog::Batch::Batch(EventLog &log, ChainId chain_id, Timestamp ts)
        : log_(log), chain_id_(chain_id), ts_(format_timestamp(ts))
    {
    }

    EventLog::Batch::~Batch()
    {
        if (!committed_ && !pending_.empty())
        {
            spdlog::debug("discarding {} staged event(s) from a rejected call", pending_.size());
        }
    }

    void EventLog::Batch::emit(std::string name, nlohmann::json fields)
    {
        fields["timestamp"] = ts_;
        pending_.push_back(Event{ts_, std::move(name), chain_id_, std::move(fields)});
    }

    void EventLog::Batch::commit()
    {
        if (committed_)
            return;
        committed_ = true;
        log_.publish(std::move(pending_));
        pending_.clear();
    }

    // ========== EventLog ==========

    EventLog::EventLog(AuditConfig cfg) : cfg_(std::move(cfg))
    {
        if (cfg_.enabled && !cfg_.log_path.empty())
        {
            file_.open(cfg_.log_path, std::ios::app);
            if (!file_.is_open())
            {
                spdlog::warn("audit log {} could not be opened; events go to the logger only", cfg_.log_path);
            }
        }
    }

    EventLog::~EventLog() = default;

    EventLog::Batch EventLog::begin(ChainId chain_id, Timestamp ts)
    {
        return Batch(*this, chain_id, ts);
    }

    void EventLog::publish(std::vector<Event> events)
    {
        std::lock_guard lock(mutex_);
        for (auto &event : events)
        {
            auto hash = chain_.append(event);
            if (cfg_.enabled)
            {
                nlohmann::json j = event.to_json();
                j["chain_hash"] = hash;
                auto line = j.dump();
                spdlog::info(line);
                if (file_.is_open())
                {
                    file_ << line << '\n';
                    file_.flush();
                }
            }
            events_.push_back(std::move(event));
        }
    }

    std::vector<Event> EventLog::events() const
    {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::optional<Event> EventLog::last(std::string_view name) const
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(events_.rbegin(), events_.rend(),
                               [&](const Event &e) { return e.name == name; });
        if (it == events_.rend())
            return std::nullopt;
        return *it;
    }

    std::size_t EventLog::count(std::string_view name) const
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(),
                                                      [&](const Event &e) { return e.name == name; }));
    }

    std::optional<std::string> EventLog::head() const
    {
        std::lock_guard lock(mutex_);
        return chain_.head();
    }

    bool EventLog::verify_chain() const
    {
        std::lock_guard lock(mutex_);
        return chain_.verify(events_);
    }

} // namespace ferry
