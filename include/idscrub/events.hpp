#pragma once

/**
 * @file events.hpp
 * @brief Progress channel between the scrub pipeline and its front ends
 *
 * The scrubber publishes what it does here; the CLI and embedding code
 * subscribe through Scrubber::on() and decide how to present it.
 */

#include "idscrub/idscrub.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace idscrub {

/// Event payload: a map of strings, a ProfilePaths, a FileOutcome, a LockState,
/// a RunReport or a std::string depending on the event
using EventData = std::any;

/**
 * @brief Run-wide event channel
 *
 * Event names and their payloads:
 * - "run:start" - Run started (map: mode)
 * - "profile:found" - A host installation was located (ProfilePaths)
 * - "identity:rewritten" - Identity file rewritten (map: path, count)
 * - "machineid:rewritten" - machineid file rewritten (map: path)
 * - "store:locked" - Store held by the host, retrying (map: path, attempt, delay_ms)
 * - "store:purged" - Telemetry rows removed (map: path, removed, total)
 * - "store:compacted" - Store vacuumed after a large purge (map: path)
 * - "guard:protected" - File protected (LockState)
 * - "guard:released" - Protection reverted (LockState)
 * - "file:skipped" - A target was skipped (FileOutcome)
 * - "file:failed" - A target failed (FileOutcome)
 * - "run:cancelled" - cancel() took effect
 * - "run:complete" - Run finished (RunReport)
 * - "log:debug" - Diagnostic message (std::string), only with Config::debug
 *
 * Handlers run on the publishing thread, which is a worker thread when
 * profiles run in parallel. A handler that throws does not interrupt the
 * file being processed; the bus counts it in handler_failures() instead.
 *
 * Subscriptions share ownership of the handler table, so a Subscription
 * may be cancelled after the bus itself is gone.
 */
class EventBus {
  public:
    EventBus() : table_(std::make_shared<Table>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Register a handler for one event name
    Subscription on(const std::string& event, EventHandler handler) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(table_->mutex);
            id = table_->next_id++;
            table_->slots[event].push_back({id, std::move(handler)});
        }

        std::weak_ptr<Table> weak = table_;
        return Subscription([weak, event, id]() {
            if (auto table = weak.lock()) {
                table->remove(event, id);
            }
        });
    }

    /// Deliver a payload to every handler registered for the event
    void emit(const std::string& event, const EventData& data = {}) const {
        std::vector<EventHandler> targets;
        {
            std::lock_guard<std::mutex> lock(table_->mutex);
            auto it = table_->slots.find(event);
            if (it == table_->slots.end()) {
                return;
            }
            for (const auto& slot : it->second) {
                targets.push_back(slot.handler);
            }
        }

        // Handlers may subscribe or cancel, so they run without the lock
        for (const auto& handler : targets) {
            try {
                handler(data);
            } catch (const std::exception&) {
                handler_failures_.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

    /// Number of handler invocations that ended in an exception
    [[nodiscard]] uint64_t handler_failures() const noexcept {
        return handler_failures_.load(std::memory_order_relaxed);
    }

  private:
    struct Slot {
        uint64_t id;
        EventHandler handler;
    };

    struct Table {
        std::mutex mutex;
        uint64_t next_id = 0;
        std::map<std::string, std::vector<Slot>> slots;

        void remove(const std::string& event, uint64_t id) {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = slots.find(event);
            if (it == slots.end()) {
                return;
            }
            auto& list = it->second;
            for (auto slot = list.begin(); slot != list.end(); ++slot) {
                if (slot->id == id) {
                    list.erase(slot);
                    break;
                }
            }
            if (list.empty()) {
                slots.erase(it);
            }
        }
    };

    std::shared_ptr<Table> table_;
    mutable std::atomic<uint64_t> handler_failures_{0};
};

namespace events {
constexpr const char* RUN_START = "run:start";
constexpr const char* PROFILE_FOUND = "profile:found";
constexpr const char* IDENTITY_REWRITTEN = "identity:rewritten";
constexpr const char* MACHINE_ID_REWRITTEN = "machineid:rewritten";
constexpr const char* STORE_LOCKED = "store:locked";
constexpr const char* STORE_PURGED = "store:purged";
constexpr const char* STORE_COMPACTED = "store:compacted";
constexpr const char* GUARD_PROTECTED = "guard:protected";
constexpr const char* GUARD_RELEASED = "guard:released";
constexpr const char* FILE_SKIPPED = "file:skipped";
constexpr const char* FILE_FAILED = "file:failed";
constexpr const char* RUN_CANCELLED = "run:cancelled";
constexpr const char* RUN_COMPLETE = "run:complete";
constexpr const char* LOG_DEBUG = "log:debug";
}  // namespace events

}  // namespace idscrub
