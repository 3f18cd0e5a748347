#ifndef RHA_KEYED_ACCUMULATOR_HPP
#define RHA_KEYED_ACCUMULATOR_HPP

/**
 * @file keyed_accumulator.hpp
 * @brief Map of per-key accumulators safe under concurrent writers.
 *
 * Each key is created at most once (create-if-absent under the map lock),
 * then mutated under its own lock. Writers touching different keys never
 * contend beyond the brief map lookup.
 *
 * @code
 *     KeyedAccumulator<std::string, FileStatistics> files;
 *     files.update("src/a.cpp", [](FileStatistics& s) { ++s.revision_count; });
 *     auto frozen = files.snapshot();
 * @endcode
 */

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace rha::utils {

    template<typename Key, typename Value>
    class KeyedAccumulator {
    public:
        KeyedAccumulator() = default;
        KeyedAccumulator(const KeyedAccumulator&) = delete;
        KeyedAccumulator& operator=(const KeyedAccumulator&) = delete;

        /**
         * Runs f(value&) under the key's lock, default-constructing the
         * value on first sight.
         */
        template<typename F>
        void update(const Key& key, F&& f) {
            Slot& slot = slot_for(key);
            std::lock_guard lock(slot.mutex);
            f(slot.value);
        }

        [[nodiscard]] bool contains(const Key& key) const {
            std::shared_lock lock(map_mutex_);
            return slots_.contains(key);
        }

        [[nodiscard]] std::size_t size() const {
            std::shared_lock lock(map_mutex_);
            return slots_.size();
        }

        /**
         * Copies every value into an ordered map.
         */
        [[nodiscard]] std::map<Key, Value> snapshot() const {
            std::shared_lock lock(map_mutex_);
            std::map<Key, Value> result;
            for (const auto& [key, slot] : slots_) {
                std::lock_guard slot_lock(slot->mutex);
                result.emplace(key, slot->value);
            }
            return result;
        }

    private:
        struct Slot {
            std::mutex mutex;
            Value value{};
        };

        Slot& slot_for(const Key& key) {
            {
                std::shared_lock lock(map_mutex_);
                if (auto it = slots_.find(key); it != slots_.end()) {
                    return *it->second;
                }
            }
            std::unique_lock lock(map_mutex_);
            auto [it, inserted] = slots_.try_emplace(key);
            if (inserted) {
                it->second = std::make_unique<Slot>();
            }
            return *it->second;
        }

        mutable std::shared_mutex map_mutex_;
        std::map<Key, std::unique_ptr<Slot>> slots_;
    };

}  // namespace rha::utils

#endif // RHA_KEYED_ACCUMULATOR_HPP
