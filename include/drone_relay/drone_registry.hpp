// === Drone Registry ==========================================================
//
// Bounded, keyed store of DroneRecord instances. Records live in a fixed ring
// of slots sized to the configured capacity; an id -> slot map gives O(1)
// lookup and the ring head always points at the oldest insertion, so capacity
// eviction is FIFO by insertion regardless of update recency. Inactivity is
// handled separately: `sweep` only reports expired ids and leaves removal to
// the caller so a dispatch pass never sees the store mutate underneath it.
//
// Single-writer: every mutating call must come from the control thread.

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "drone_relay/drone_record.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/observation.hpp"

namespace drone_relay {

/** @brief Sizing and timing knobs for the registry. */
struct RegistryConfig final {
    std::size_t capacity{30};                 /**< Maximum number of live records. */
    Duration inactivity_timeout{Duration{60.0}}; /**< Age after which a record is swept. */
};

/** @brief Result of applying one observation to the registry. */
enum class UpsertOutcome {
    Created,  /**< A new record was inserted. */
    Updated,  /**< An existing record was merged. */
    Dropped   /**< The observation could not be keyed and was discarded. */
};

/** @brief Bounded store of live drone records with FIFO capacity eviction. */
class DroneRegistry final {
  public:
    /** @brief Invoked with the id of a record just before it is destroyed. */
    using EvictionListener = std::function<void(const std::string&)>;

    explicit DroneRegistry(RegistryConfig config);

    /** @brief Register the callback fired on capacity eviction and removal. */
    void set_eviction_listener(EvictionListener listener);

    /**
     * @brief Create or merge the record keyed by the observation's id.
     *
     * Capacity eviction only runs when a brand-new key is inserted.
     */
    UpsertOutcome upsert(const Observation& observation, TimePoint now);

    /**
     * @brief Merge an id-less observation into the first record sharing its MAC.
     *
     * @return Id of the updated record, or nullopt when nothing matched.
     */
    std::optional<std::string> correlate_by_mac(const Observation& observation, TimePoint now);

    /**
     * @brief Mark every record older than the inactivity timeout.
     *
     * @return Ids of newly marked records in insertion order; call remove()
     *         for each once the current dispatch pass has finished.
     */
    std::vector<std::string> sweep(TimePoint now);

    /** @brief Destroy the record for @p id, notifying the eviction listener first. */
    bool remove(const std::string& id);

    [[nodiscard]] DroneRecord* find(const std::string& id);
    [[nodiscard]] const DroneRecord* find(const std::string& id) const;

    /** @brief Ids of live records in insertion order. */
    [[nodiscard]] std::vector<std::string> active_ids() const;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] const RegistryConfig& config() const noexcept;

  private:
    struct Slot final {
        std::optional<DroneRecord> record{};
        bool pending_removal{false};
    };

    [[nodiscard]] std::size_t ring_position(std::size_t offset) const noexcept;
    void insert_new(DroneRecord record);
    void evict_oldest();
    void release_slot(std::size_t slot_index);
    void trim_vacant_head() noexcept;
    void compact();

    RegistryConfig config_;
    std::vector<Slot> list_slots_;
    std::unordered_map<std::string, std::size_t> map_slot_index_;
    std::size_t head_{0};  /**< Slot holding the oldest insertion. */
    std::size_t span_{0};  /**< Slots in use from head_, vacated ones included. */
    EvictionListener eviction_listener_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
