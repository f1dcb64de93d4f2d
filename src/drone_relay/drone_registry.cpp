#include "drone_relay/drone_registry.hpp"

#include <stdexcept>
#include <utility>

namespace drone_relay {

DroneRegistry::DroneRegistry(RegistryConfig config)
    : config_(config),
      logger_(get_logger()) {
    if (config_.capacity == 0) {
        throw std::invalid_argument("DroneRegistry capacity must be positive");
    }
    if (config_.inactivity_timeout.count() <= 0.0) {
        throw std::invalid_argument("DroneRegistry inactivity timeout must be positive");
    }
    list_slots_.resize(config_.capacity);
    map_slot_index_.reserve(config_.capacity);
}

void DroneRegistry::set_eviction_listener(EvictionListener listener) {
    eviction_listener_ = std::move(listener);
}

UpsertOutcome DroneRegistry::upsert(const Observation& observation, TimePoint now) {
    if (!observation.id.has_value() || observation.id->empty()) {
        logger_->debug("Observation without id offered to upsert; dropping");
        return UpsertOutcome::Dropped;
    }
    const std::string& id = *observation.id;

    const auto iterator_slot = map_slot_index_.find(id);
    if (iterator_slot != map_slot_index_.end()) {
        Slot& slot = list_slots_[iterator_slot->second];
        slot.record->merge(observation, now);
        logger_->debug("Updated drone {}", id);
        return UpsertOutcome::Updated;
    }

    insert_new(DroneRecord::from_observation(id, observation, now));
    logger_->debug("Added new drone {}", id);
    return UpsertOutcome::Created;
}

std::optional<std::string> DroneRegistry::correlate_by_mac(const Observation& observation, TimePoint now) {
    if (observation.mac.empty()) {
        return std::nullopt;
    }
    for (std::size_t offset = 0; offset < span_; ++offset) {
        Slot& slot = list_slots_[ring_position(offset)];
        if (!slot.record.has_value() || slot.record->mac != observation.mac) {
            continue;
        }
        slot.record->merge(observation, now);
        logger_->debug("Updated drone {} with CAA info for MAC {}", slot.record->id, observation.mac);
        return slot.record->id;
    }
    logger_->debug("CAA-only message for MAC {} has no matching drone record; skipping", observation.mac);
    return std::nullopt;
}

std::vector<std::string> DroneRegistry::sweep(TimePoint now) {
    std::vector<std::string> list_expired;
    for (std::size_t offset = 0; offset < span_; ++offset) {
        Slot& slot = list_slots_[ring_position(offset)];
        if (!slot.record.has_value() || slot.pending_removal) {
            continue;
        }
        const Duration age = elapsed_between(slot.record->last_update_time, now);
        if (age > config_.inactivity_timeout) {
            slot.pending_removal = true;
            list_expired.push_back(slot.record->id);
            logger_->debug("Drone {} inactive for {:.2f}s; marked for removal", slot.record->id, age.count());
        }
    }
    return list_expired;
}

bool DroneRegistry::remove(const std::string& id) {
    const auto iterator_slot = map_slot_index_.find(id);
    if (iterator_slot == map_slot_index_.end()) {
        return false;
    }
    release_slot(iterator_slot->second);
    trim_vacant_head();
    return true;
}

DroneRecord* DroneRegistry::find(const std::string& id) {
    const auto iterator_slot = map_slot_index_.find(id);
    if (iterator_slot == map_slot_index_.end()) {
        return nullptr;
    }
    return &*list_slots_[iterator_slot->second].record;
}

const DroneRecord* DroneRegistry::find(const std::string& id) const {
    const auto iterator_slot = map_slot_index_.find(id);
    if (iterator_slot == map_slot_index_.end()) {
        return nullptr;
    }
    return &*list_slots_[iterator_slot->second].record;
}

std::vector<std::string> DroneRegistry::active_ids() const {
    std::vector<std::string> list_ids;
    list_ids.reserve(map_slot_index_.size());
    for (std::size_t offset = 0; offset < span_; ++offset) {
        const Slot& slot = list_slots_[ring_position(offset)];
        if (slot.record.has_value()) {
            list_ids.push_back(slot.record->id);
        }
    }
    return list_ids;
}

std::size_t DroneRegistry::size() const noexcept {
    return map_slot_index_.size();
}

std::size_t DroneRegistry::capacity() const noexcept {
    return config_.capacity;
}

const RegistryConfig& DroneRegistry::config() const noexcept {
    return config_;
}

std::size_t DroneRegistry::ring_position(std::size_t offset) const noexcept {
    return (head_ + offset) % list_slots_.size();
}

void DroneRegistry::insert_new(DroneRecord record) {
    if (map_slot_index_.size() >= config_.capacity) {
        evict_oldest();
    }
    if (span_ == list_slots_.size()) {
        // Holes left by inactivity removals fill the ring; close them up.
        compact();
    }
    const std::size_t slot_index = ring_position(span_);
    map_slot_index_.emplace(record.id, slot_index);
    list_slots_[slot_index].record = std::move(record);
    list_slots_[slot_index].pending_removal = false;
    ++span_;
}

void DroneRegistry::evict_oldest() {
    trim_vacant_head();
    if (span_ == 0) {
        return;
    }
    logger_->debug("Registry at capacity {}; evicting oldest drone {}", config_.capacity, list_slots_[head_].record->id);
    release_slot(head_);
    trim_vacant_head();
}

void DroneRegistry::release_slot(std::size_t slot_index) {
    Slot& slot = list_slots_[slot_index];
    if (!slot.record.has_value()) {
        return;
    }
    const std::string id = slot.record->id;
    if (eviction_listener_) {
        eviction_listener_(id);
    }
    map_slot_index_.erase(id);
    slot.record.reset();
    slot.pending_removal = false;
    logger_->debug("Removed drone {}", id);
}

void DroneRegistry::trim_vacant_head() noexcept {
    while (span_ > 0 && !list_slots_[head_].record.has_value()) {
        head_ = (head_ + 1) % list_slots_.size();
        --span_;
    }
}

void DroneRegistry::compact() {
    std::vector<Slot> list_compacted(list_slots_.size());
    std::size_t live_count = 0;
    for (std::size_t offset = 0; offset < span_; ++offset) {
        Slot& slot = list_slots_[ring_position(offset)];
        if (!slot.record.has_value()) {
            continue;
        }
        map_slot_index_[slot.record->id] = live_count;
        list_compacted[live_count] = std::move(slot);
        ++live_count;
    }
    list_slots_ = std::move(list_compacted);
    head_ = 0;
    span_ = live_count;
}

}  // namespace drone_relay
