// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe the registry,
// dispatch cadence, delivery workers, outputs, and affiliation seed consumed
// across the relay. `ConfigurationLoader` translates environment variables
// into these structures so downstream modules never touch `std::getenv`
// directly.

#pragma once

#include <cstdint>
#include <string>

#include "drone_relay/affiliation.hpp"
#include "drone_relay/delivery_worker.hpp"
#include "drone_relay/dispatch_scheduler.hpp"
#include "drone_relay/drone_registry.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

/**
 * @brief Immutable bundle of runtime knobs for the relay.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};              /**< Destination directory for structured logs. */
    std::string log_level{};                  /**< spdlog level name applied after start-up. */
    RegistryConfig registry{};                /**< Capacity and inactivity timeout. */
    DispatchConfig dispatch{};                /**< Rate limit (timeout mirrors the registry). */
    Duration poll_interval{Duration{1.0}};    /**< Control-loop wake-up cadence. */
    std::string id_prefix{};                  /**< Prefix carried by every canonical id. */
    std::string cot_destination{};            /**< `ipv4:port`; empty disables the transport. */
    std::uint8_t cot_ttl{1};                  /**< Multicast TTL for tactical events. */
    std::string state_output{};               /**< JSON-lines state path; empty disables the sink. */
    DeliveryWorkerConfig delivery{};          /**< Queue bound, call budget, flush deadline. */
    AffiliationTable::Snapshot affiliations{};/**< Seed entries for the affiliation table. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment, initialize logging, and return the result. */
    static Configuration load();

  private:
    static AffiliationTable::Snapshot load_affiliations();
};

}  // namespace drone_relay
