// === Telemetry Pipeline ======================================================
//
// Control-thread glue between the subscriber and the registry: normalize,
// canonicalize the id, resolve affiliation, then upsert serial-identified
// observations or correlate CAA-only ones by MAC.

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "drone_relay/affiliation.hpp"
#include "drone_relay/drone_registry.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/telemetry_normalizer.hpp"

namespace drone_relay {

/** @brief What happened to one inbound message. */
enum class IngestOutcome {
    Created,     /**< New record inserted. */
    Updated,     /**< Existing record merged by id. */
    Correlated,  /**< CAA-only observation merged by MAC. */
    Dropped,     /**< Usable observation with no id and no MAC match. */
    Rejected     /**< Message could not be normalized. */
};

/** @brief Applies inbound messages to the registry. */
class TelemetryPipeline final {
  public:
    /**
     * @param registry Store that receives the observations.
     * @param resolver Optional affiliation lookup; null leaves records unknown.
     * @param id_prefix Prefix every canonical id carries (not doubled).
     */
    TelemetryPipeline(DroneRegistry& registry, std::shared_ptr<const AffiliationResolver> resolver, std::string id_prefix);

    /** @brief Apply a decoded message. */
    IngestOutcome ingest(const nlohmann::json& message, TimePoint now);
    /** @brief Decode and apply one JSON text message. */
    IngestOutcome ingest_text(std::string_view raw_message, TimePoint now);

  private:
    IngestOutcome apply(Observation observation, TimePoint now);

    DroneRegistry& registry_;
    std::shared_ptr<const AffiliationResolver> resolver_;
    std::string str_id_prefix_;
    std::shared_ptr<spdlog::logger> logger_;
    TelemetryNormalizer normalizer_;
};

}  // namespace drone_relay
