#include "drone_relay/telemetry_pipeline.hpp"

#include <optional>
#include <utility>

namespace drone_relay {

TelemetryPipeline::TelemetryPipeline(DroneRegistry& registry,
                                     std::shared_ptr<const AffiliationResolver> resolver,
                                     std::string id_prefix)
    : registry_(registry),
      resolver_(std::move(resolver)),
      str_id_prefix_(std::move(id_prefix)),
      logger_(get_logger()),
      normalizer_(logger_) {}

IngestOutcome TelemetryPipeline::ingest(const nlohmann::json& message, TimePoint now) {
    std::optional<Observation> observation = normalizer_.normalize(message);
    if (!observation.has_value()) {
        return IngestOutcome::Rejected;
    }
    return apply(std::move(*observation), now);
}

IngestOutcome TelemetryPipeline::ingest_text(std::string_view raw_message, TimePoint now) {
    std::optional<Observation> observation = normalizer_.normalize_text(raw_message);
    if (!observation.has_value()) {
        return IngestOutcome::Rejected;
    }
    return apply(std::move(*observation), now);
}

IngestOutcome TelemetryPipeline::apply(Observation observation, TimePoint now) {
    if (observation.id.has_value()) {
        std::string& id = *observation.id;
        if (!id.starts_with(str_id_prefix_)) {
            id = str_id_prefix_ + id;
        }
        if (resolver_ != nullptr) {
            observation.affiliation = resolver_->lookup(id);
        }
        switch (registry_.upsert(observation, now)) {
            case UpsertOutcome::Created:
                return IngestOutcome::Created;
            case UpsertOutcome::Updated:
                return IngestOutcome::Updated;
            case UpsertOutcome::Dropped:
                break;
        }
        return IngestOutcome::Dropped;
    }

    if (observation.mac.empty()) {
        logger_->warn("CAA-only message received without a MAC; skipping");
        return IngestOutcome::Dropped;
    }
    if (registry_.correlate_by_mac(observation, now).has_value()) {
        return IngestOutcome::Correlated;
    }
    return IngestOutcome::Dropped;
}

}  // namespace drone_relay
