// === Telemetry Normalizer ====================================================
//
// Reconciles the two Remote ID wire shapes emitted by the radio front-ends
// into one canonical Observation:
//
// - list shape: an ordered array of single-purpose parts (`Basic ID`,
//   `Location/Vector Message`, ...) with optional top-level `MAC`/`RSSI`;
// - map shape: one object holding the same tagged sub-maps plus BLE link
//   fields (`AUX_ADV_IND.rssi`, `aext.AdvA`) and `index`/`runtime`.
//
// Parts are applied in order so later parts win. Numeric fields are coerced
// leniently (numbers, numeric strings, strings with a trailing unit) and fall
// back to defaults, so one bad field never discards the rest of a message.
// Nothing here throws.

#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "drone_relay/logging.hpp"
#include "drone_relay/observation.hpp"

namespace drone_relay {

/** @brief Converts raw front-end messages into partial observations. */
class TelemetryNormalizer final {
  public:
    explicit TelemetryNormalizer(std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Normalize a decoded message.
     *
     * @return The observation, or nullopt when the top-level shape is neither
     *         a list of parts nor a map, or a list carried nothing usable.
     */
    [[nodiscard]] std::optional<Observation> normalize(const nlohmann::json& message) const;

    /** @brief Decode JSON text and normalize it; malformed text yields nullopt. */
    [[nodiscard]] std::optional<Observation> normalize_text(std::string_view raw_message) const;

  private:
    [[nodiscard]] std::optional<Observation> normalize_parts(const nlohmann::json& parts) const;
    [[nodiscard]] Observation normalize_map(const nlohmann::json& message) const;

    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Lenient numeric coercion used for every numeric wire field.
 *
 * Accepts JSON numbers and strings whose leading whitespace-delimited token
 * parses as a number ("0.25 m/s" -> 0.25). Anything else yields @p fallback.
 */
[[nodiscard]] double coerce_double(const nlohmann::json& value, double fallback) noexcept;

/** @brief Optional variant of coerce_double; absent or unparseable yields nullopt. */
[[nodiscard]] std::optional<double> coerce_optional_double(const nlohmann::json& value) noexcept;

}  // namespace drone_relay
