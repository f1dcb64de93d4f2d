// === CoT Encoder =============================================================
//
// Renders DroneRecord snapshots as Cursor-on-Target events for tactical
// situational-awareness clients. Three variants share one envelope:
//
// - main:  the airborne track, typed from the UA category, with a track block
//          and a human-readable summary in <remarks>;
// - pilot: the operator position (`pilot-<base>`), person icon;
// - home:  the take-off position (`home-<base>`), house icon.
//
// `<base>` is the record id with any leading "drone-" removed. Every event is
// colored from the record's affiliation and carries a stale instant of
// `now + stale_offset` (10 minutes when no offset is supplied).
//
// The sensor host reports itself as a fourth, friendly ground-sensor event
// (`wardragon-<serial>`) whose remarks list its health readings.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "drone_relay/drone_record.hpp"
#include "drone_relay/system_status.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

inline constexpr double k_cot_circular_error_m{35.0};
inline constexpr double k_cot_linear_error_m{999999.0};
inline constexpr Duration k_cot_default_stale_offset{Duration{600.0}};

/** @brief Builds tactical event documents from record snapshots. */
class CotEncoder final {
  public:
    /** @brief Event for the drone itself. */
    [[nodiscard]] CotPayload encode_main(const DroneRecord& record,
                                         std::optional<Duration> stale_offset,
                                         SystemTimePoint now) const;
    /** @brief Event for the operator position. */
    [[nodiscard]] CotPayload encode_pilot(const DroneRecord& record,
                                          std::optional<Duration> stale_offset,
                                          SystemTimePoint now) const;
    /** @brief Event for the take-off position. */
    [[nodiscard]] CotPayload encode_home(const DroneRecord& record,
                                         std::optional<Duration> stale_offset,
                                         SystemTimePoint now) const;
    /** @brief Event for the sensor host's own position and health. */
    [[nodiscard]] CotPayload encode_system_status(const SystemStatus& status,
                                                  std::optional<Duration> stale_offset,
                                                  SystemTimePoint now) const;
};

/** @brief ISO-8601 UTC rendering with microsecond precision and trailing Z. */
[[nodiscard]] std::string format_cot_time(SystemTimePoint instant);

/** @brief Record id with a leading "drone-" removed. */
[[nodiscard]] std::string_view base_entity_id(std::string_view record_id) noexcept;

/** @brief Summary line placed in the main event's remarks. */
[[nodiscard]] std::string build_drone_summary(const DroneRecord& record);

/** @brief Health readings placed in the system status event's remarks. */
[[nodiscard]] std::string build_status_summary(const SystemStatus& status);

}  // namespace drone_relay
