#pragma once

#include <optional>
#include <string>

#include "drone_relay/affiliation.hpp"
#include "drone_relay/observation.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

/** @brief Latitude/longitude pair remembered for bearing derivation. */
struct PlanarFix final {
    double lat{};
    double lon{};
};

/**
 * @brief Live state of one emitting drone, owned by DroneRegistry.
 *
 * Holds the merged broadcast fields plus the bookkeeping the dispatch loop
 * needs: previous fix, last update, and last send.
 */
struct DroneRecord final {
    std::string id{};
    std::string id_type{};
    std::string caa{};

    double lat{};
    double lon{};
    double alt{};
    double height{};
    double speed{};
    double vspeed{};
    std::optional<double> direction{};
    std::optional<double> speed_multiplier{};
    std::optional<double> pressure_altitude{};

    double pilot_lat{};
    double pilot_lon{};
    double home_lat{};
    double home_lon{};

    std::string mac{};
    int rssi{};
    std::optional<double> freq{};

    std::optional<int> ua_type{};
    std::string ua_type_name{};
    std::string operator_id_type{};
    std::string operator_id{};
    std::string description{};

    std::string op_status{};
    std::string height_type{};
    std::string ew_dir{};
    std::string vertical_accuracy{};
    std::string horizontal_accuracy{};
    std::string baro_accuracy{};
    std::string speed_accuracy{};
    std::string timestamp{};
    std::string timestamp_accuracy{};

    int index{};
    int runtime{};

    Affiliation affiliation{Affiliation::Unknown};

    std::optional<PlanarFix> previous_fix{};       /**< Position before the latest update. */
    TimePoint last_update_time{};                  /**< Steady-clock time of the latest merge. */
    std::optional<TimePoint> last_sent_time{};     /**< Unset until the first dispatch attempt. */
    double last_sent_lat{};
    double last_sent_lon{};

    /** @brief Build a fresh record keyed by @p record_id from its first observation. */
    [[nodiscard]] static DroneRecord from_observation(std::string record_id, const Observation& observation, TimePoint now);

    /**
     * @brief Merge a later observation into this record.
     *
     * Kinematics and radio fields are overwritten unconditionally; optional
     * metadata only when the observation carries a value. When the
     * observation has no course, the great-circle bearing from the previous
     * fix is derived instead.
     */
    void merge(const Observation& observation, TimePoint now);

    /** @brief Record a dispatch attempt at @p now. */
    void mark_sent(TimePoint now) noexcept;

    [[nodiscard]] bool has_pilot_location() const noexcept;
    [[nodiscard]] bool has_home_location() const noexcept;
};

}  // namespace drone_relay
