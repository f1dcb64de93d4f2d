#pragma once

#include <optional>
#include <string>

#include "drone_relay/affiliation.hpp"

namespace drone_relay {

/**
 * @brief Canonical, partial view of one Remote ID broadcast.
 *
 * Kinematic fields default to 0.0 when the broadcast did not carry them and are
 * always copied onto the record. Text metadata is empty and optional numbers
 * are nullopt when absent; those only replace stored values when present.
 */
struct Observation final {
    std::optional<std::string> id{};    /**< Canonical serial-number identifier. */
    std::string id_type{};              /**< Raw `Basic ID.id_type` label. */
    std::string caa{};                  /**< CAA registration carried by CAA-only broadcasts. */

    double lat{};                       /**< Latitude in degrees. */
    double lon{};                       /**< Longitude in degrees. */
    double alt{};                       /**< Geodetic altitude in metres. */
    double height{};                    /**< Height above ground in metres. */
    double speed{};                     /**< Ground speed in m/s. */
    double vspeed{};                    /**< Vertical speed in m/s. */
    std::optional<double> direction{};  /**< Broadcast course in degrees. */
    std::optional<double> speed_multiplier{};
    std::optional<double> pressure_altitude{};

    double pilot_lat{};                 /**< Operator latitude; (0,0) means unknown. */
    double pilot_lon{};
    double home_lat{};                  /**< Take-off latitude; (0,0) means unknown. */
    double home_lon{};

    std::string mac{};                  /**< Radio MAC address of the emitter. */
    int rssi{};                         /**< Received signal strength in dBm. */
    std::optional<double> freq{};       /**< Carrier frequency as reported by the front-end. */

    std::optional<int> ua_type{};       /**< UA type code; nullopt is the unknown sentinel. */
    std::string ua_type_name{};
    std::string operator_id_type{};
    std::string operator_id{};
    std::string description{};          /**< Self-ID free text. */

    std::string op_status{};
    std::string height_type{};
    std::string ew_dir{};
    std::string vertical_accuracy{};
    std::string horizontal_accuracy{};
    std::string baro_accuracy{};
    std::string speed_accuracy{};
    std::string timestamp{};
    std::string timestamp_accuracy{};

    int index{};                        /**< Front-end message counter. */
    int runtime{};                      /**< Front-end uptime in seconds. */

    std::optional<Affiliation> affiliation{}; /**< Classification resolved at ingest. */
};

}  // namespace drone_relay
