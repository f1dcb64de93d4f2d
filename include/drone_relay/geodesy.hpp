// === Geodesy =================================================================
//
// Spherical-earth helpers used to derive course and movement between fixes.

#pragma once

namespace drone_relay {

/**
 * @brief Initial great-circle bearing from (lat1, lon1) toward (lat2, lon2).
 *
 * @return Bearing in degrees normalized into [0, 360).
 */
[[nodiscard]] double initial_bearing_deg(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg);

/** @brief Great-circle distance in metres between two latitude/longitude pairs. */
[[nodiscard]] double haversine_distance_m(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg);

}  // namespace drone_relay
