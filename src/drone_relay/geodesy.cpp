#include "drone_relay/geodesy.hpp"

#include <cmath>
#include <numbers>

namespace drone_relay {

namespace {

constexpr double k_earth_radius_m{6'371'000.0}; /**< Mean Earth radius used for geodesic calculations. */

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

}  // namespace

double initial_bearing_deg(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) {
    const double lat1 = degrees_to_radians(lat1_deg);
    const double lat2 = degrees_to_radians(lat2_deg);
    const double delta_lon = degrees_to_radians(lon2_deg - lon1_deg);

    const double y = std::sin(delta_lon) * std::cos(lat2);
    const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(delta_lon);
    const double bearing = std::fmod(radians_to_degrees(std::atan2(y, x)) + 360.0, 360.0);
    // fmod of a value just below 360 can round up to exactly 360.
    return bearing >= 360.0 ? 0.0 : bearing;
}

double haversine_distance_m(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) {
    const double lat1 = degrees_to_radians(lat1_deg);
    const double lat2 = degrees_to_radians(lat2_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(lon2_deg - lon1_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

}  // namespace drone_relay
