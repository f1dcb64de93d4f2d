#include "drone_relay/drone_record.hpp"

#include <utility>

#include "drone_relay/geodesy.hpp"
#include "drone_relay/remote_id.hpp"

namespace drone_relay {

namespace {

void assign_if_present(std::string& target, const std::string& incoming) {
    if (!incoming.empty()) {
        target = incoming;
    }
}

template <typename T>
void assign_if_present(std::optional<T>& target, const std::optional<T>& incoming) {
    if (incoming.has_value()) {
        target = incoming;
    }
}

}  // namespace

DroneRecord DroneRecord::from_observation(std::string record_id, const Observation& observation, TimePoint now) {
    DroneRecord record{};
    record.id = std::move(record_id);
    record.id_type = observation.id_type;
    record.caa = observation.caa;
    record.lat = observation.lat;
    record.lon = observation.lon;
    record.alt = observation.alt;
    record.height = observation.height;
    record.speed = observation.speed;
    record.vspeed = observation.vspeed;
    record.direction = observation.direction;
    record.speed_multiplier = observation.speed_multiplier;
    record.pressure_altitude = observation.pressure_altitude;
    record.pilot_lat = observation.pilot_lat;
    record.pilot_lon = observation.pilot_lon;
    record.home_lat = observation.home_lat;
    record.home_lon = observation.home_lon;
    record.mac = observation.mac;
    record.rssi = observation.rssi;
    record.freq = observation.freq;
    record.ua_type = observation.ua_type;
    record.ua_type_name = observation.ua_type_name.empty() ? std::string{k_unknown_ua_type_name} : observation.ua_type_name;
    record.operator_id_type = observation.operator_id_type;
    record.operator_id = observation.operator_id;
    record.description = observation.description;
    record.op_status = observation.op_status;
    record.height_type = observation.height_type;
    record.ew_dir = observation.ew_dir;
    record.vertical_accuracy = observation.vertical_accuracy;
    record.horizontal_accuracy = observation.horizontal_accuracy;
    record.baro_accuracy = observation.baro_accuracy;
    record.speed_accuracy = observation.speed_accuracy;
    record.timestamp = observation.timestamp;
    record.timestamp_accuracy = observation.timestamp_accuracy;
    record.index = observation.index;
    record.runtime = observation.runtime;
    record.affiliation = observation.affiliation.value_or(Affiliation::Unknown);
    record.last_update_time = now;
    record.last_sent_lat = observation.lat;
    record.last_sent_lon = observation.lon;
    return record;
}

void DroneRecord::merge(const Observation& observation, TimePoint now) {
    previous_fix = PlanarFix{lat, lon};

    lat = observation.lat;
    lon = observation.lon;
    alt = observation.alt;
    height = observation.height;
    speed = observation.speed;
    vspeed = observation.vspeed;
    pilot_lat = observation.pilot_lat;
    pilot_lon = observation.pilot_lon;
    home_lat = observation.home_lat;
    home_lon = observation.home_lon;
    description = observation.description;
    mac = observation.mac;
    rssi = observation.rssi;
    index = observation.index;
    runtime = observation.runtime;
    id_type = observation.id_type;

    if (observation.ua_type.has_value()) {
        ua_type = observation.ua_type;
        ua_type_name = observation.ua_type_name;
    }
    assign_if_present(operator_id_type, observation.operator_id_type);
    assign_if_present(operator_id, observation.operator_id);
    assign_if_present(op_status, observation.op_status);
    assign_if_present(height_type, observation.height_type);
    assign_if_present(ew_dir, observation.ew_dir);
    assign_if_present(speed_multiplier, observation.speed_multiplier);
    assign_if_present(pressure_altitude, observation.pressure_altitude);
    assign_if_present(vertical_accuracy, observation.vertical_accuracy);
    assign_if_present(horizontal_accuracy, observation.horizontal_accuracy);
    assign_if_present(baro_accuracy, observation.baro_accuracy);
    assign_if_present(speed_accuracy, observation.speed_accuracy);
    assign_if_present(timestamp, observation.timestamp);
    assign_if_present(timestamp_accuracy, observation.timestamp_accuracy);
    assign_if_present(caa, observation.caa);
    assign_if_present(freq, observation.freq);
    if (observation.affiliation.has_value()) {
        affiliation = *observation.affiliation;
    }

    if (observation.direction.has_value()) {
        direction = observation.direction;
    } else {
        direction = initial_bearing_deg(previous_fix->lat, previous_fix->lon, lat, lon);
    }

    last_update_time = now;
}

void DroneRecord::mark_sent(TimePoint now) noexcept {
    last_sent_time = now;
    last_sent_lat = lat;
    last_sent_lon = lon;
}

bool DroneRecord::has_pilot_location() const noexcept {
    return pilot_lat != 0.0 || pilot_lon != 0.0;
}

bool DroneRecord::has_home_location() const noexcept {
    return home_lat != 0.0 || home_lon != 0.0;
}

}  // namespace drone_relay
