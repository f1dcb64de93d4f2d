#include "drone_relay/cot_encoder.hpp"

#include <cmath>
#include <ctime>
#include <sstream>
#include <stdexcept>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <pugixml.hpp>

#include "drone_relay/affiliation.hpp"
#include "drone_relay/remote_id.hpp"

namespace drone_relay {

namespace {

constexpr char k_cot_version[] = "2.0";
constexpr char k_cot_how[] = "m-g";
constexpr char k_marker_type[] = "b-m-p-s-m";
constexpr char k_pilot_icon[] = "com.atakmap.android.maps.public/Civilian/Person.png";
constexpr char k_home_icon[] = "com.atakmap.android.maps.public/Civilian/House.png";
constexpr char k_sensor_type[] = "a-f-G-E-S";
constexpr char k_sensor_uid_prefix[] = "wardragon-";
constexpr std::string_view k_drone_prefix{"drone-"};

/** @brief Geometry and labelling inputs for one event. */
struct EventGeometry final {
    std::string uid{};
    std::string_view type{};
    double lat{};
    double lon{};
    double hae{};
};

std::string format_number(double value) {
    return fmt::format("{}", value);
}

void require_encodable(const EventGeometry& geometry) {
    if (geometry.uid.empty()) {
        throw std::invalid_argument("CoT event requires a non-empty uid");
    }
    if (!std::isfinite(geometry.lat) || !std::isfinite(geometry.lon) || !std::isfinite(geometry.hae)) {
        throw std::invalid_argument(fmt::format("CoT event {} has a non-finite coordinate", geometry.uid));
    }
}

/**
 * @brief Create the <event>/<point>/<detail> envelope and return <detail>.
 */
pugi::xml_node build_envelope(pugi::xml_document& document,
                              const EventGeometry& geometry,
                              std::optional<Duration> stale_offset,
                              SystemTimePoint now) {
    require_encodable(geometry);

    pugi::xml_node declaration = document.prepend_child(pugi::node_declaration);
    declaration.append_attribute("version") = "1.0";
    declaration.append_attribute("encoding") = "UTF-8";

    const Duration offset = stale_offset.value_or(k_cot_default_stale_offset);
    const SystemTimePoint stale = now + std::chrono::duration_cast<SystemClock::duration>(offset);
    const std::string str_now = format_cot_time(now);

    pugi::xml_node event = document.append_child("event");
    event.append_attribute("version") = k_cot_version;
    event.append_attribute("uid") = geometry.uid.c_str();
    event.append_attribute("type") = std::string{geometry.type}.c_str();
    event.append_attribute("time") = str_now.c_str();
    event.append_attribute("start") = str_now.c_str();
    event.append_attribute("stale") = format_cot_time(stale).c_str();
    event.append_attribute("how") = k_cot_how;

    pugi::xml_node point = event.append_child("point");
    point.append_attribute("lat") = format_number(geometry.lat).c_str();
    point.append_attribute("lon") = format_number(geometry.lon).c_str();
    point.append_attribute("hae") = format_number(geometry.hae).c_str();
    point.append_attribute("ce") = format_number(k_cot_circular_error_m).c_str();
    point.append_attribute("le") = format_number(k_cot_linear_error_m).c_str();

    pugi::xml_node detail = event.append_child("detail");
    detail.append_child("contact").append_attribute("callsign") = geometry.uid.c_str();
    pugi::xml_node precision = detail.append_child("precisionlocation");
    precision.append_attribute("geopointsrc") = "gps";
    precision.append_attribute("altsrc") = "gps";
    return detail;
}

void append_remarks_and_color(pugi::xml_node detail, const std::string& remarks, Affiliation affiliation) {
    detail.append_child("remarks").text().set(remarks.c_str());
    detail.append_child("color").append_attribute("argb") = std::string{affiliation_color_argb(affiliation)}.c_str();
}

CotPayload serialize(const pugi::xml_document& document) {
    std::ostringstream stream;
    document.save(stream, "  ", pugi::format_indent, pugi::encoding_utf8);
    return stream.str();
}

CotPayload encode_marker(const DroneRecord& record,
                         std::string_view uid_prefix,
                         double lat,
                         double lon,
                         const char* icon_path,
                         std::string_view remarks_label,
                         std::optional<Duration> stale_offset,
                         SystemTimePoint now) {
    EventGeometry geometry{};
    geometry.uid = fmt::format("{}{}", uid_prefix, base_entity_id(record.id));
    geometry.type = k_marker_type;
    geometry.lat = lat;
    geometry.lon = lon;
    geometry.hae = record.alt;

    pugi::xml_document document;
    pugi::xml_node detail = build_envelope(document, geometry, stale_offset, now);
    detail.append_child("usericon").append_attribute("iconsetpath") = icon_path;
    append_remarks_and_color(detail, fmt::format("{} location for drone {}", remarks_label, record.id), record.affiliation);
    return serialize(document);
}

std::string optional_or(const std::optional<int>& value, std::string_view fallback) {
    return value.has_value() ? fmt::format("{}", *value) : std::string{fallback};
}

std::string optional_or(const std::optional<double>& value, std::string_view fallback) {
    return value.has_value() ? format_number(*value) : std::string{fallback};
}

}  // namespace

std::string format_cot_time(SystemTimePoint instant) {
    const auto whole_seconds = std::chrono::floor<std::chrono::seconds>(instant);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(instant - whole_seconds).count();
    const std::time_t epoch_seconds = SystemClock::to_time_t(whole_seconds);
    std::tm utc_time{};
    gmtime_r(&epoch_seconds, &utc_time);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}Z", utc_time, micros);
}

std::string_view base_entity_id(std::string_view record_id) noexcept {
    if (record_id.starts_with(k_drone_prefix)) {
        record_id.remove_prefix(k_drone_prefix.size());
    }
    return record_id;
}

std::string build_drone_summary(const DroneRecord& record) {
    return fmt::format(
        "MAC: {}, RSSI: {}dBm; ID Type: {}; UA Type: {} ({}); Operator ID: [{}: {}]; "
        "Speed: {} m/s; Vert Speed: {} m/s; Altitude: {} m; AGL: {} m; Course: {}°; "
        "Index: {}; Runtime: {}s",
        record.mac,
        record.rssi,
        record.id_type,
        record.ua_type_name,
        optional_or(record.ua_type, "None"),
        record.operator_id_type,
        record.operator_id,
        format_number(record.speed),
        format_number(record.vspeed),
        format_number(record.alt),
        format_number(record.height),
        optional_or(record.direction, "None"),
        record.index,
        record.runtime
    );
}

std::string build_status_summary(const SystemStatus& status) {
    return fmt::format(
        "CPU Usage: {}%, Memory Total: {:.2f} MB, Memory Available: {:.2f} MB, "
        "Disk Total: {:.2f} MB, Disk Used: {:.2f} MB, Temperature: {}°C, Uptime: {} seconds, "
        "Pluto Temp: {}°C, Zynq Temp: {}°C",
        format_number(status.cpu_usage),
        status.memory_total_mb,
        status.memory_available_mb,
        status.disk_total_mb,
        status.disk_used_mb,
        format_number(status.temperature),
        format_number(status.uptime),
        status.pluto_temp,
        status.zynq_temp
    );
}

CotPayload CotEncoder::encode_main(const DroneRecord& record, std::optional<Duration> stale_offset, SystemTimePoint now) const {
    EventGeometry geometry{};
    geometry.uid = record.id;
    geometry.type = cot_type_for_ua(record.ua_type);
    geometry.lat = record.lat;
    geometry.lon = record.lon;
    geometry.hae = record.alt;

    pugi::xml_document document;
    pugi::xml_node detail = build_envelope(document, geometry, stale_offset, now);
    pugi::xml_node track = detail.append_child("track");
    track.append_attribute("course") = format_number(record.direction.value_or(0.0)).c_str();
    track.append_attribute("speed") = format_number(record.speed).c_str();
    append_remarks_and_color(detail, build_drone_summary(record), record.affiliation);
    return serialize(document);
}

CotPayload CotEncoder::encode_pilot(const DroneRecord& record, std::optional<Duration> stale_offset, SystemTimePoint now) const {
    return encode_marker(record, "pilot-", record.pilot_lat, record.pilot_lon, k_pilot_icon, "Pilot", stale_offset, now);
}

CotPayload CotEncoder::encode_home(const DroneRecord& record, std::optional<Duration> stale_offset, SystemTimePoint now) const {
    return encode_marker(record, "home-", record.home_lat, record.home_lon, k_home_icon, "Home", stale_offset, now);
}

CotPayload CotEncoder::encode_system_status(const SystemStatus& status,
                                            std::optional<Duration> stale_offset,
                                            SystemTimePoint now) const {
    EventGeometry geometry{};
    geometry.uid = fmt::format("{}{}", k_sensor_uid_prefix, status.serial_number);
    geometry.type = k_sensor_type;
    geometry.lat = status.lat;
    geometry.lon = status.lon;
    geometry.hae = status.alt;

    pugi::xml_document document;
    pugi::xml_node detail = build_envelope(document, geometry, stale_offset, now);
    pugi::xml_node track = detail.append_child("track");
    track.append_attribute("course") = format_number(status.track).c_str();
    track.append_attribute("speed") = format_number(status.speed).c_str();
    detail.append_child("remarks").text().set(build_status_summary(status).c_str());
    return serialize(document);
}

}  // namespace drone_relay
