#include "drone_relay/system_status.hpp"

#include <utility>

#include "drone_relay/telemetry_normalizer.hpp"

namespace drone_relay {

namespace {

constexpr double k_bytes_per_mb{1024.0 * 1024.0};

const nlohmann::json& member(const nlohmann::json& object, const char* key) {
    static const nlohmann::json k_null{};
    if (!object.is_object()) {
        return k_null;
    }
    const auto found = object.find(key);
    return found == object.end() ? k_null : *found;
}

std::string reading_text(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    return k_unavailable_reading;
}

}  // namespace

bool SystemStatus::has_position() const noexcept {
    return lat != 0.0 || lon != 0.0;
}

bool is_system_status_message(const nlohmann::json& message) noexcept {
    return message.is_object()
        && (message.contains("serial_number") || message.contains("gps_data") || message.contains("system_stats"));
}

SystemStatusParser::SystemStatusParser(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

std::optional<SystemStatus> SystemStatusParser::parse(const nlohmann::json& message) const {
    if (!is_system_status_message(message)) {
        return std::nullopt;
    }

    SystemStatus status{};
    const nlohmann::json& serial = member(message, "serial_number");
    if (serial.is_string() && !serial.get_ref<const std::string&>().empty()) {
        status.serial_number = serial.get<std::string>();
    } else if (serial.is_number()) {
        status.serial_number = serial.dump();
    }

    const nlohmann::json& gps = member(message, "gps_data");
    status.lat = coerce_double(member(gps, "latitude"), 0.0);
    status.lon = coerce_double(member(gps, "longitude"), 0.0);
    status.alt = coerce_double(member(gps, "altitude"), 0.0);
    status.speed = coerce_double(member(gps, "speed"), 0.0);
    status.track = coerce_double(member(gps, "track"), 0.0);

    const nlohmann::json& stats = member(message, "system_stats");
    const nlohmann::json& memory = member(stats, "memory");
    const nlohmann::json& disk = member(stats, "disk");
    status.cpu_usage = coerce_double(member(stats, "cpu_usage"), 0.0);
    status.memory_total_mb = coerce_double(member(memory, "total"), 0.0) / k_bytes_per_mb;
    status.memory_available_mb = coerce_double(member(memory, "available"), 0.0) / k_bytes_per_mb;
    status.disk_total_mb = coerce_double(member(disk, "total"), 0.0) / k_bytes_per_mb;
    status.disk_used_mb = coerce_double(member(disk, "used"), 0.0) / k_bytes_per_mb;
    status.temperature = coerce_double(member(stats, "temperature"), 0.0);
    status.uptime = coerce_double(member(stats, "uptime"), 0.0);

    const nlohmann::json& sdr_temps = member(message, "ant_sdr_temps");
    status.pluto_temp = reading_text(member(sdr_temps, "pluto_temp"));
    status.zynq_temp = reading_text(member(sdr_temps, "zynq_temp"));

    if (!status.has_position()) {
        logger_->warn("System status from {} has no GPS fix (lat/lon 0,0)", status.serial_number);
    }
    return status;
}

}  // namespace drone_relay
