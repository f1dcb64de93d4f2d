#include "drone_relay/json_stream_sink.hpp"

#include <cmath>
#include <stdexcept>

#include "drone_relay/telemetry_normalizer.hpp"

namespace drone_relay {

namespace {
constexpr double k_hertz_threshold{1e5};
constexpr double k_hertz_per_megahertz{1e6};
}  // namespace

std::optional<double> frequency_mhz(std::optional<double> frequency) {
    if (!frequency.has_value()) {
        return std::nullopt;
    }
    double value = *frequency;
    if (value > k_hertz_threshold) {
        value /= k_hertz_per_megahertz;
    }
    return std::round(value * 1000.0) / 1000.0;
}

nlohmann::json drone_state_document(const DroneRecord& record) {
    nlohmann::json state = {
        {"id", record.id},
        {"description", record.description},
        {"lat", record.lat},
        {"lon", record.lon},
        {"latitude", record.lat},
        {"longitude", record.lon},
        {"gps_accuracy", coerce_double(nlohmann::json(record.horizontal_accuracy), 0.0)},
        {"alt", record.alt},
        {"height", record.height},
        {"speed", record.speed},
        {"vspeed", record.vspeed},
        {"direction", record.direction.value_or(0.0)},
        {"rssi", record.rssi},
        {"pilot_lat", record.pilot_lat},
        {"pilot_lon", record.pilot_lon},
        {"home_lat", record.home_lat},
        {"home_lon", record.home_lon},
        {"mac", record.mac},
        {"id_type", record.id_type},
        {"ua_type_name", record.ua_type_name},
        {"operator_id_type", record.operator_id_type},
        {"operator_id", record.operator_id},
        {"op_status", record.op_status},
        {"height_type", record.height_type},
        {"ew_dir", record.ew_dir},
        {"timestamp", record.timestamp},
        {"index", record.index},
        {"runtime", record.runtime},
        {"affiliation", std::string{to_string(record.affiliation)}},
    };
    state["ua_type"] = record.ua_type.has_value() ? nlohmann::json(*record.ua_type) : nlohmann::json(nullptr);
    state["freq"] = record.freq.has_value() ? nlohmann::json(*record.freq) : nlohmann::json(nullptr);
    const std::optional<double> mhz = frequency_mhz(record.freq);
    state["freq_mhz"] = mhz.has_value() ? nlohmann::json(*mhz) : nlohmann::json(nullptr);
    if (!record.caa.empty()) {
        state["caa"] = record.caa;
    }
    return state;
}

nlohmann::json system_status_document(const SystemStatus& status) {
    return nlohmann::json{
        {"type", "system"},
        {"serial_number", status.serial_number},
        {"lat", status.lat},
        {"lon", status.lon},
        {"alt", status.alt},
        {"speed", status.speed},
        {"track", status.track},
        {"cpu_usage", status.cpu_usage},
        {"memory_total_mb", status.memory_total_mb},
        {"memory_available_mb", status.memory_available_mb},
        {"disk_total_mb", status.disk_total_mb},
        {"disk_used_mb", status.disk_used_mb},
        {"temperature", status.temperature},
        {"uptime", status.uptime},
        {"pluto_temp", status.pluto_temp},
        {"zynq_temp", status.zynq_temp},
    };
}

JsonStreamSink::JsonStreamSink(const std::filesystem::path& output_path)
    : owned_stream_(std::make_unique<std::ofstream>(output_path, std::ios::app)),
      output_(owned_stream_.get()),
      logger_(get_logger()) {
    if (!owned_stream_->is_open()) {
        throw std::runtime_error("Unable to open state output at " + output_path.string());
    }
    logger_->info("JSON state stream writing to {}", output_path.string());
}

JsonStreamSink::JsonStreamSink(std::ostream& output) : output_(&output), logger_(get_logger()) {}

SinkCapabilities JsonStreamSink::capabilities() const {
    return SinkCapabilities{true, true, true, true, true, true};
}

void JsonStreamSink::publish_drone(const DroneRecord& record) {
    merge_and_write(record.id, drone_state_document(record));
}

void JsonStreamSink::publish_pilot(const std::string& drone_id, double lat, double lon, double alt) {
    merge_and_write(drone_id, nlohmann::json{{"pilot_lat", lat}, {"pilot_lon", lon}, {"pilot_alt", alt}});
}

void JsonStreamSink::publish_home(const std::string& drone_id, double lat, double lon, double alt) {
    merge_and_write(drone_id, nlohmann::json{{"home_lat", lat}, {"home_lon", lon}, {"home_alt", alt}});
}

void JsonStreamSink::mark_inactive(const std::string& drone_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    map_state_cache_.erase(drone_id);
    write_line(nlohmann::json{{"id", drone_id}, {"state", "inactive"}});
}

void JsonStreamSink::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    output_->flush();
    if (owned_stream_ != nullptr) {
        owned_stream_->close();
    }
    logger_->info("JSON state stream closed with {} cached drones", map_state_cache_.size());
}

void JsonStreamSink::publish_system(const SystemStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_line(system_status_document(status));
}

std::size_t JsonStreamSink::cached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_state_cache_.size();
}

void JsonStreamSink::merge_and_write(const std::string& drone_id, const nlohmann::json& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json& state = map_state_cache_[drone_id];
    if (state.is_null()) {
        state = nlohmann::json::object();
    }
    state.update(patch);
    state["id"] = drone_id;
    write_line(state);
}

void JsonStreamSink::write_line(const nlohmann::json& document) {
    (*output_) << document.dump() << '\n';
    if (!output_->good()) {
        throw std::runtime_error("Failed to write state line");
    }
}

}  // namespace drone_relay
