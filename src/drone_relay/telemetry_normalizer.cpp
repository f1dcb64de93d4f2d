#include "drone_relay/telemetry_normalizer.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include "drone_relay/remote_id.hpp"

namespace drone_relay {

using nlohmann::json;

namespace {

constexpr char k_part_basic_id[] = "Basic ID";
constexpr char k_part_location[] = "Location/Vector Message";
constexpr char k_part_self_id[] = "Self-ID Message";
constexpr char k_part_operator_id[] = "Operator ID Message";
constexpr char k_part_system[] = "System Message";
constexpr char k_part_frequency[] = "Frequency Message";

const json k_null_value{};

/**
 * @brief Field accessor that tolerates non-object containers and missing keys.
 */
const json& field(const json& container, const char* key) {
    if (!container.is_object()) {
        return k_null_value;
    }
    const auto iterator_field = container.find(key);
    if (iterator_field == container.end()) {
        return k_null_value;
    }
    return *iterator_field;
}

bool has_field(const json& container, const char* key) {
    return container.is_object() && container.contains(key);
}

std::string leading_token(const std::string& text) {
    const std::size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const std::size_t end = text.find_first_of(" \t\r\n", begin);
    return text.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
}

/**
 * @brief Text coercion for descriptive fields; numbers keep their JSON spelling.
 */
std::string coerce_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

int coerce_int(const json& value, int fallback) {
    const double parsed = coerce_double(value, std::numeric_limits<double>::quiet_NaN());
    if (std::isnan(parsed) || parsed < static_cast<double>(std::numeric_limits<int>::min())
        || parsed > static_cast<double>(std::numeric_limits<int>::max())) {
        return fallback;
    }
    return static_cast<int>(parsed);
}

UaClassification classify_ua(const json& raw_ua) {
    UaClassification classification{};
    std::optional<int> code;
    if (raw_ua.is_number()) {
        code = coerce_int(raw_ua, -1);
    } else if (raw_ua.is_string()) {
        const std::string& text = raw_ua.get_ref<const std::string&>();
        const double numeric = coerce_double(raw_ua, std::numeric_limits<double>::quiet_NaN());
        if (!std::isnan(numeric) && leading_token(text) == text) {
            code = coerce_int(raw_ua, -1);
        } else {
            code = ua_type_code_from_name(text);
        }
    }
    if (!code.has_value()) {
        return classification;
    }
    const std::optional<std::string_view> name = ua_type_name(*code);
    if (!name.has_value()) {
        return classification;
    }
    classification.code = code;
    classification.name = std::string{*name};
    return classification;
}

void apply_basic_id(const json& basic, Observation& observation) {
    const UaClassification classification = classify_ua(field(basic, "ua_type"));
    observation.ua_type = classification.code;
    observation.ua_type_name = classification.name;

    const std::string id_type = coerce_text(field(basic, "id_type"));
    observation.id_type = id_type;
    if (has_field(basic, "MAC")) {
        observation.mac = coerce_text(field(basic, "MAC"));
    }
    if (has_field(basic, "RSSI")) {
        observation.rssi = coerce_int(field(basic, "RSSI"), 0);
    }

    const std::string raw_id = has_field(basic, "id") ? coerce_text(field(basic, "id")) : std::string{"unknown"};
    if (id_type == k_id_type_serial_number) {
        if (!raw_id.empty()) {
            observation.id = raw_id;
        }
    } else if (id_type == k_id_type_caa_registration) {
        observation.caa = raw_id;
    }
}

void apply_operator_id(const json& operator_part, Observation& observation) {
    observation.operator_id_type = coerce_text(field(operator_part, "operator_id_type"));
    observation.operator_id = coerce_text(field(operator_part, "operator_id"));
}

void apply_location(const json& location, Observation& observation) {
    observation.lat = coerce_double(field(location, "latitude"), 0.0);
    observation.lon = coerce_double(field(location, "longitude"), 0.0);
    observation.speed = coerce_double(field(location, "speed"), 0.0);
    observation.vspeed = coerce_double(field(location, "vert_speed"), 0.0);
    observation.alt = coerce_double(field(location, "geodetic_altitude"), 0.0);
    observation.height = coerce_double(field(location, "height_agl"), 0.0);

    observation.op_status = coerce_text(field(location, "op_status"));
    observation.height_type = coerce_text(field(location, "height_type"));
    observation.ew_dir = coerce_text(field(location, "ew_dir_segment"));
    observation.direction = coerce_optional_double(field(location, "direction"));
    observation.speed_multiplier = coerce_double(field(location, "speed_multiplier"), 0.0);
    observation.pressure_altitude = coerce_double(field(location, "pressure_altitude"), 0.0);
    observation.vertical_accuracy = coerce_text(field(location, "vertical_accuracy"));
    observation.horizontal_accuracy = coerce_text(field(location, "horizontal_accuracy"));
    observation.baro_accuracy = coerce_text(field(location, "baro_accuracy"));
    observation.speed_accuracy = coerce_text(field(location, "speed_accuracy"));
    observation.timestamp = coerce_text(field(location, "timestamp"));
    observation.timestamp_accuracy = coerce_text(field(location, "timestamp_accuracy"));
}

void apply_frequency(const json& frequency, Observation& observation) {
    observation.freq = coerce_optional_double(field(frequency, "frequency"));
}

}  // namespace

double coerce_double(const json& value, double fallback) noexcept {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (!value.is_string()) {
        return fallback;
    }
    const std::string token = leading_token(value.get_ref<const std::string&>());
    if (token.empty()) {
        return fallback;
    }
    try {
        const double parsed = std::stod(token);
        if (!std::isfinite(parsed)) {
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::optional<double> coerce_optional_double(const json& value) noexcept {
    const double parsed = coerce_double(value, std::numeric_limits<double>::quiet_NaN());
    if (std::isnan(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

TelemetryNormalizer::TelemetryNormalizer(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

std::optional<Observation> TelemetryNormalizer::normalize(const json& message) const {
    try {
        if (message.is_array()) {
            return normalize_parts(message);
        }
        if (message.is_object()) {
            return normalize_map(message);
        }
    } catch (const std::exception& exc) {
        logger_->error("Telemetry message could not be normalized: {}", exc.what());
        return std::nullopt;
    }
    logger_->error("Unexpected message format; expected a list of parts or a map (got {})", message.type_name());
    return std::nullopt;
}

std::optional<Observation> TelemetryNormalizer::normalize_text(std::string_view raw_message) const {
    const json message = json::parse(raw_message.begin(), raw_message.end(), nullptr, false);
    if (message.is_discarded()) {
        logger_->error("Telemetry JSON decode failed ({} bytes)", raw_message.size());
        return std::nullopt;
    }
    return normalize(message);
}

std::optional<Observation> TelemetryNormalizer::normalize_parts(const json& parts) const {
    Observation observation{};
    bool recognized = false;

    for (const json& part : parts) {
        if (!part.is_object()) {
            logger_->error("Unexpected item type in message list; expected a map");
            continue;
        }

        if (has_field(part, "MAC")) {
            observation.mac = coerce_text(field(part, "MAC"));
            recognized = true;
        }
        if (has_field(part, "RSSI")) {
            observation.rssi = coerce_int(field(part, "RSSI"), 0);
            recognized = true;
        }
        if (has_field(part, k_part_frequency)) {
            apply_frequency(field(part, k_part_frequency), observation);
            recognized = true;
        }
        if (has_field(part, k_part_basic_id)) {
            apply_basic_id(field(part, k_part_basic_id), observation);
            recognized = true;
        }
        if (has_field(part, k_part_operator_id)) {
            apply_operator_id(field(part, k_part_operator_id), observation);
            recognized = true;
        }
        if (has_field(part, k_part_location)) {
            apply_location(field(part, k_part_location), observation);
            recognized = true;
        }
        if (has_field(part, k_part_self_id)) {
            observation.description = coerce_text(field(field(part, k_part_self_id), "text"));
            recognized = true;
        }
        if (has_field(part, k_part_system)) {
            const json& system = field(part, k_part_system);
            observation.pilot_lat = coerce_double(field(system, "latitude"), 0.0);
            observation.pilot_lon = coerce_double(field(system, "longitude"), 0.0);
            observation.home_lat = coerce_double(field(system, "home_lat"), 0.0);
            observation.home_lon = coerce_double(field(system, "home_lon"), 0.0);
            recognized = true;
        }
    }

    if (!recognized) {
        logger_->debug("Message list carried no recognizable Remote ID parts");
        return std::nullopt;
    }
    return observation;
}

Observation TelemetryNormalizer::normalize_map(const json& message) const {
    Observation observation{};
    observation.index = coerce_int(field(message, "index"), 0);
    observation.runtime = coerce_int(field(message, "runtime"), 0);

    if (has_field(message, "AUX_ADV_IND")) {
        const json& advertisement = field(message, "AUX_ADV_IND");
        if (has_field(advertisement, "rssi")) {
            observation.rssi = coerce_int(field(advertisement, "rssi"), 0);
        }
        const json& advertiser = field(field(message, "aext"), "AdvA");
        if (advertiser.is_string()) {
            observation.mac = leading_token(advertiser.get_ref<const std::string&>());
        }
    }

    if (has_field(message, k_part_basic_id)) {
        apply_basic_id(field(message, k_part_basic_id), observation);
    }
    if (has_field(message, k_part_operator_id)) {
        apply_operator_id(field(message, k_part_operator_id), observation);
    }
    if (has_field(message, k_part_location)) {
        apply_location(field(message, k_part_location), observation);
    }
    if (has_field(message, k_part_self_id)) {
        observation.description = coerce_text(field(field(message, k_part_self_id), "text"));
    }
    if (has_field(message, k_part_system)) {
        const json& system = field(message, k_part_system);
        observation.pilot_lat = coerce_double(field(system, "operator_lat"), 0.0);
        observation.pilot_lon = coerce_double(field(system, "operator_lon"), 0.0);
    }
    if (has_field(message, k_part_frequency)) {
        apply_frequency(field(message, k_part_frequency), observation);
    }
    return observation;
}

}  // namespace drone_relay
