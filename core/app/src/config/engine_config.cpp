#include "park/config/engine_config.hpp"

#include "park/common/errors.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>

namespace park {

namespace {

using nlohmann::json;

const json* member(const json& section, const char* key) {
  auto it = section.find(key);
  return it == section.end() ? nullptr : &*it;
}

const json* sectionOf(const json& root, const char* name) {
  const json* section = member(root, name);
  if (section != nullptr && !section->is_object()) {
    throw ConfigError(std::string(name) + " must be an object");
  }
  return section;
}

std::string path(const char* section, const char* key) {
  return std::string(section) + "." + key;
}

void readNumber(const json& s, const char* section, const char* key,
                double& out) {
  if (const json* v = member(s, key)) {
    if (!v->is_number()) {
      throw ConfigError(path(section, key) + " must be a number");
    }
    out = v->get<double>();
  }
}

void readInt(const json& s, const char* section, const char* key,
             std::int64_t& out) {
  if (const json* v = member(s, key)) {
    if (!v->is_number_integer()) {
      throw ConfigError(path(section, key) + " must be an integer");
    }
    out = v->get<std::int64_t>();
  }
}

void readString(const json& s, const char* section, const char* key,
                std::string& out) {
  if (const json* v = member(s, key)) {
    if (!v->is_string()) {
      throw ConfigError(path(section, key) + " must be a string");
    }
    out = v->get<std::string>();
  }
}

void readLot(const json& s, LotLayout& lot) {
  std::int64_t rows = lot.rows;
  std::int64_t columns = lot.columns;
  readInt(s, "lot", "rows", rows);
  readInt(s, "lot", "columns", columns);
  lot.rows = static_cast<int>(rows);
  lot.columns = static_cast<int>(columns);
  readNumber(s, "lot", "default_hourly_rate", lot.default_hourly_rate);

  const json* spaces = member(s, "spaces");
  if (spaces == nullptr) {
    return;
  }
  if (!spaces->is_array()) {
    throw ConfigError("lot.spaces must be an array");
  }
  lot.overrides.clear();
  for (const json& entry : *spaces) {
    if (!entry.is_object()) {
      throw ConfigError("lot.spaces entries must be objects");
    }
    SpaceOverride override_entry;
    readString(entry, "lot.spaces[]", "id", override_entry.id);
    if (override_entry.id.empty()) {
      throw ConfigError("lot.spaces[].id is required");
    }
    if (member(entry, "hourly_rate") != nullptr) {
      double rate = 0.0;
      readNumber(entry, "lot.spaces[]", "hourly_rate", rate);
      override_entry.hourly_rate = rate;
    }
    if (member(entry, "vehicle_type") != nullptr) {
      std::string type;
      readString(entry, "lot.spaces[]", "vehicle_type", type);
      override_entry.vehicle_restriction = domain::parseVehicleType(type);
      if (!override_entry.vehicle_restriction) {
        throw ConfigError("lot.spaces[].vehicle_type unknown: " + type);
      }
    }
    lot.overrides.push_back(std::move(override_entry));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
void EngineConfig::validate() const {
  if (lot.rows <= 0 || lot.columns <= 0) {
    throw ConfigError("lot.rows and lot.columns must be positive");
  }
  if (lot.default_hourly_rate < 0.0) {
    throw ConfigError("lot.default_hourly_rate must not be negative");
  }
  for (const auto& o : lot.overrides) {
    if (o.hourly_rate && *o.hourly_rate < 0.0) {
      throw ConfigError("lot.spaces[" + o.id +
                        "].hourly_rate must not be negative");
    }
  }
  if (!(booking.min_booking_hours > 0.0)) {
    throw ConfigError("booking.min_booking_hours must be positive");
  }
  if (booking.max_booking_hours < booking.min_booking_hours) {
    throw ConfigError("booking.max_booking_hours must be >= min_booking_hours");
  }
  if (booking.advance_booking_days < 0.0) {
    throw ConfigError("booking.advance_booking_days must not be negative");
  }
  if (booking.cancellation_hours < 0.0) {
    throw ConfigError("booking.cancellation_hours must not be negative");
  }
  if (booking.currency.empty()) {
    throw ConfigError("booking.currency must not be empty");
  }
  if (payment.timeout.count() <= 0) {
    throw ConfigError("payment.timeout_ms must be positive");
  }
  if (payment.gateway != "demo") {
    throw ConfigError("payment.gateway unsupported: " + payment.gateway);
  }
  if (!(detection.confidence_threshold >= 0.0 &&
        detection.confidence_threshold <= 1.0)) {
    throw ConfigError("detection.confidence_threshold must be in [0, 1]");
  }
  if (history.window.count() <= 0) {
    throw ConfigError("history.window_minutes must be positive");
  }
  if (forecast.model != "seasonal" && forecast.model != "linear") {
    throw ConfigError("forecast.model must be \"seasonal\" or \"linear\"");
  }
  if (forecast.model == "linear" && forecast.model_path.empty()) {
    throw ConfigError("forecast.model_path is required for the linear model");
  }
  if (!(forecast.lookback_hours > 0.0)) {
    throw ConfigError("forecast.lookback_hours must be positive");
  }
  if (maintenance.interval.count() <= 0) {
    throw ConfigError("maintenance.interval_ms must be positive");
  }
}

// -----------------------------------------------------------------------------
// fromJson()
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("Configuration root must be a JSON object");
  }
  EngineConfig config;

  if (const json* s = sectionOf(j, "lot")) {
    readLot(*s, config.lot);
  }

  if (const json* s = sectionOf(j, "booking")) {
    readNumber(*s, "booking", "min_booking_hours",
               config.booking.min_booking_hours);
    readNumber(*s, "booking", "max_booking_hours",
               config.booking.max_booking_hours);
    readNumber(*s, "booking", "advance_booking_days",
               config.booking.advance_booking_days);
    readNumber(*s, "booking", "cancellation_hours",
               config.booking.cancellation_hours);
    readString(*s, "booking", "currency", config.booking.currency);
  }

  if (const json* s = sectionOf(j, "payment")) {
    std::int64_t timeout = config.payment.timeout.count();
    std::int64_t latency = config.payment.simulated_latency.count();
    readInt(*s, "payment", "timeout_ms", timeout);
    readInt(*s, "payment", "simulated_latency_ms", latency);
    config.payment.timeout = std::chrono::milliseconds(timeout);
    config.payment.simulated_latency = std::chrono::milliseconds(latency);
    readString(*s, "payment", "gateway", config.payment.gateway);
    if (const json* declined = member(*s, "declined_methods")) {
      if (!declined->is_array()) {
        throw ConfigError("payment.declined_methods must be an array");
      }
      config.payment.declined_methods.clear();
      for (const json& method : *declined) {
        if (!method.is_string()) {
          throw ConfigError("payment.declined_methods must hold strings");
        }
        config.payment.declined_methods.push_back(method.get<std::string>());
      }
    }
  }

  if (const json* s = sectionOf(j, "detection")) {
    readNumber(*s, "detection", "confidence_threshold",
               config.detection.confidence_threshold);
    readString(*s, "detection", "endpoint", config.detection.endpoint);
  }

  if (const json* s = sectionOf(j, "history")) {
    std::int64_t minutes = config.history.window.count();
    readInt(*s, "history", "window_minutes", minutes);
    config.history.window = std::chrono::minutes(minutes);
  }

  if (const json* s = sectionOf(j, "forecast")) {
    readString(*s, "forecast", "model", config.forecast.model);
    readNumber(*s, "forecast", "lookback_hours",
               config.forecast.lookback_hours);
    std::int64_t min_buckets =
        static_cast<std::int64_t>(config.forecast.min_history_buckets);
    readInt(*s, "forecast", "min_history_buckets", min_buckets);
    if (min_buckets < 1) {
      throw ConfigError("forecast.min_history_buckets must be at least 1");
    }
    config.forecast.min_history_buckets = static_cast<std::size_t>(min_buckets);
    readString(*s, "forecast", "model_path", config.forecast.model_path);
  }

  if (const json* s = sectionOf(j, "maintenance")) {
    std::int64_t interval = config.maintenance.interval.count();
    readInt(*s, "maintenance", "interval_ms", interval);
    config.maintenance.interval = std::chrono::milliseconds(interval);
  }

  if (const json* s = sectionOf(j, "ipc")) {
    readString(*s, "ipc", "command_endpoint", config.ipc.command_endpoint);
    readString(*s, "ipc", "telemetry_endpoint", config.ipc.telemetry_endpoint);
  }

  config.validate();
  return config;
}

EngineConfig EngineConfig::loadFile(const std::string& file) {
  std::ifstream in(file);
  if (!in) {
    throw ConfigError("Cannot open configuration file: " + file);
  }
  json j;
  try {
    j = json::parse(in);
  } catch (const json::exception& e) {
    throw ConfigError("Malformed configuration file " + file + ": " +
                      e.what());
  }
  EngineConfig config = fromJson(j);
  std::cout << "[EngineConfig] Loaded " << file << "\n";
  return config;
}

}  // namespace park
