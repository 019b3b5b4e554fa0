#include "../../include/config/instrument_config.hpp"

#include <cstdint>
#include <fstream>
#include <type_traits>

namespace config {

namespace {

template <typename T>
T require(const nlohmann::json &document, const char *key) {
  if (!document.contains(key)) {
    throw ConfigError(std::string("Missing required field: ") + key);
  }
  const nlohmann::json &field = document.at(key);
  if constexpr (std::is_unsigned_v<T>) {
    // get<unsigned>() would wrap a negative integer.
    if (!field.is_number_integer() ||
        (!field.is_number_unsigned() && field.get<int64_t>() < 0)) {
      throw ConfigError(std::string(key) +
                        " must be a non-negative integer");
    }
  }
  try {
    return field.get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError(std::string("Invalid value for ") + key + ": " +
                      e.what());
  }
}

template <typename T>
T valueOr(const nlohmann::json &document, const char *key, T fallback) {
  if (!document.contains(key)) {
    return fallback;
  }
  return require<T>(document, key);
}

} // namespace

InstrumentConfig parseInstrumentConfig(const nlohmann::json &document,
                                       option::Timestamp now) {
  if (!document.is_object()) {
    throw ConfigError("Instrument config must be a JSON object");
  }

  InstrumentConfig config;
  auto &params = config.params;
  params.name = require<std::string>(document, "name");
  params.symbol = require<std::string>(document, "symbol");
  params.issuer = require<std::string>(document, "issuer");
  params.strike_price = require<option::Amount>(document, "strike_price");

  std::string clock = valueOr<std::string>(document, "clock", "system");
  if (clock == "system") {
    config.clock_mode = ClockMode::SYSTEM;
  } else if (clock == "manual") {
    config.clock_mode = ClockMode::MANUAL;
    config.start_time =
        valueOr<option::Timestamp>(document, "start_time", now);
  } else {
    throw ConfigError("Unknown clock mode: " + clock);
  }

  option::Timestamp base =
      config.clock_mode == ClockMode::MANUAL ? config.start_time : now;
  if (document.contains("expiration")) {
    params.expiration = require<option::Timestamp>(document, "expiration");
  } else if (document.contains("expires_in")) {
    params.expiration =
        base + require<option::Timestamp>(document, "expires_in");
  } else {
    throw ConfigError("One of expiration or expires_in is required");
  }

  std::string collateral =
      valueOr<std::string>(document, "collateral", "native");
  auto kind = option::parseCollateralKind(collateral);
  if (!kind) {
    throw ConfigError("Unknown collateral kind: " + collateral);
  }
  params.collateral = *kind;

  config.workers = valueOr<size_t>(document, "workers", config.workers);
  if (config.workers == 0) {
    throw ConfigError("workers must be at least 1");
  }

  return config;
}

InstrumentConfig loadInstrumentConfig(const std::string &path,
                                      option::Timestamp now) {
  std::ifstream input(path);
  if (!input) {
    throw ConfigError("Cannot open config file: " + path);
  }

  nlohmann::json document;
  try {
    input >> document;
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigError("Malformed config file " + path + ": " + e.what());
  }
  return parseInstrumentConfig(document, now);
}

} // namespace config
