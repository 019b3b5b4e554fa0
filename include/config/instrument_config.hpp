#pragma once

#include "../option/types.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace config {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class ClockMode { SYSTEM, MANUAL };

struct InstrumentConfig {
  option::InstrumentParams params;
  ClockMode clock_mode{ClockMode::SYSTEM};
  option::Timestamp start_time{0}; // manual clock only
  size_t workers{2};
};

// now resolves "expires_in" and the default manual start time.
InstrumentConfig parseInstrumentConfig(const nlohmann::json &document,
                                       option::Timestamp now);
InstrumentConfig loadInstrumentConfig(const std::string &path,
                                      option::Timestamp now);

} // namespace config
