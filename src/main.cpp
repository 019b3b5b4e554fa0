#include "../include/config/instrument_config.hpp"
#include "../include/option/call_option.hpp"
#include "../include/option/clock.hpp"
#include "../include/option/fixed_point.hpp"
#include "../include/service/memory_transport.hpp"
#include "../include/service/request_dispatcher.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char *program) {
  std::cerr << "Usage: " << program << " <config.json> [--batch]\n"
            << "Reads one JSON request per line from stdin and writes one "
               "JSON response per line to stdout.\n";
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2 || argc > 3) {
    printUsage(argv[0]);
    return 2;
  }

  bool batch = false;
  if (argc == 3) {
    if (std::string(argv[2]) != "--batch") {
      printUsage(argv[0]);
      return 2;
    }
    batch = true;
  }

  try {
    option::SystemClock system_clock;
    config::InstrumentConfig cfg =
        config::loadInstrumentConfig(argv[1], system_clock.now());

    std::shared_ptr<option::ManualClock> manual_clock;
    std::shared_ptr<option::Clock> clock;
    if (cfg.clock_mode == config::ClockMode::MANUAL) {
      manual_clock = std::make_shared<option::ManualClock>(cfg.start_time);
      clock = manual_clock;
    } else {
      clock = std::make_shared<option::SystemClock>();
    }

    auto transport = std::make_shared<service::MemoryTransport>();
    option::CallOption instrument(cfg.params, transport, clock);
    service::RequestDispatcher dispatcher(instrument, manual_clock,
                                          cfg.workers);

    std::cerr << "Instrument " << cfg.params.symbol << " ready: strike "
              << cfg.params.strike_price << "/" << option::PRICE_SCALE
              << ", expiration " << cfg.params.expiration << ", "
              << cfg.workers << " worker threads\n";

    std::string line;
    if (batch) {
      std::vector<std::string> requests;
      while (std::getline(std::cin, line)) {
        if (!line.empty()) {
          requests.push_back(line);
        }
      }
      for (const auto &response : dispatcher.dispatchBatch(requests)) {
        std::cout << response << "\n";
      }
    } else {
      while (std::getline(std::cin, line)) {
        if (!line.empty()) {
          std::cout << dispatcher.dispatchMessage(line) << std::endl;
        }
      }
    }

    if (!instrument.checkInvariant()) {
      std::cerr << "Collateral no longer matches outstanding units\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
