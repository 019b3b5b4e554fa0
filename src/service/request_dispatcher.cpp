#include "../../include/service/request_dispatcher.hpp"
#include "../../include/option/call_option.hpp"
#include "../../include/option/clock.hpp"
#include "../../include/service/worker_pool.hpp"

#include <future>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace service {

using nlohmann::json;

class RequestDispatcher::Impl {
public:
  Impl(option::CallOption &instrument,
       std::shared_ptr<option::ManualClock> manual_clock, size_t num_workers)
      : _instrument(instrument), _manual_clock(std::move(manual_clock)),
        _pool(num_workers) {}

  json dispatch(const json &request) {
    json response;
    try {
      if (!request.is_object()) {
        throw std::runtime_error("Request must be a JSON object");
      }
      // A request that sets "now" keeps the clock pinned until its call
      // returns; requests without one share the current time.
      std::unique_lock<std::shared_mutex> pinned(_clock_mutex,
                                                 std::defer_lock);
      std::shared_lock<std::shared_mutex> shared(_clock_mutex,
                                                 std::defer_lock);
      if (request.contains("now")) {
        if (!_manual_clock) {
          throw std::runtime_error("Clock override requires a manual clock");
        }
        auto now = request.at("now").get<option::Timestamp>();
        pinned.lock();
        _manual_clock->set(now);
      } else {
        shared.lock();
      }

      std::string type = request.at("type").get<std::string>();
      if (type == "issue") {
        response = handleIssue(request);
      } else if (type == "exercise") {
        response = handleExercise(request);
      } else if (type == "expire") {
        response = handleExpire(request);
      } else if (type == "transfer") {
        response = handleTransfer(request);
      } else if (type == "approve") {
        response = handleApprove(request);
      } else if (type == "transfer_from") {
        response = handleTransferFrom(request);
      } else if (type == "quote") {
        response = handleQuote(request);
      } else if (type == "info") {
        response = handleInfo();
      } else if (type == "balance") {
        response = {{"status", "success"}, {"balance", _instrument.balance()}};
      } else if (type == "balance_of") {
        std::string holder = request.at("holder");
        response = {{"status", "success"},
                    {"holder", holder},
                    {"balance", _instrument.balanceOf(holder)}};
      } else if (type == "events") {
        response = handleEvents();
      } else {
        throw std::runtime_error("Unknown request type: " + type);
      }
      response["type"] = type;
    } catch (const std::exception &e) {
      response = {{"status", "error"}, {"message", e.what()}};
    }

    if (request.is_object() && request.contains("id")) {
      response["id"] = request.at("id");
    }
    return response;
  }

  std::string dispatchMessage(const std::string &message) {
    json request;
    try {
      request = json::parse(message);
    } catch (const json::parse_error &e) {
      std::cerr << "Malformed request: " << e.what() << std::endl;
      return json{{"status", "error"}, {"message", e.what()}}.dump();
    }
    return dispatch(request).dump();
  }

  std::vector<std::string>
  dispatchBatch(const std::vector<std::string> &messages) {
    std::vector<std::future<std::string>> pending;
    pending.reserve(messages.size());

    for (const auto &message : messages) {
      pending.push_back(_pool.submit(
          [this](const std::string &m) { return dispatchMessage(m); },
          message));
    }

    std::vector<std::string> responses;
    responses.reserve(pending.size());
    for (auto &future : pending) {
      responses.push_back(future.get());
    }
    return responses;
  }

private:
  static option::Amount readAmount(const json &request, const char *key) {
    const json &field = request.at(key);
    if (!field.is_number_integer() ||
        (!field.is_number_unsigned() && field.get<int64_t>() < 0)) {
      throw std::runtime_error(std::string(key) +
                               " must be a non-negative integer");
    }
    return field.get<option::Amount>();
  }

  static option::Amount readAmount(const json &request, const char *key,
                                   option::Amount fallback) {
    if (!request.contains(key)) {
      return fallback;
    }
    return readAmount(request, key);
  }

  static json statusResponse(option::Status status) {
    if (status == option::Status::OK) {
      return {{"status", "success"}};
    }
    return {{"status", "error"}, {"error", option::toString(status)}};
  }

  json handleIssue(const json &request) {
    std::string caller = request.at("caller");
    option::Amount amount = readAmount(request, "amount");
    option::Amount value = readAmount(request, "value", 0);

    json response = statusResponse(_instrument.issue(caller, amount, value));
    response["amount"] = amount;
    return response;
  }

  json handleExercise(const json &request) {
    std::string caller = request.at("caller");
    option::Amount units = readAmount(request, "units");
    option::Amount value = readAmount(request, "value", 0);

    json response =
        statusResponse(_instrument.exercise(caller, units, value));
    response["units"] = units;
    return response;
  }

  json handleExpire(const json &request) {
    std::string caller = request.at("caller");
    return statusResponse(_instrument.expire(caller));
  }

  json handleTransfer(const json &request) {
    std::string caller = request.at("caller");
    std::string to = request.at("to");
    option::Amount amount = readAmount(request, "amount");
    return statusResponse(_instrument.transfer(caller, to, amount));
  }

  json handleApprove(const json &request) {
    std::string caller = request.at("caller");
    std::string spender = request.at("spender");
    option::Amount amount = readAmount(request, "amount");
    return statusResponse(_instrument.approve(caller, spender, amount));
  }

  json handleTransferFrom(const json &request) {
    std::string caller = request.at("caller");
    std::string from = request.at("from");
    std::string to = request.at("to");
    option::Amount amount = readAmount(request, "amount");
    return statusResponse(
        _instrument.transferFrom(caller, from, to, amount));
  }

  json handleQuote(const json &request) {
    option::Amount units = readAmount(request, "units");
    auto payment = _instrument.quote(units);
    if (!payment) {
      return statusResponse(option::Status::ARITHMETIC_OVERFLOW);
    }
    return {{"status", "success"},
            {"units", units},
            {"required_payment", *payment}};
  }

  json handleInfo() {
    option::InstrumentInfo info = _instrument.info();
    return {{"status", "success"},
            {"name", info.name},
            {"symbol", info.symbol},
            {"strike_price", info.strike_price},
            {"expiration", info.expiration},
            {"total_supply", info.total_supply},
            {"collateral_held", info.collateral_held},
            {"expired", info.expired},
            {"can_exercise", info.can_exercise}};
  }

  json handleEvents() {
    json events = json::array();
    for (const auto &event : _instrument.events()) {
      events.push_back(option::toJson(event));
    }
    return {{"status", "success"}, {"events", events}};
  }

  option::CallOption &_instrument;
  std::shared_ptr<option::ManualClock> _manual_clock;
  std::shared_mutex _clock_mutex;
  WorkerPool _pool;
};

RequestDispatcher::RequestDispatcher(
    option::CallOption &instrument,
    std::shared_ptr<option::ManualClock> manual_clock, size_t num_workers)
    : _pimpl(new Impl(instrument, std::move(manual_clock), num_workers)) {}

RequestDispatcher::~RequestDispatcher() { delete _pimpl; }

nlohmann::json RequestDispatcher::dispatch(const nlohmann::json &request) {
  return _pimpl->dispatch(request);
}

std::string RequestDispatcher::dispatchMessage(const std::string &message) {
  return _pimpl->dispatchMessage(message);
}

std::vector<std::string>
RequestDispatcher::dispatchBatch(const std::vector<std::string> &messages) {
  return _pimpl->dispatchBatch(messages);
}

} // namespace service
