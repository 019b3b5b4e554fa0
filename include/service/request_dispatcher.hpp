#pragma once

#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace option {
class CallOption;
class ManualClock;
} // namespace option

namespace service {

// JSON request surface over one instrument. Each request names an
// operation in "type"; the response carries "status" = "success" or
// "error".
class RequestDispatcher {
public:
  // manual_clock may be null; requests then cannot set "now".
  RequestDispatcher(option::CallOption &instrument,
                    std::shared_ptr<option::ManualClock> manual_clock,
                    size_t num_workers = 2);
  ~RequestDispatcher();

  RequestDispatcher(const RequestDispatcher &) = delete;
  RequestDispatcher &operator=(const RequestDispatcher &) = delete;

  nlohmann::json dispatch(const nlohmann::json &request);
  std::string dispatchMessage(const std::string &message);

  // Runs the batch on the worker pool. Responses keep request order.
  std::vector<std::string>
  dispatchBatch(const std::vector<std::string> &messages);

private:
  class Impl;
  Impl *_pimpl;
};

} // namespace service
