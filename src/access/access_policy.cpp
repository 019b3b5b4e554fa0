#include "../../include/access/access_policy.hpp"

#include <stdexcept>

namespace access {

AccessPolicy::AccessPolicy(std::string issuer) : _issuer(std::move(issuer)) {
  if (_issuer.empty()) {
    throw std::invalid_argument("Issuer address must not be empty");
  }
}

bool AccessPolicy::isIssuer(const std::string &caller) const {
  return caller == _issuer;
}

const std::string &AccessPolicy::getIssuer() const { return _issuer; }

} // namespace access
