#pragma once

#include <string>

namespace access {

// Single-issuer authorisation gate.
class AccessPolicy {
public:
  explicit AccessPolicy(std::string issuer);

  bool isIssuer(const std::string &caller) const;
  const std::string &getIssuer() const;

private:
  std::string _issuer;
};

} // namespace access
