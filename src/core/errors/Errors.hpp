#pragma once
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace tgw {

// Base for every error the gateway reports to a caller. The HTTP layer maps
// httpStatus() onto the response; anything not derived from this is a 500.
class GatewayError : public std::runtime_error {
public:
  GatewayError(const std::string& msg, int httpStatus)
    : std::runtime_error(msg), httpStatus_(httpStatus) {}

  int httpStatus() const { return httpStatus_; }

private:
  int httpStatus_;
};

// Malformed or missing caller input. Raised before any remote call.
class ValidationError : public GatewayError {
public:
  explicit ValidationError(const std::string& msg) : GatewayError(msg, 400) {}
};

// The remote API answered with a non-2xx status (or returned a record we
// cannot use). statusCode() is the remote status, 0 when there was none.
class RemoteApiError : public GatewayError {
public:
  RemoteApiError(const std::string& msg, int statusCode = 0,
                 nlohmann::json payload = nullptr)
    : GatewayError(msg, 400), statusCode_(statusCode), payload_(std::move(payload)) {}

  int statusCode() const { return statusCode_; }
  const nlohmann::json& payload() const { return payload_; }

private:
  int statusCode_;
  nlohmann::json payload_;
};

class Conflict : public GatewayError {
public:
  explicit Conflict(const std::string& msg) : GatewayError(msg, 400) {}
};

class NotFound : public GatewayError {
public:
  explicit NotFound(const std::string& msg) : GatewayError(msg, 400) {}
};

class Unauthorized : public GatewayError {
public:
  explicit Unauthorized(const std::string& msg) : GatewayError(msg, 401) {}
};

// Required configuration (API key, remote settings) is absent.
class NotConfigured : public GatewayError {
public:
  explicit NotConfigured(const std::string& msg) : GatewayError(msg, 503) {}
};

} // namespace tgw
