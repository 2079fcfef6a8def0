#pragma once
#include <functional>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace tgw {

class Gateway;

enum class ActionMethod { Get, Post };

// One /actions/<name> route. An empty envelope returns the result as-is.
struct ActionRoute {
  std::string name;
  ActionMethod method;
  std::string envelope;
  std::function<nlohmann::json(Gateway&, const nlohmann::json&)> call;
};

struct ActionResponse {
  int status = 200;
  nlohmann::json body;
};

// Route table for the action surface.
const std::vector<ActionRoute>& action_routes();

// Throws NotConfigured when no key is configured and Unauthorized when the
// presented key is missing or does not match (constant-time compare).
void verify_api_key(const std::string& configured, const std::string& presented, bool present);

// Query parameters to an argument object. Repeated keys become arrays,
// empty values are dropped.
nlohmann::json query_to_args(const httplib::Params& params);

// Throws ValidationError for a non-JSON or non-object body. An empty body
// is an empty object.
nlohmann::json parse_body_object(const std::string& body);

// Runs `fn` and maps its outcome onto a status and JSON body:
// GatewayError -> its status with {"error": message}, anything else -> 500.
ActionResponse run_action(const std::function<nlohmann::json()>& fn, const std::string& envelope);

} // namespace tgw
