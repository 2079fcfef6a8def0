#pragma once

namespace tgw {

class Gateway;
class RpcEndpoint;
struct GatewayConfig;

// Start a blocking HTTP server: health routes, /actions/* and POST /mcp.
// Actions answer 503 while no API key is configured.
void run_http_server(Gateway& gateway,
                     const RpcEndpoint& rpc,
                     const GatewayConfig& config);

}
