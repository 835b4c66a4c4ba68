#pragma once

#include <string>

#include "app/services.hpp"

namespace courserag {

// Serves the query, course, ingest and session endpoints until the listener
// stops. Returns the process exit code.
int run_http_server(Services& services, const std::string& host, int port);

}  // namespace courserag
