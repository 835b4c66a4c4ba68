#pragma once

#include <string>

namespace courserag::uuid {

// Version-4 identifier drawn from the OpenSSL CSPRNG. Used for trace ids and
// session ids, which clients hold on to.
std::string generate();

}  // namespace courserag::uuid
