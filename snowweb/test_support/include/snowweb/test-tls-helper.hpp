#pragma once

#include <string>
#include <utility>

namespace snowweb::test {

// Generates a self-signed ECDSA P-256 certificate and its key, as {certPem, keyPem}.
// The certificate is valid for server and client authentication and can be its own trust anchor, so one pair
// serves as a client CA bundle and as the client certificate presented against it.
// Returns empty strings if OpenSSL fails.
std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName = "localhost",
                                                         int validSeconds = 3600);

}  // namespace snowweb::test
