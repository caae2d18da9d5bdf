#pragma once

#include <string>

namespace auditstore {

// Lowercase hex SHA-256 of the input, computed with OpenSSL EVP.
std::string sha256_hex(const std::string &data);

} // namespace auditstore
