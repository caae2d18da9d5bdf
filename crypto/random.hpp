#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace auditstore {

// Bytes from the OpenSSL CSPRNG; throws std::runtime_error on failure.
std::vector<std::uint8_t> random_bytes(std::size_t len);

std::string to_hex(const std::vector<std::uint8_t> &data);

// RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form.
std::string random_uuid();

} // namespace auditstore
