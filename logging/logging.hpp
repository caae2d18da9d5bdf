#pragma once

#include <string>

namespace auditstore {

// Installs the default spdlog logger: stderr, plus an appending file sink
// when path is non-empty. Throws ValidationError for an unknown level.
void init_logging(const std::string &level, const std::string &path = "");

} // namespace auditstore
