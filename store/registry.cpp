#include "registry.hpp"
#include "memory_store.hpp"
#include "sqlite_store.hpp"

#include "../audit/errors.hpp"
#include "../crypto/digest.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <system_error>

namespace auditstore {

Registry::Registry(StoreFactory factory) : factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("Registry requires a store factory");
    }
}

IndexContainer &Registry::get_or_create(const std::string &scope) {
    if (scope.empty()) {
        throw ValidationError("scope must not be empty");
    }

    auto it = containers_.find(scope);
    if (it != containers_.end()) {
        return *it->second;
    }

    spdlog::info("opening audit log container for scope '{}'", scope);
    auto container = std::make_unique<IndexContainer>(factory_(scope));
    IndexContainer &ref = *container;
    containers_.emplace(scope, std::move(container));
    return ref;
}

bool Registry::contains(const std::string &scope) const {
    return containers_.count(scope) != 0;
}

std::vector<std::string> Registry::scopes() const {
    std::vector<std::string> out;
    out.reserve(containers_.size());
    for (const auto &entry : containers_) {
        out.push_back(entry.first);
    }
    return out;
}

StoreFactory memory_store_factory() {
    return [](const std::string &) -> std::unique_ptr<HostStore> {
        return std::make_unique<MemoryHostStore>();
    };
}

std::string scope_file_stem(const std::string &scope) {
    std::string out;
    out.reserve(scope.size());
    for (char c : scope) {
        const bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
        out.push_back(safe ? c : '_');
    }
    // Keep "." and ".." from naming directories.
    if (out.find_first_not_of('.') == std::string::npos) {
        out.insert(out.begin(), '_');
    }
    // '~' never survives sanitizing, so a suffixed stem cannot equal the
    // stem of an unchanged name; the digest separates rewritten names.
    if (out != scope) {
        out += '~';
        out += sha256_hex(scope).substr(0, 16);
    }
    return out;
}

StoreFactory sqlite_store_factory(const std::string &data_dir) {
    return [data_dir](const std::string &scope) -> std::unique_ptr<HostStore> {
        namespace fs = std::filesystem;

        std::error_code ec;
        fs::create_directories(data_dir, ec);
        if (ec) {
            throw StorageError("cannot create data directory " + data_dir + ": " + ec.message());
        }
        const fs::path path = fs::path(data_dir) / (scope_file_stem(scope) + ".sqlite");
        return std::make_unique<SqliteHostStore>(path.string());
    };
}

} // namespace auditstore
