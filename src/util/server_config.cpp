#include "util/server_config.hpp"

#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

#include <set>

namespace otasrv::config {

namespace {

// httplib treats route patterns as regular expressions (or ":param" paths),
// so only characters that match themselves are accepted.
bool IsRoute(const std::string& r) {
    if (r.empty() || r.front() != '/') return false;
    for (char c : r) {
        const bool plain = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                           c == '/' || c == '-' || c == '_' || c == '~';
        if (!plain) return false;
    }
    return true;
}

} // namespace

std::vector<FamilyConfig> ServerConfig::DefaultFamilies() {
    return {FamilyConfig{
        .name = "plugin",
        .extension = ".wasm",
        .check_route = "/check-update",
        .download_route = "/download",
        .checksum = true,
    }};
}

void ServerConfig::Reset() {
    *this = ServerConfig{};
}

Result ServerConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(-1, err + " in " + path);
    }

    return Validate();
}

Result ServerConfig::Validate() const {
    if (files_dir.empty()) {
        return Result::Fail(-1, "FilesDir must not be empty");
    }
    if (listen_address.empty()) {
        return Result::Fail(-1, "ListenAddress must not be empty");
    }
    if (!base_url.empty() && base_url.find("://") == std::string::npos) {
        return Result::Fail(-1, "BaseUrl must be absolute (scheme://host[:port]): " + base_url);
    }
    if (families.empty()) {
        return Result::Fail(-1, "Families must not be empty");
    }

    std::set<std::string> names;
    std::set<std::string> routes;
    for (const auto& fam : families) {
        if (fam.name.empty() || ContainsPathSeparator(fam.name)) {
            return Result::Fail(-1, "invalid family Name: '" + fam.name + "'");
        }
        if (!names.insert(fam.name).second) {
            return Result::Fail(-1, "duplicate family Name: " + fam.name);
        }
        // The resolver rebuilds filenames from this, so it must match what the catalog stripped.
        if (fam.extension.size() < 2 || fam.extension.front() != '.' || ContainsPathSeparator(fam.extension)) {
            return Result::Fail(-1, "Extension must start with '.': " + fam.name);
        }
        for (const auto* route : {&fam.check_route, &fam.download_route}) {
            if (!IsRoute(*route)) {
                return Result::Fail(-1, "invalid route '" + *route + "' for family " + fam.name);
            }
            if (!routes.insert(*route).second) {
                return Result::Fail(-1, "duplicate route: " + *route);
            }
        }
    }
    return Result::Ok();
}

} // namespace otasrv::config
