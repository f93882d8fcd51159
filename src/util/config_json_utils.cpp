#include "util/config_json_utils.hpp"

#include <fstream>
#include <limits>

namespace otasrv::config::detail {

namespace {

// The Get*IfPresent helpers return false only for a present key of the wrong type.

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::uint64_t max,
                     std::uint64_t& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0 || static_cast<std::uint64_t>(v) > max) {
        err = std::string(key) + " out of range";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool FillFamilyFromJson(const nlohmann::json& j, FamilyConfig& fam, std::string& err) {
    if (!j.is_object()) {
        err = "Families entries must be objects";
        return false;
    }
    if (!GetStringIfPresent(j, "Name", fam.name, err)) return false;
    if (!GetStringIfPresent(j, "Extension", fam.extension, err)) return false;
    if (!GetStringIfPresent(j, "CheckRoute", fam.check_route, err)) return false;
    if (!GetStringIfPresent(j, "DownloadRoute", fam.download_route, err)) return false;
    if (!GetBoolIfPresent(j, "Checksum", fam.checksum, err)) return false;

    if (fam.name.empty()) {
        err = "Families entry missing Name";
        return false;
    }
    if (fam.check_route.empty()) fam.check_route = "/check-update-" + fam.name;
    if (fam.download_route.empty()) fam.download_route = "/download-" + fam.name;
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ServerConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "FilesDir", cfg.files_dir, err)) return false;
    if (!GetStringIfPresent(j, "ListenAddress", cfg.listen_address, err)) return false;
    if (!GetStringIfPresent(j, "BaseUrl", cfg.base_url, err)) return false;

    {
        std::uint64_t v = cfg.port;
        if (!GetU64IfPresent(j, "Port", std::numeric_limits<std::uint16_t>::max(), v, err)) return false;
        cfg.port = static_cast<std::uint16_t>(v);
    }
    {
        std::uint64_t v = cfg.catalog_refresh_seconds;
        if (!GetU64IfPresent(j, "CatalogRefreshSeconds", std::numeric_limits<std::uint32_t>::max(), v, err))
            return false;
        cfg.catalog_refresh_seconds = static_cast<std::uint32_t>(v);
    }
    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err)) return false;
        if (!level.empty()) {
            auto parsed = ParseLogLevel(level);
            if (!parsed) {
                err = "unknown LogLevel: " + level;
                return false;
            }
            cfg.log_level = *parsed;
        }
    }

    if (auto it = j.find("Families"); it != j.end()) {
        if (!it->is_array()) {
            err = "Families must be an array";
            return false;
        }
        cfg.families.clear();
        for (const auto& item : *it) {
            FamilyConfig fam;
            if (!FillFamilyFromJson(item, fam, err)) return false;
            cfg.families.push_back(std::move(fam));
        }
    }

    return true;
}

} // namespace otasrv::config::detail
