#include "server/update_checker.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace otasrv {

nlohmann::json CheckResponse::ToJson() const {
    nlohmann::json j = {
        {"update_available", update_available},
        {"latest_version", latest_version},
    };
    if (download_url) j["download_url"] = *download_url;
    if (checksum) j["checksum"] = *checksum;
    return j;
}

UpdateChecker::UpdateChecker(UpdateCheckerOptions options) : options_(std::move(options)) {
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
}

std::string UpdateChecker::LocatorFor(const ArtifactFile& artifact) const {
    return options_.base_url + options_.download_route + "?version=" + EncodeQueryValue(artifact.token);
}

std::expected<SemVer, HttpError> ParseCurrentVersion(const std::string& text) {
    if (text.empty()) {
        return std::unexpected(HttpError::BadRequest("current_version is required"));
    }
    auto current = ParseSemVer(text);
    if (!current) {
        return std::unexpected(
            HttpError::BadRequest("invalid current_version '" + text + "': " + current.error()));
    }
    return std::move(*current);
}

std::expected<CheckResponse, HttpError> UpdateChecker::Check(const std::string& current_version,
                                                             const VersionCatalog& catalog) const {
    auto current = ParseCurrentVersion(current_version);
    if (!current) return std::unexpected(current.error());
    return Check(*current, catalog);
}

CheckResponse UpdateChecker::Check(const SemVer& current, const VersionCatalog& catalog) const {
    CheckResponse resp;
    resp.latest_version = catalog.LatestVersionText();

    const ArtifactFile* latest = catalog.Latest();
    if (!latest || !(latest->version > current)) {
        return resp;
    }

    resp.update_available = true;
    resp.download_url = LocatorFor(*latest);

    if (options_.checksum) {
        std::string hex;
        const std::string path = JoinPath(options_.artifact_dir, latest->filename);
        if (auto r = Sha256HexFile(path, hex); r.ok) {
            resp.checksum = std::move(hex);
        } else {
            LogWarn("checksum omitted for %s: %s", latest->filename.c_str(), r.msg.c_str());
        }
    }
    return resp;
}

} // namespace otasrv
