#pragma once

#include "catalog/version_catalog.hpp"
#include "server/http_error.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace otasrv {

struct CheckResponse {
    bool update_available = false;
    std::string latest_version;
    std::optional<std::string> download_url;
    std::optional<std::string> checksum;

    // {"update_available", "latest_version"} always; "download_url" and
    // "checksum" only when set.
    nlohmann::json ToJson() const;
};

struct UpdateCheckerOptions {
    std::string artifact_dir;
    std::string download_route;
    // Prepended to locators when non-empty, e.g. "http://ota.local:8080".
    std::string base_url;
    // Attach the SHA-256 of the offered artifact.
    bool checksum = false;
};

// Decides whether a client on |current_version| should update. Both the
// client's version and the catalog use semantic-version precedence.
// 400 if |text| is empty or not a semantic version.
std::expected<SemVer, HttpError> ParseCurrentVersion(const std::string& text);

class UpdateChecker {
  public:
    explicit UpdateChecker(UpdateCheckerOptions options);

    std::expected<CheckResponse, HttpError> Check(const std::string& current_version,
                                                  const VersionCatalog& catalog) const;
    CheckResponse Check(const SemVer& current, const VersionCatalog& catalog) const;

    std::string LocatorFor(const ArtifactFile& artifact) const;

  private:
    UpdateCheckerOptions options_;
};

} // namespace otasrv
