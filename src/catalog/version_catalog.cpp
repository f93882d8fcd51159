#include "catalog/version_catalog.hpp"

#include "catalog/version_extractor.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace otasrv {

namespace fs = std::filesystem;

Result VersionCatalog::Scan(const std::string& dir, const FamilySpec& family, VersionCatalog& out) {
    out.entries_.clear();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot read artifact directory " + dir + ": " + ec.message());
    }

    std::vector<ArtifactFile> files;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;

        // Follows symlinks; dangling links and subdirectories are skipped.
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        const std::string filename = it->path().filename().string();
        auto name = ExtractArtifactName(filename, family.extension);
        if (!name) {
            LogDebug("skipping %s: not <family>_<semver>%s", filename.c_str(), family.extension.c_str());
            continue;
        }
        if (name->family != family.name) continue;

        files.push_back(ArtifactFile{
            .filename = filename,
            .token = std::move(name->token),
            .version = std::move(name->version),
        });
    }
    if (ec) {
        return Result::Fail(ec.value(), "error listing artifact directory " + dir + ": " + ec.message());
    }

    out = FromFiles(std::move(files));
    return Result::Ok();
}

VersionCatalog VersionCatalog::FromFiles(std::vector<ArtifactFile> files) {
    // Directory order is unspecified; fix it before the stable version sort.
    std::sort(files.begin(), files.end(), [](const ArtifactFile& a, const ArtifactFile& b) {
        return a.filename < b.filename;
    });
    std::stable_sort(files.begin(), files.end(), [](const ArtifactFile& a, const ArtifactFile& b) {
        return a.version < b.version;
    });

    VersionCatalog catalog;
    catalog.entries_ = std::move(files);
    return catalog;
}

const ArtifactFile* VersionCatalog::Latest() const {
    if (entries_.empty()) return nullptr;
    return &entries_.back();
}

std::string VersionCatalog::LatestVersionText() const {
    const ArtifactFile* latest = Latest();
    return latest ? latest->token : std::string(kNoVersion);
}

} // namespace otasrv
