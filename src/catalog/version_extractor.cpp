#include "catalog/version_extractor.hpp"

#include "util/path_utils.hpp"

namespace otasrv {

namespace {

std::string_view StripLastExtension(std::string_view name) {
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return name;
    return name.substr(0, dot);
}

} // namespace

std::optional<ArtifactName> ExtractArtifactName(std::string_view filename,
                                                std::string_view extension) {
    std::string_view base;
    if (extension.empty()) {
        base = StripLastExtension(filename);
    } else {
        if (!EndsWith(filename, extension)) return std::nullopt;
        base = filename.substr(0, filename.size() - extension.size());
    }

    const auto underscore = base.rfind('_');
    if (underscore == std::string_view::npos) return std::nullopt;

    const std::string_view family = base.substr(0, underscore);
    const std::string_view token = base.substr(underscore + 1);
    if (family.empty() || token.empty()) return std::nullopt;

    auto version = ParseSemVer(token);
    if (!version) return std::nullopt;

    return ArtifactName{
        .family = std::string(family),
        .token = std::string(token),
        .version = std::move(*version),
    };
}

} // namespace otasrv
