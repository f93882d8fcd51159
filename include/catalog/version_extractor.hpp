#pragma once

#include "util/semver.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace otasrv {

// "<family>_<token><extension>" taken apart.
struct ArtifactName {
    std::string family;
    std::string token;
    SemVer version;
};

// Splits a filename at its last underscore after removing the extension.
// With an empty |extension| the last ".ext" is removed; otherwise the name
// must end with |extension| (which may span several dots, e.g. ".tar.gz").
// Returns nullopt for names that do not follow the convention or whose
// token is not a semantic version.
std::optional<ArtifactName> ExtractArtifactName(std::string_view filename,
                                                std::string_view extension = {});

} // namespace otasrv
