#pragma once

#include "catalog/version_catalog.hpp"
#include "server/http_error.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace otasrv {

struct ResolvedArtifact {
    std::string filename;
    std::string path;
    std::uint64_t size = 0;
};

// Maps a requested version to "<artifact_dir>/<family>_<version><extension>".
class ArtifactResolver {
  public:
    ArtifactResolver(std::string artifact_dir, FamilySpec family);

    std::string FilenameFor(std::string_view version) const;

    // 400 for an empty version or one containing a path separator (checked
    // before the filesystem is touched), 404 if no such file, 400 if the
    // path is not a regular file, 500 for any other stat failure.
    std::expected<ResolvedArtifact, HttpError> Resolve(const std::string& version) const;

  private:
    std::string artifact_dir_;
    FamilySpec family_;
};

// MIME type by filename extension; application/octet-stream if unknown.
const char* ContentTypeFor(std::string_view filename);

} // namespace otasrv
