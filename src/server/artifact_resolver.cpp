#include "server/artifact_resolver.hpp"

#include "util/path_utils.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <utility>

namespace otasrv {

ArtifactResolver::ArtifactResolver(std::string artifact_dir, FamilySpec family)
    : artifact_dir_(std::move(artifact_dir)), family_(std::move(family)) {}

std::string ArtifactResolver::FilenameFor(std::string_view version) const {
    std::string name = family_.name;
    name.push_back('_');
    name.append(version);
    name.append(family_.extension);
    return name;
}

std::expected<ResolvedArtifact, HttpError> ArtifactResolver::Resolve(const std::string& version) const {
    if (version.empty()) {
        return std::unexpected(HttpError::BadRequest("version is required"));
    }
    if (ContainsPathSeparator(version)) {
        return std::unexpected(HttpError::BadRequest("invalid version"));
    }

    ResolvedArtifact out;
    out.filename = FilenameFor(version);
    out.path = JoinPath(artifact_dir_, out.filename);

    struct stat st{};
    if (::stat(out.path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return std::unexpected(HttpError::NotFound("version not found"));
        }
        return std::unexpected(HttpError::Internal("cannot stat " + out.filename + ": " + std::strerror(errno)));
    }
    if (S_ISDIR(st.st_mode)) {
        return std::unexpected(HttpError::BadRequest("requested artifact is a directory"));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(HttpError::BadRequest("requested artifact is not a regular file"));
    }

    out.size = static_cast<std::uint64_t>(st.st_size);
    return out;
}

const char* ContentTypeFor(std::string_view filename) {
    static constexpr std::array<std::pair<std::string_view, const char*>, 8> kTypes{{
        {".wasm", "application/wasm"},
        {".zip", "application/zip"},
        {".tar.gz", "application/gzip"},
        {".tgz", "application/gzip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".json", "application/json"},
        {".txt", "text/plain"},
    }};
    for (const auto& [ext, type] : kTypes) {
        if (EndsWith(filename, ext)) return type;
    }
    return "application/octet-stream";
}

} // namespace otasrv
