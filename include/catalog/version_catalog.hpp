#pragma once

#include "util/result.hpp"
#include "util/semver.hpp"

#include <string>
#include <vector>

namespace otasrv {

struct ArtifactFile {
    std::string filename;
    std::string token;
    SemVer version;
};

// Which files of the artifact directory belong to one product line.
struct FamilySpec {
    std::string name;
    std::string extension;
};

// Artifacts of one family, ascending by version precedence.
class VersionCatalog {
  public:
    static constexpr const char* kNoVersion = "0.0.0";

    // Lists the regular files directly inside |dir|. Names that do not
    // parse or belong to another family are skipped. Fails only if the
    // directory itself cannot be read.
    static Result Scan(const std::string& dir, const FamilySpec& family, VersionCatalog& out);

    static VersionCatalog FromFiles(std::vector<ArtifactFile> files);

    const std::vector<ArtifactFile>& Entries() const { return entries_; }
    bool Empty() const { return entries_.empty(); }
    size_t Size() const { return entries_.size(); }

    const ArtifactFile* Latest() const;
    std::string LatestVersionText() const;

  private:
    std::vector<ArtifactFile> entries_;
};

} // namespace otasrv
