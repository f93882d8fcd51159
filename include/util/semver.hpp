#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace otasrv {

// MAJOR.MINOR.PATCH[-prerelease][+build], SemVer 2.0.0 rules.
struct SemVer {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::vector<std::string> prerelease;
    std::vector<std::string> build;

    std::string ToString() const;
};

std::expected<SemVer, std::string> ParseSemVer(std::string_view text);

// Precedence comparison; build metadata is ignored. Returns <0, 0 or >0.
int CompareSemVer(const SemVer& lhs, const SemVer& rhs);

inline bool operator<(const SemVer& lhs, const SemVer& rhs) { return CompareSemVer(lhs, rhs) < 0; }
inline bool operator>(const SemVer& lhs, const SemVer& rhs) { return CompareSemVer(lhs, rhs) > 0; }
inline bool operator==(const SemVer& lhs, const SemVer& rhs) { return CompareSemVer(lhs, rhs) == 0; }

} // namespace otasrv
