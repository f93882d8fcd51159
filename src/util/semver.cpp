#include "util/semver.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>

namespace otasrv {

namespace {

bool IsDigits(std::string_view sv) {
    if (sv.empty()) return false;
    for (char c : sv) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool IsIdentChar(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

std::expected<std::uint64_t, std::string> ParseNumber(std::string_view sv, const char* what) {
    if (!IsDigits(sv)) {
        return std::unexpected(std::string(what) + " must be numeric");
    }
    if (sv.size() > 1 && sv.front() == '0') {
        return std::unexpected(std::string(what) + " has a leading zero");
    }
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return std::unexpected(std::string(what) + " is out of range");
    }
    return v;
}

std::expected<std::vector<std::string>, std::string> ParseIdentifiers(std::string_view sv,
                                                                      bool prerelease) {
    const char* what = prerelease ? "pre-release" : "build metadata";
    if (sv.empty()) {
        return std::unexpected(std::string(what) + " is empty");
    }
    std::vector<std::string> out;
    for (auto part : sv | std::views::split('.')) {
        std::string_view ident(part.begin(), part.end());
        if (ident.empty()) {
            return std::unexpected(std::string(what) + " has an empty identifier");
        }
        for (char c : ident) {
            if (!IsIdentChar(c)) {
                return std::unexpected(std::string(what) + " has an invalid character");
            }
        }
        if (prerelease && IsDigits(ident) && ident.size() > 1 && ident.front() == '0') {
            return std::unexpected("numeric pre-release identifier has a leading zero");
        }
        out.emplace_back(ident);
    }
    return out;
}

int CompareIdentifier(const std::string& lhs, const std::string& rhs) {
    const bool lnum = IsDigits(lhs);
    const bool rnum = IsDigits(rhs);
    if (lnum && rnum) {
        // No leading zeros, so a longer run is a larger number.
        if (lhs.size() != rhs.size()) return lhs.size() < rhs.size() ? -1 : 1;
        return lhs.compare(rhs) < 0 ? -1 : (lhs == rhs ? 0 : 1);
    }
    if (lnum) return -1;
    if (rnum) return 1;
    const int c = lhs.compare(rhs);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

std::string SemVer::ToString() const {
    std::string out = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    for (size_t i = 0; i < prerelease.size(); ++i) {
        out += (i == 0 ? "-" : ".");
        out += prerelease[i];
    }
    for (size_t i = 0; i < build.size(); ++i) {
        out += (i == 0 ? "+" : ".");
        out += build[i];
    }
    return out;
}

std::expected<SemVer, std::string> ParseSemVer(std::string_view text) {
    if (text.empty()) {
        return std::unexpected("empty version");
    }

    SemVer v;
    std::string_view core = text;

    if (const auto plus = core.find('+'); plus != std::string_view::npos) {
        auto build = ParseIdentifiers(core.substr(plus + 1), false);
        if (!build) return std::unexpected(build.error());
        v.build = std::move(*build);
        core = core.substr(0, plus);
    }
    if (const auto dash = core.find('-'); dash != std::string_view::npos) {
        auto pre = ParseIdentifiers(core.substr(dash + 1), true);
        if (!pre) return std::unexpected(pre.error());
        v.prerelease = std::move(*pre);
        core = core.substr(0, dash);
    }

    const auto dot1 = core.find('.');
    const auto dot2 = dot1 == std::string_view::npos ? dot1 : core.find('.', dot1 + 1);
    if (dot2 == std::string_view::npos || core.find('.', dot2 + 1) != std::string_view::npos) {
        return std::unexpected("expected MAJOR.MINOR.PATCH");
    }

    auto major = ParseNumber(core.substr(0, dot1), "major");
    if (!major) return std::unexpected(major.error());
    auto minor = ParseNumber(core.substr(dot1 + 1, dot2 - dot1 - 1), "minor");
    if (!minor) return std::unexpected(minor.error());
    auto patch = ParseNumber(core.substr(dot2 + 1), "patch");
    if (!patch) return std::unexpected(patch.error());

    v.major = *major;
    v.minor = *minor;
    v.patch = *patch;
    return v;
}

int CompareSemVer(const SemVer& lhs, const SemVer& rhs) {
    if (lhs.major != rhs.major) return lhs.major < rhs.major ? -1 : 1;
    if (lhs.minor != rhs.minor) return lhs.minor < rhs.minor ? -1 : 1;
    if (lhs.patch != rhs.patch) return lhs.patch < rhs.patch ? -1 : 1;

    // A release outranks any of its pre-releases.
    if (lhs.prerelease.empty() != rhs.prerelease.empty()) {
        return lhs.prerelease.empty() ? 1 : -1;
    }

    const size_t n = std::min(lhs.prerelease.size(), rhs.prerelease.size());
    for (size_t i = 0; i < n; ++i) {
        if (int c = CompareIdentifier(lhs.prerelease[i], rhs.prerelease[i]); c != 0) return c;
    }
    if (lhs.prerelease.size() != rhs.prerelease.size()) {
        return lhs.prerelease.size() < rhs.prerelease.size() ? -1 : 1;
    }
    return 0;
}

} // namespace otasrv
