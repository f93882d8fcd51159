#include "catalog/catalog_source.hpp"

#include "util/logger.hpp"

#include <mutex>

namespace otasrv {

ScanningCatalogSource::ScanningCatalogSource(std::string dir, FamilySpec family)
    : dir_(std::move(dir)), family_(std::move(family)) {}

Result ScanningCatalogSource::Snapshot(CatalogPtr& out) {
    auto catalog = std::make_shared<VersionCatalog>();
    if (auto r = VersionCatalog::Scan(dir_, family_, *catalog); !r.ok) return r;
    out = std::move(catalog);
    return Result::Ok();
}

CachedCatalogSource::CachedCatalogSource(std::string dir, FamilySpec family, Clock::duration max_age)
    : dir_(std::move(dir)), family_(std::move(family)), max_age_(max_age) {}

Result CachedCatalogSource::Snapshot(CatalogPtr& out) {
    const auto now = Clock::now();
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        if (current_ && now - scanned_at_ < max_age_) {
            out = current_;
            return Result::Ok();
        }
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    // Another request may have refreshed while we waited for the lock.
    if (!current_ || now - scanned_at_ >= max_age_) {
        if (auto r = RefreshLocked(now); !r.ok) return r;
    }
    out = current_;
    return Result::Ok();
}

Result CachedCatalogSource::Refresh() {
    std::unique_lock<std::shared_mutex> lk(mu_);
    return RefreshLocked(Clock::now());
}

Result CachedCatalogSource::RefreshLocked(Clock::time_point now) {
    auto catalog = std::make_shared<VersionCatalog>();
    if (auto r = VersionCatalog::Scan(dir_, family_, *catalog); !r.ok) return r;
    LogDebug("catalog %s refreshed: %zu artifact(s)", family_.name.c_str(), catalog->Size());
    current_ = std::move(catalog);
    scanned_at_ = now;
    return Result::Ok();
}

std::unique_ptr<ICatalogSource> MakeCatalogSource(const std::string& dir,
                                                  const FamilySpec& family,
                                                  std::chrono::seconds refresh_interval) {
    if (refresh_interval.count() <= 0) {
        return std::make_unique<ScanningCatalogSource>(dir, family);
    }
    return std::make_unique<CachedCatalogSource>(dir, family, refresh_interval);
}

} // namespace otasrv
