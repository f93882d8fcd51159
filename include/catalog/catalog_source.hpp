#pragma once

#include "catalog/version_catalog.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>

namespace otasrv {

using CatalogPtr = std::shared_ptr<const VersionCatalog>;

// Supplies the catalog a request is answered from.
class ICatalogSource {
  public:
    virtual ~ICatalogSource() = default;
    virtual Result Snapshot(CatalogPtr& out) = 0;
};

// Rescans the directory on every call.
class ScanningCatalogSource final : public ICatalogSource {
  public:
    ScanningCatalogSource(std::string dir, FamilySpec family);

    Result Snapshot(CatalogPtr& out) override;

  private:
    std::string dir_;
    FamilySpec family_;
};

// Serves the last scan until it is older than |max_age|. Files added or
// removed on disk become visible after at most |max_age|.
class CachedCatalogSource final : public ICatalogSource {
  public:
    using Clock = std::chrono::steady_clock;

    CachedCatalogSource(std::string dir, FamilySpec family, Clock::duration max_age);

    Result Snapshot(CatalogPtr& out) override;

    // Rescans now. On failure the previous snapshot is kept.
    Result Refresh();

  private:
    Result RefreshLocked(Clock::time_point now);

    std::string dir_;
    FamilySpec family_;
    Clock::duration max_age_;

    std::shared_mutex mu_;
    CatalogPtr current_;
    Clock::time_point scanned_at_{};
};

std::unique_ptr<ICatalogSource> MakeCatalogSource(const std::string& dir,
                                                  const FamilySpec& family,
                                                  std::chrono::seconds refresh_interval);

} // namespace otasrv
