#pragma once

#include "catalog/catalog_source.hpp"
#include "server/artifact_resolver.hpp"
#include "server/update_checker.hpp"
#include "util/result.hpp"
#include "util/server_config.hpp"

#include <httplib.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace otasrv {

// One check route and one download route per configured family.
class OtaHttpServer {
  public:
    explicit OtaHttpServer(const config::ServerConfig& cfg);

    OtaHttpServer(const OtaHttpServer&) = delete;
    OtaHttpServer& operator=(const OtaHttpServer&) = delete;

    Result Bind();
    // Blocks until Stop().
    Result Run();
    void Stop();

    int Port() const { return port_; }
    bool WaitUntilRunning(std::chrono::milliseconds timeout);

  private:
    struct FamilyRoutes {
        std::string name;
        std::unique_ptr<ICatalogSource> catalog;
        UpdateChecker checker;
        ArtifactResolver resolver;
    };

    void HandleCheck(const FamilyRoutes& fam, const httplib::Request& req, httplib::Response& res) const;
    void HandleDownload(const FamilyRoutes& fam, const httplib::Request& req, httplib::Response& res) const;

    static void SendError(httplib::Response& res, const HttpError& error);

    std::string listen_address_;
    int port_ = 0;
    std::vector<std::unique_ptr<FamilyRoutes>> families_;
    httplib::Server svr_;
};

} // namespace otasrv
