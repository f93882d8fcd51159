#include "server/http_server.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <span>
#include <thread>
#include <vector>

namespace otasrv {

namespace {

constexpr size_t kChunkSize = 64 * 1024;

std::string QueryParam(const httplib::Request& req, const char* key) {
    return req.has_param(key) ? req.get_param_value(key) : std::string();
}

} // namespace

OtaHttpServer::OtaHttpServer(const config::ServerConfig& cfg)
    : listen_address_(cfg.listen_address), port_(cfg.port) {
    const auto refresh = std::chrono::seconds(cfg.catalog_refresh_seconds);
    for (const auto& fc : cfg.families) {
        FamilySpec spec{.name = fc.name, .extension = fc.extension};
        families_.push_back(std::make_unique<FamilyRoutes>(FamilyRoutes{
            .name = fc.name,
            .catalog = MakeCatalogSource(cfg.files_dir, spec, refresh),
            .checker = UpdateChecker(UpdateCheckerOptions{
                .artifact_dir = cfg.files_dir,
                .download_route = fc.download_route,
                .base_url = cfg.base_url,
                .checksum = fc.checksum,
            }),
            .resolver = ArtifactResolver(cfg.files_dir, spec),
        }));
    }

    svr_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogInfo("%s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    });

    for (size_t i = 0; i < cfg.families.size(); ++i) {
        const FamilyRoutes* fam = families_[i].get();
        const auto& fc = cfg.families[i];
        svr_.Get(fc.check_route, [this, fam](const httplib::Request& req, httplib::Response& res) {
            HandleCheck(*fam, req, res);
        });
        svr_.Get(fc.download_route, [this, fam](const httplib::Request& req, httplib::Response& res) {
            HandleDownload(*fam, req, res);
        });
        LogInfo("family %s: %s, %s (%s*%s in %s)",
                fc.name.c_str(),
                fc.check_route.c_str(),
                fc.download_route.c_str(),
                fc.name.c_str(),
                fc.extension.c_str(),
                cfg.files_dir.c_str());
    }
}

Result OtaHttpServer::Bind() {
    if (port_ == 0) {
        const int port = svr_.bind_to_any_port(listen_address_);
        if (port <= 0) {
            return Result::Fail(-1, "cannot bind " + listen_address_ + " on any port");
        }
        port_ = port;
    } else if (!svr_.bind_to_port(listen_address_, port_)) {
        return Result::Fail(-1, "cannot bind " + listen_address_ + ":" + std::to_string(port_));
    }
    return Result::Ok();
}

Result OtaHttpServer::Run() {
    LogInfo("OTA server listening on %s:%d", listen_address_.c_str(), port_);
    if (!svr_.listen_after_bind()) {
        return Result::Fail(-1, "listen failed on " + listen_address_ + ":" + std::to_string(port_));
    }
    return Result::Ok();
}

void OtaHttpServer::Stop() { svr_.stop(); }

bool OtaHttpServer::WaitUntilRunning(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!svr_.is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

void OtaHttpServer::SendError(httplib::Response& res, const HttpError& error) {
    res.status = error.status;
    res.set_content(nlohmann::json{{"error", error.message}}.dump(), "application/json");
}

void OtaHttpServer::HandleCheck(const FamilyRoutes& fam,
                                const httplib::Request& req,
                                httplib::Response& res) const {
    try {
        const std::string current_text = QueryParam(req, "current_version");
        // Validated before the catalog scan.
        auto current = ParseCurrentVersion(current_text);
        if (!current) {
            SendError(res, current.error());
            return;
        }

        CatalogPtr catalog;
        if (auto r = fam.catalog->Snapshot(catalog); !r.ok) {
            LogError("%s: %s", fam.name.c_str(), r.msg.c_str());
            SendError(res, HttpError::Internal("could not fetch available versions"));
            return;
        }

        const CheckResponse resp = fam.checker.Check(*current, *catalog);
        LogDebug("%s: current=%s latest=%s update=%d",
                 fam.name.c_str(),
                 current_text.c_str(),
                 resp.latest_version.c_str(),
                 resp.update_available ? 1 : 0);
        res.status = 200;
        res.set_content(resp.ToJson().dump(), "application/json");
    } catch (const std::exception& e) {
        LogError("%s: check failed: %s", fam.name.c_str(), e.what());
        SendError(res, HttpError::Internal("internal error"));
    }
}

void OtaHttpServer::HandleDownload(const FamilyRoutes& fam,
                                   const httplib::Request& req,
                                   httplib::Response& res) const {
    try {
        auto artifact = fam.resolver.Resolve(QueryParam(req, "version"));
        if (!artifact) {
            SendError(res, artifact.error());
            return;
        }

        auto reader = std::make_shared<FileReader>();
        if (auto r = FileReader::Open(artifact->path, *reader); !r.ok) {
            LogError("%s: %s", fam.name.c_str(), r.msg.c_str());
            SendError(res, HttpError::Internal("cannot open artifact"));
            return;
        }

        // Clients that ignore this header (e.g. "curl -O") name the file after the URL instead.
        res.set_header("Content-Disposition", "attachment; filename=\"" + artifact->filename + "\"");
        const char* content_type = ContentTypeFor(artifact->filename);
        res.status = 200;

        if (reader->Size() == 0) {
            res.set_content(std::string(), content_type);
            return;
        }

        res.set_content_provider(
            static_cast<size_t>(reader->Size()),
            content_type,
            [reader](size_t offset, size_t length, httplib::DataSink& sink) {
                std::vector<std::uint8_t> buf(std::min(length, kChunkSize));
                const ssize_t n = reader->ReadAt(offset, std::span<std::uint8_t>(buf.data(), buf.size()));
                if (n <= 0) {
                    LogError("read failed at offset %zu: %s", offset, reader->Path().c_str());
                    return false;
                }
                return sink.write(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
            });
    } catch (const std::exception& e) {
        LogError("%s: download failed: %s", fam.name.c_str(), e.what());
        SendError(res, HttpError::Internal("internal error"));
    }
}

} // namespace otasrv
