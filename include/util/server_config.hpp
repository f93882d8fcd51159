#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace otasrv::config {

struct FamilyConfig {
    std::string name;
    std::string extension = ".wasm";
    std::string check_route;
    std::string download_route;
    bool checksum = false;
};

class ServerConfig {
public:
    std::string files_dir = "./ota_files";
    std::string listen_address = "0.0.0.0";
    // 0 binds any free port.
    std::uint16_t port = 8080;
    std::string base_url;
    LogLevel log_level = LogLevel::Info;
    // 0 rescans the artifact directory on every request.
    std::uint32_t catalog_refresh_seconds = 0;
    std::vector<FamilyConfig> families = DefaultFamilies();

    // Keys absent from the file keep their defaults.
    Result LoadFile(const std::string& path);
    Result Validate() const;
    void Reset();

    static std::vector<FamilyConfig> DefaultFamilies();
};

} // namespace otasrv::config
