#pragma once

#include <string>
#include <utility>

namespace otasrv {

struct HttpError {
    int status = 500;
    std::string message;

    static HttpError BadRequest(std::string m) { return {400, std::move(m)}; }
    static HttpError NotFound(std::string m) { return {404, std::move(m)}; }
    static HttpError Internal(std::string m) { return {500, std::move(m)}; }
};

} // namespace otasrv
