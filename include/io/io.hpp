#pragma once

#include <cstdint>
#include <span>
#include <sys/types.h>

namespace otasrv {

class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
};

} // namespace otasrv
