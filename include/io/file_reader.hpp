#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace otasrv {

// Read-only regular file. Read() advances an internal cursor; ReadAt() does
// not, so concurrent ReadAt() calls on one reader are safe.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    const std::string& Path() const { return path_; }
    std::uint64_t Size() const { return size_; }

    ssize_t Read(std::span<std::uint8_t> out) override;
    ssize_t ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const;

private:
    std::string path_;
    Fd fd_;
    std::uint64_t size_ = 0;
};

} // namespace otasrv
