#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace migfetch {

class CancelContext;

class IReader {
public:
    virtual ~IReader() = default;
    // Bytes read, 0 at end of data, -1 on error.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

// Pumps r into w until end of data. Checks ctx between chunks when given.
Result CopyAll(IReader& r, IWriter& w, const CancelContext* ctx, std::uint64_t* copied = nullptr);

} // namespace migfetch
