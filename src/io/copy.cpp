#include "io/io.hpp"

#include "system/cancel_context.hpp"

#include <cerrno>
#include <vector>

namespace migfetch {

Result CopyAll(IReader& r, IWriter& w, const CancelContext* ctx, std::uint64_t* copied) {
    std::vector<std::uint8_t> buffer(256 * 1024);
    std::uint64_t total = 0;

    while (true) {
        if (ctx) {
            auto cr = ctx->Check("copy");
            if (!cr.is_ok()) return cr;
        }

        const ssize_t n = r.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::IO, errno, "read failed during copy");

        auto res = w.WriteAll({buffer.data(), static_cast<size_t>(n)});
        if (!res.is_ok()) return res;

        total += static_cast<std::uint64_t>(n);
        if (copied) *copied = total;
    }

    return Result::Ok();
}

} // namespace migfetch
