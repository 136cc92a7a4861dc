#include "migfetch/archive_reader_adapter.hpp"

#include <cerrno>
#include <vector>

namespace migfetch {

namespace {

struct ReaderCtx {
    IReader* reader = nullptr;
    const CancelContext* cancel = nullptr;
    std::vector<std::uint8_t> buffer;

    ReaderCtx(IReader& in, const CancelContext* ctx, size_t buffer_size = 64 * 1024)
        : reader(&in), cancel(ctx), buffer(buffer_size) {}
};

la_ssize_t ReadCb(struct archive* ar, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ReaderCtx*>(client_data);
    if (ctx->cancel && ctx->cancel->IsCancelled()) {
        archive_set_error(ar, EINTR, "operation cancelled");
        return -1;
    }

    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) {
        archive_set_error(ar, EIO, "archive source read failed");
        return -1;
    }

    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

int CloseCb(struct archive*, void* client_data) {
    delete static_cast<ReaderCtx*>(client_data);
    return ARCHIVE_OK;
}

} // namespace

int OpenArchiveFromReader(struct archive* ar, IReader& reader, const CancelContext* ctx) {
    // libarchive owns rctx from here on and frees it through CloseCb, also
    // when opening fails.
    auto* rctx = new ReaderCtx(reader, ctx);
    return archive_read_open2(ar, rctx, nullptr, ReadCb, nullptr, CloseCb);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace migfetch
