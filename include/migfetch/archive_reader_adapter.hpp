#pragma once

#include "io/io.hpp"
#include "system/cancel_context.hpp"

#include <archive.h>

#include <string>

namespace migfetch {

// Feeds `reader` to libarchive. Reads fail with EINTR once ctx is cancelled.
int OpenArchiveFromReader(struct archive* ar, IReader& reader, const CancelContext* ctx);
std::string ArchiveErr(struct archive* ar);

} // namespace migfetch
