#pragma once

#include "stream/chunk_dispatcher.hpp"

namespace dxsync {

// Whether a stream that failed with status should be requested again in full.
// Only a client that sent a base can be served differently the second time.
// Protocol errors are retried only for patch responses: a Patch chunk covers
// the whole artifact and may exceed the reader's chunk limit when no single
// section does.
inline bool retry_as_full(DispatchStatus status, bool had_base, bool patch_response) {
    if (status == DispatchStatus::kOk || !had_base) return false;
    if (status == DispatchStatus::kProtocolError) return patch_response;
    return true;
}

} // namespace dxsync
