#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/types.hpp"
#include "protocol/chunk.hpp"
#include "protocol/patch_format.hpp"
#include "stream/artifact_sections.hpp"

namespace dxsync {

// Pull-based producer of a chunk stream.
//
// The chunk sequence is planned up front from shared, immutable bodies; the
// generator only keeps a cursor. A transport pulls bytes with read() at its
// own pace and may stop between any two calls without losing position.
class StreamGenerator {
public:
    StreamGenerator() = default;

    // Header, Layout, State, Code, Eof (every section, possibly empty).
    static StreamGenerator full_stream(const ArtifactSections& sections);

    // Header, Patch, Eof.
    static StreamGenerator patch_stream(const Blob& header, const Patch& patch);
    static StreamGenerator patch_stream(const Blob& header, Blob serialized_patch);

    // Copy up to capacity bytes of the remaining stream into out.
    // Returns the number of bytes written; 0 once the stream is done.
    size_t read(uint8_t* out, size_t capacity);

    // Yield the next whole chunk. Only valid on a chunk boundary (before any
    // read() or after a read() that ended exactly on one); returns false
    // otherwise or when done.
    bool next_chunk(ChunkType& type, Blob& body);

    // Read everything that remains.
    std::vector<uint8_t> collect();

    bool done() const { return emitted_ == total_; }
    size_t total_size() const { return total_; }
    size_t remaining() const { return total_ - emitted_; }
    size_t chunk_count() const { return plan_.size(); }

private:
    struct PlannedChunk {
        ChunkType type;
        Blob body;
        uint8_t header[CHUNK_HEADER_SIZE];
    };

    std::vector<PlannedChunk> plan_;
    size_t chunk_index_ = 0;
    size_t chunk_offset_ = 0;  // within header + body of the current chunk
    size_t total_ = 0;
    size_t emitted_ = 0;

    void add(ChunkType type, Blob body);
};

} // namespace dxsync
