#include "stream/artifact_sections.hpp"

namespace dxsync {

static const ChunkType kSectionOrder[] = {
    ChunkType::kHeader, ChunkType::kLayout, ChunkType::kState, ChunkType::kCode,
};

const Blob& ArtifactSections::section(ChunkType type) const {
    static const Blob kNone;
    switch (type) {
    case ChunkType::kHeader: return header;
    case ChunkType::kLayout: return layout;
    case ChunkType::kState:  return state;
    case ChunkType::kCode:   return code;
    default:                 return kNone;
    }
}

size_t ArtifactSections::total_size() const {
    return blob_bytes(header).size() + blob_bytes(layout).size() +
           blob_bytes(state).size() + blob_bytes(code).size();
}

std::vector<uint8_t> pack_sections(const ArtifactSections& sections) {
    std::vector<uint8_t> buf;
    buf.reserve(4 * CHUNK_HEADER_SIZE + sections.total_size());
    for (ChunkType type : kSectionOrder) {
        const ByteVec& body = blob_bytes(sections.section(type));
        append_chunk(buf, type, body.data(), body.size());
    }
    return buf;
}

bool unpack_sections(const uint8_t* data, size_t size, ArtifactSections& sections) {
    ArtifactSections out;
    size_t pos = 0;
    for (ChunkType type : kSectionOrder) {
        auto hdr = decode_header(data + pos, size - pos);
        if (!hdr) return false;
        if (hdr->chunk_type != static_cast<uint8_t>(type)) return false;
        pos += CHUNK_HEADER_SIZE;
        if (hdr->length > size - pos) return false;

        Blob body = make_blob(ByteVec(data + pos, data + pos + hdr->length));
        pos += hdr->length;

        switch (type) {
        case ChunkType::kHeader: out.header = std::move(body); break;
        case ChunkType::kLayout: out.layout = std::move(body); break;
        case ChunkType::kState:  out.state = std::move(body); break;
        default:                 out.code = std::move(body); break;
        }
    }
    if (pos != size) return false;

    sections = std::move(out);
    return true;
}

} // namespace dxsync
