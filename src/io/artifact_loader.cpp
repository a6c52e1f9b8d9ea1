#include "io/artifact_loader.hpp"

#include <json/json.h>

#include <memory>
#include <sys/stat.h>

#include "io/file_io.hpp"

namespace dxsync {

static const ChunkType kSectionTypes[] = {
    ChunkType::kHeader, ChunkType::kLayout, ChunkType::kState, ChunkType::kCode,
};

const std::string& ArtifactLayout::file_for(ChunkType type) const {
    switch (type) {
    case ChunkType::kLayout: return layout;
    case ChunkType::kState:  return state;
    case ChunkType::kCode:   return code;
    default:                 return header;
    }
}

static std::string& file_slot(ArtifactLayout& layout, ChunkType type) {
    switch (type) {
    case ChunkType::kLayout: return layout.layout;
    case ChunkType::kState:  return layout.state;
    case ChunkType::kCode:   return layout.code;
    default:                 return layout.header;
    }
}

static const char* section_key(ChunkType type) {
    switch (type) {
    case ChunkType::kLayout: return "layout";
    case ChunkType::kState:  return "state";
    case ChunkType::kCode:   return "code";
    default:                 return "header";
    }
}

bool load_manifest(const std::string& dir, ArtifactLayout& layout,
                   std::string& error_msg) {
    std::string path = join_path(dir, ARTIFACT_MANIFEST_NAME);
    if (!file_exists(path)) return true;

    std::string text;
    if (!read_file_string(path, text, error_msg)) return false;

    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    Json::Value root;
    std::string parse_errors;
    if (!reader->parse(text.c_str(), text.c_str() + text.size(),
                       &root, &parse_errors)) {
        error_msg = "Invalid " + path + ": " + parse_errors;
        return false;
    }
    if (!root.isObject()) {
        error_msg = "Invalid " + path + ": expected a JSON object";
        return false;
    }

    for (ChunkType type : kSectionTypes) {
        const char* key = section_key(type);
        if (!root.isMember(key)) continue;
        const Json::Value& v = root[key];
        if (!v.isString() || v.asString().empty()) {
            error_msg = "Invalid " + path + ": \"" + key + "\" must be a file name";
            return false;
        }
        file_slot(layout, type) = v.asString();
    }
    return true;
}

bool load_sections(const std::string& dir, ArtifactSections& sections,
                   std::string& error_msg) {
    if (!dir_exists(dir)) {
        error_msg = "Artifact directory not found: " + dir;
        return false;
    }

    ArtifactLayout layout;
    if (!load_manifest(dir, layout, error_msg)) return false;

    ArtifactSections loaded;
    int found = 0;
    for (ChunkType type : kSectionTypes) {
        std::string path = join_path(dir, layout.file_for(type));
        ByteVec bytes;
        if (file_exists(path)) {
            if (!read_file(path, bytes, error_msg)) return false;
            found++;
        }
        Blob blob = make_blob(std::move(bytes));
        switch (type) {
        case ChunkType::kHeader: loaded.header = blob; break;
        case ChunkType::kLayout: loaded.layout = blob; break;
        case ChunkType::kState:  loaded.state = blob; break;
        default:                 loaded.code = blob; break;
        }
    }

    if (found == 0) {
        error_msg = "No section files in artifact directory: " + dir;
        return false;
    }
    sections = std::move(loaded);
    return true;
}

bool write_sections(const std::string& dir, const ArtifactSections& sections,
                    std::string& error_msg) {
    if (!make_dirs(dir, error_msg)) return false;

    ArtifactLayout layout;
    for (ChunkType type : kSectionTypes) {
        const ByteVec& bytes = blob_bytes(sections.section(type));
        if (!write_file(join_path(dir, layout.file_for(type)), bytes, error_msg)) {
            return false;
        }
    }
    return true;
}

uint64_t artifact_fingerprint(const std::string& dir) {
    ArtifactLayout layout;
    std::string ignored;
    if (!load_manifest(dir, layout, ignored)) return 0;

    uint64_t fp = 0;
    bool any = false;
    for (ChunkType type : kSectionTypes) {
        std::string path = join_path(dir, layout.file_for(type));
        struct stat st;
        if (::stat(path.c_str(), &st) != 0) continue;
        any = true;
        fp = fp * 1000003u + static_cast<uint64_t>(file_mtime_ns(path));
        fp = fp * 1000003u + static_cast<uint64_t>(st.st_size);
    }
    uint64_t manifest_mtime = static_cast<uint64_t>(
        file_mtime_ns(join_path(dir, ARTIFACT_MANIFEST_NAME)));
    fp ^= manifest_mtime;
    return any ? (fp == 0 ? 1 : fp) : 0;
}

} // namespace dxsync
