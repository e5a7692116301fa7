#ifndef DRAPE_SERIALIZATION_JSON_SERIALIZATION_HPP
#define DRAPE_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace drape::json {

// Bumped whenever a reader can no longer load older files
constexpr int FORMAT_VERSION = 1;

enum class FileKind {
    ClothConfig,   // geometry + simulation settings
    ClothState     // particle snapshot + published mesh
};

inline const char* to_string(FileKind kind) {
    switch (kind) {
        case FileKind::ClothConfig: return "cloth_config";
        case FileKind::ClothState: return "cloth_state";
    }
    return "unknown";
}

// Throws std::runtime_error for names that are not a FileKind
inline FileKind file_kind_from_string(const std::string& name) {
    if (name == "cloth_config") return FileKind::ClothConfig;
    if (name == "cloth_state") return FileKind::ClothState;
    throw std::runtime_error("Unknown drape file kind '" + name + "'");
}

// Top-level object of every file drape reads or writes:
//   { "format": 1, "kind": "...", "created": "...", "source": "...",
//     "settings": {...}, "stats": {...}, "data": {...} }
// Only format, kind and data are mandatory.
struct Document {
    int format = FORMAT_VERSION;
    FileKind kind = FileKind::ClothConfig;
    std::string created;
    std::string source;
    nlohmann::json settings;
    nlohmann::json stats;
    nlohmann::json data;
};

inline void to_json(nlohmann::json& j, const Document& doc) {
    j = nlohmann::json::object();
    j["format"] = doc.format;
    j["kind"] = to_string(doc.kind);
    if (!doc.created.empty()) j["created"] = doc.created;
    if (!doc.source.empty()) j["source"] = doc.source;
    if (!doc.settings.is_null()) j["settings"] = doc.settings;
    if (!doc.stats.is_null()) j["stats"] = doc.stats;
    j["data"] = doc.data;
}

inline void from_json(const nlohmann::json& j, Document& doc) {
    if (!j.is_object() || !j.contains("kind") || !j.contains("data")) {
        throw std::runtime_error("Not a drape file: 'kind' and 'data' are required");
    }
    doc.format = j.value("format", 0);
    if (doc.format != FORMAT_VERSION) {
        throw std::runtime_error("Unsupported drape file format " + std::to_string(doc.format) +
                                 " (expected " + std::to_string(FORMAT_VERSION) + ")");
    }
    doc.kind = file_kind_from_string(j.at("kind").get<std::string>());
    doc.created = j.value("created", "");
    doc.source = j.value("source", "");
    if (j.contains("settings")) doc.settings = j.at("settings");
    if (j.contains("stats")) doc.stats = j.at("stats");
    doc.data = j.at("data");
}

// UTC, e.g. 2024-05-01T12:00:00Z
inline std::string utc_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_document(const std::string& path, const Document& doc) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << nlohmann::json(doc).dump(2) << "\n";
    if (!file) {
        throw std::runtime_error("Failed writing " + path);
    }
}

// Throws when the file is unreadable, malformed, or of another kind
inline Document read_document(const std::string& path, FileKind expected) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    Document doc = nlohmann::json::parse(file).get<Document>();
    if (doc.kind != expected) {
        throw std::runtime_error(path + ": expected a " + to_string(expected) +
                                 " file, found " + to_string(doc.kind));
    }
    return doc;
}

}  // namespace drape::json

#endif // DRAPE_SERIALIZATION_JSON_SERIALIZATION_HPP
