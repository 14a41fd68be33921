// ConfigLoader.cpp – Parses the codec XML configuration into ParseOptions.
// Uses pugixml, like the rest of the XML handling in this code base.

#include "TDBCodec/ConfigLoader.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstring>
#include <string>

namespace tdb {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static uint64_t parseU64(const char* s, const char* ctx) {
    uint64_t v = 0;
    const char* end = s + std::strlen(s);
    auto [ptr, ec] = std::from_chars(s, end, v);
    if (ec != std::errc{} || ptr != end)
        throw ConfigLoadError(std::string(ctx) + ": cannot parse uint '" + s + "'");
    return v;
}

static bool parseBool(const char* s, const char* ctx) {
    if (strcmp(s, "true")  == 0 || strcmp(s, "1") == 0) return true;
    if (strcmp(s, "false") == 0 || strcmp(s, "0") == 0) return false;
    throw ConfigLoadError(std::string(ctx) + ": expected true/false, got '" + s + "'");
}

static OffsetPolicy parseOffset(const char* s) {
    switch (parseU64(s, "PilotName.offset")) {
    case 32: return OffsetPolicy::Offset32;
    case 8:  return OffsetPolicy::Offset8;
    default:
        throw ConfigLoadError(std::string("PilotName.offset must be 32 or 8, got '") + s + "'");
    }
}

static Logger::Level parseLevel(const char* s) {
    if (strcmp(s, "error") == 0) return Logger::kError;
    if (strcmp(s, "warn")  == 0) return Logger::kWarn;
    if (strcmp(s, "info")  == 0) return Logger::kInfo;
    if (strcmp(s, "debug") == 0) return Logger::kDebug;
    throw ConfigLoadError(std::string("Unknown log level: '") + s + "'");
}

// ─── Shared document walk ─────────────────────────────────────────────────────

static ParseOptions parseDocument(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("TdbCodec");
    if (!root)
        throw ConfigLoadError("XML root element must be <TdbCodec>");

    ParseOptions opts;

    if (auto pilot = root.child("PilotName")) {
        auto a = pilot.attribute("offset");
        if (!a)
            throw ConfigLoadError("<PilotName> missing 'offset' attribute");
        opts.pilot_name_offset = parseOffset(a.as_string());
    }

    if (auto val = root.child("Validation"); val) {
        if (auto a = val.attribute("strict"); a)
            opts.strict = parseBool(a.as_string(), "Validation.strict");
    }

    if (auto log = root.child("Log"); log) {
        if (auto a = log.attribute("level"); a)
            opts.log_level = parseLevel(a.as_string());
    }

    return opts;
}

// ─── Public entry points ──────────────────────────────────────────────────────

ParseOptions loadOptions(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw ConfigLoadError("Failed to parse XML '" + xml_path.string() +
                              "': " + result.description());
    return parseDocument(doc);
}

ParseOptions loadOptionsFromString(std::string_view xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result)
        throw ConfigLoadError(std::string("Failed to parse XML: ") + result.description());
    return parseDocument(doc);
}

} // namespace tdb
