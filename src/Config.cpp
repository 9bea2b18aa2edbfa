// Config.cpp – Parses the BitPacket options XML.
// Uses pugixml, as for every other XML input of the project.

#include "BitPacket/Config.hpp"

#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include <cstring>

namespace bitpacket {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static PaddingPolicy parsePadding(const char* s) {
    if (!s || *s == '\0')                  return PaddingPolicy::Ignore;
    if (strcmp(s, "ignore")       == 0)    return PaddingPolicy::Ignore;
    if (strcmp(s, "require-zero") == 0)    return PaddingPolicy::RequireZero;
    throw ConfigError(std::string("Unknown padding policy: '") + s + "'");
}

static bool parseTrailing(const char* s) {
    if (!s || *s == '\0')            return false;
    if (strcmp(s, "accept") == 0)    return false;
    if (strcmp(s, "reject") == 0)    return true;
    throw ConfigError(std::string("Unknown trailing-bytes policy: '") + s + "'");
}

static spdlog::level::level_enum parseLevel(const std::string& s) {
    // from_str() maps every unknown name to 'off', so check explicitly.
    const auto level = spdlog::level::from_str(s);
    if (level == spdlog::level::off && s != "off")
        throw ConfigError("Unknown log level: '" + s + "'");
    return level;
}

// ─── Public entry points ──────────────────────────────────────────────────────

Options loadOptions(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw ConfigError("Failed to parse XML '" + xml_path.string() +
                          "': " + result.description());

    pugi::xml_node root = doc.child("BitPacket");
    if (!root)
        throw ConfigError("XML root element must be <BitPacket>");

    Options opts;
    if (auto decode = root.child("Decode")) {
        opts.decode.padding               = parsePadding(decode.attribute("padding").as_string(""));
        opts.decode.reject_trailing_bytes = parseTrailing(decode.attribute("trailing").as_string(""));
    }
    if (auto log = root.child("Log")) {
        if (auto a = log.attribute("level"); a) {
            opts.log_level = a.as_string();
            parseLevel(opts.log_level);
        }
    }
    return opts;
}

void configureLogging(const Options& options) {
    spdlog::set_level(parseLevel(options.log_level));
    spdlog::debug("Log level set to '{}'", options.log_level);
}

} // namespace bitpacket
