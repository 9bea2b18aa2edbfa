#pragma once
// Config.hpp – Loads BitPacket Options from an XML file.
//
//   <BitPacket>
//     <Decode padding="require-zero" trailing="reject"/>
//     <Log level="debug"/>
//   </BitPacket>
//
// Absent elements and attributes keep their defaults.

#include "BitPacket/Options.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace bitpacket {

// Thrown when the file cannot be read or holds an unknown setting.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws ConfigError on any parse or validation failure.
Options loadOptions(const std::filesystem::path& xml_path);

// Apply options.log_level to the default spdlog logger.
// Throws ConfigError for an unknown level name.
void configureLogging(const Options& options);

} // namespace bitpacket
