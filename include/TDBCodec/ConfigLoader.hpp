#pragma once
// ConfigLoader.hpp – Parses an XML codec configuration into ParseOptions.
//
//   <TdbCodec>
//     <PilotName offset="32"/>      32 (default) or 8
//     <Validation strict="false"/>
//     <Log level="warn"/>           error | warn | info | debug
//   </TdbCodec>
//
// Missing elements keep the ParseOptions defaults.

#include "Types.hpp"

#include <filesystem>
#include <stdexcept>
#include <string_view>

namespace tdb {

// Thrown when the XML is malformed or holds an unsupported value.
class ConfigLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

ParseOptions loadOptions(const std::filesystem::path& xml_path);

ParseOptions loadOptionsFromString(std::string_view xml);

} // namespace tdb
