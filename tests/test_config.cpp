// test_config.cpp – XML codec configuration loading.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_config

#include "TDBCodec/ConfigLoader.hpp"
#include "TDBCodec/Database.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace tdb;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

static bool rejects(const std::string& xml) {
    try {
        (void)loadOptionsFromString(xml);
    } catch (const ConfigLoadError& e) {
        std::cout << "     " << e.what() << '\n';
        return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: values and defaults
// ─────────────────────────────────────────────────────────────────────────────
static void testFromString() {
    std::cout << "\n=== Test: load from string ===\n";

    ParseOptions d = loadOptionsFromString("<TdbCodec/>");
    CHECK(d.pilot_name_offset == OffsetPolicy::Offset32, "default policy Offset32");
    CHECK(!d.strict,                                    "default not strict");
    CHECK(d.log_level == Logger::kError,                "default log level error");

    ParseOptions o = loadOptionsFromString(R"(
        <TdbCodec>
          <PilotName offset="8"/>
          <Validation strict="true"/>
          <Log level="debug"/>
        </TdbCodec>)");
    CHECK(o.pilot_name_offset == OffsetPolicy::Offset8, "offset 8 -> Offset8");
    CHECK(o.strict,                                    "strict=true");
    CHECK(o.log_level == Logger::kDebug,               "level debug");

    ParseOptions o32 = loadOptionsFromString(
        R"(<TdbCodec><PilotName offset="32"/><Log level="warn"/></TdbCodec>)");
    CHECK(o32.pilot_name_offset == OffsetPolicy::Offset32, "offset 32 -> Offset32");
    CHECK(o32.log_level == Logger::kWarn,                  "level warn");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: malformed configuration
// ─────────────────────────────────────────────────────────────────────────────
static void testErrors() {
    std::cout << "\n=== Test: configuration errors ===\n";

    CHECK(rejects("<TdbCodec>"),                                           "unclosed element");
    CHECK(rejects("<Other/>"),                                             "wrong root");
    CHECK(rejects(R"(<TdbCodec><PilotName offset="16"/></TdbCodec>)"),     "offset 16");
    CHECK(rejects(R"(<TdbCodec><PilotName offset="abc"/></TdbCodec>)"),    "non-numeric offset");
    CHECK(rejects(R"(<TdbCodec><PilotName/></TdbCodec>)"),                 "missing offset");
    CHECK(rejects(R"(<TdbCodec><Validation strict="maybe"/></TdbCodec>)"), "bad bool");
    CHECK(rejects(R"(<TdbCodec><Log level="trace"/></TdbCodec>)"),         "unknown level");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: file-based loading drives a parse
// ─────────────────────────────────────────────────────────────────────────────
static void testFromFile() {
    std::cout << "\n=== Test: load from file ===\n";

    const fs::path path = fs::temp_directory_path() / "tdbcodec_test_config.xml";
    {
        std::ofstream out(path);
        out << "<TdbCodec>\n  <PilotName offset=\"8\"/>\n</TdbCodec>\n";
    }

    ParseOptions opts = loadOptions(path);
    CHECK(opts.pilot_name_offset == OffsetPolicy::Offset8, "file sets Offset8");

    Record r;
    r.flarm_id   = 0x0000AA;
    r.pilot_name = "Anna";
    r.call_sign  = "AN";
    const auto bytes = Database::build(1, {r}, OffsetPolicy::Offset8).database.serialize();

    ParseResult p = Database::parse(bytes, opts);
    CHECK(p.database.at(0x0000AA).pilot_name == "Anna", "configured policy used by parse");

    fs::remove(path);

    bool threw = false;
    try {
        (void)loadOptions(path);
    } catch (const ConfigLoadError&) {
        threw = true;
    }
    CHECK(threw, "missing file -> ConfigLoadError");
}

int main() {
    testFromString();
    testErrors();
    testFromFile();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
