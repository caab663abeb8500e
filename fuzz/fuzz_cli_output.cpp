// Fuzz target for CLI text parsing
// show version / show cdp neighbors detail output from untrusted devices

#include "discovery/cli_parser.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace topowatch::discovery;

    std::string text(reinterpret_cast<const char *>(data), size);

    CliDeviceInfo info = ParseShowVersion(text);
    (void)info.empty();

    for (const auto &neighbor : ParseCdpNeighborsDetail(text)) {
        // Blocks without a Device ID are dropped by the parser
        if (neighbor.device_id.empty()) {
            __builtin_trap();
        }
        (void)DeviceTypeFromCapabilities(neighbor.capabilities);
    }

    (void)HostnameFromPrompt(text);

    return 0;
}
