// Fuzz target for LLDP / CDP frame decoding
// Input is a raw Ethernet frame as delivered by the packet socket

#include "discovery/frame_codec.hpp"
#include <cstdint>
#include <cstddef>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace topowatch::discovery;

    std::span<const uint8_t> frame(data, size);

    NeighborAdvertisement adv;
    std::string error;
    bool ok = DecodeDiscoveryFrame(frame, adv, error);

    if (ok) {
        // A decoded frame always names its protocol
        if (adv.protocol != "lldp" && adv.protocol != "cdp") {
            __builtin_trap();
        }
        (void)adv.DeviceType();
    } else if (error.empty()) {
        // Failures always carry a reason
        __builtin_trap();
    }

    // Bare PDUs share the TLV walkers with the framed path
    NeighborAdvertisement lldp;
    std::string lldp_error;
    (void)DecodeLldpdu(frame, lldp, lldp_error);

    NeighborAdvertisement cdp;
    std::string cdp_error;
    (void)DecodeCdpPdu(frame, cdp, cdp_error);

    return 0;
}
