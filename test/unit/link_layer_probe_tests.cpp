// Unit tests for the passive LLDP/CDP listener probe
#include <catch2/catch_all.hpp>
#include "discovery/link_layer_probe.hpp"
#include "infra/fake_frame_source.hpp"
#include "infra/frame_builder.hpp"

using namespace topowatch::discovery;
using namespace topowatch::test;

namespace {

const Mac kNeighborPort = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0x01};
const Mac kNeighborChassis = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};

Target ListenTarget() {
    Target target;
    target.id = "if:eth0";
    target.interface = "eth0";
    target.network = "lab";
    return target;
}

CancellationToken RoundToken() {
    return CancellationToken::WithDeadline(CancellationToken::Clock::now() + std::chrono::seconds(30));
}

} // namespace

TEST_CASE("LinkLayerListenerProbe turns advertisements into links", "[discovery][lldp]") {
    auto script = std::make_shared<FakeFrameSource::Script>();
    script->local_mac = "02:00:00:00:00:10";
    script->local_hostname = "collector";
    auto sw1_frame = LldpBuilder()
                         .ChassisMac(kNeighborChassis)
                         .PortName("Gi1/0/24")
                         .Ttl(120)
                         .SystemName("sw1")
                         .SystemDescription("Cisco IOS Software, C2960X\nTechnical Support")
                         .Capabilities(lldp::CAP_BRIDGE, lldp::CAP_BRIDGE)
                         .ManagementIpv4({10, 0, 0, 2})
                         .Frame(kNeighborPort);
    script->frames.push_back(sw1_frame);
    // Periodic re-advertisement: still one observation
    script->frames.push_back(sw1_frame);
    // Truncated frame is dropped
    script->frames.push_back(Bytes{0x01, 0x80, 0xc2, 0x00, 0x00, 0x0e, 0, 0, 0, 0, 0, 1, 0x88, 0xcc, 0x02});
    script->frames.push_back(CdpBuilder()
                                 .DeviceId("rtr1")
                                 .PortId("GigabitEthernet0/0/0")
                                 .Platform("cisco ISR4331")
                                 .Capabilities(cdp::CAP_ROUTER)
                                 .Frame(Mac{0x00, 0x1b, 0x2c, 0x3d, 0x4e, 0x5f}));

    LinkLayerListenerProbe probe(FrameSourceFor(script));
    auto result = probe.Run(ListenTarget(), std::chrono::seconds(5), RoundToken());

    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(script->opened_interface == "eth0");
    REQUIRE(result.observations.size() == 2);

    for (const auto &record : result.observations) {
        REQUIRE(record.is_link());
        REQUIRE(record.source_probe == "lldp");
        REQUIRE(record.probe_kind == ProbeKind::LINK_LAYER_LISTENER);
        REQUIRE(record.confidence_hint == Catch::Approx(0.4));
        REQUIRE(record.payload.at(fields::MAC) == "02:00:00:00:00:10");
        REQUIRE(record.payload.at(fields::HOSTNAME) == "collector");
        REQUIRE(record.payload.at(fields::PORT) == "eth0");
        REQUIRE(record.payload.at(fields::NETWORK) == "lab");
    }

    // Ordered by (chassis id, port id): "aa:bb..." before "rtr1"
    const auto &sw1 = *result.observations[0].peer;
    REQUIRE(sw1.at(fields::MAC) == "aa:bb:cc:dd:ee:ff");
    REQUIRE(sw1.count(fields::VENDOR_ID) == 0);
    REQUIRE(sw1.at(fields::IP) == "10.0.0.2");
    REQUIRE(sw1.at(fields::HOSTNAME) == "sw1");
    REQUIRE(sw1.at(fields::PORT) == "Gi1/0/24");
    REQUIRE(sw1.at(fields::DEVICE_TYPE) == "switch");

    const auto &rtr1 = *result.observations[1].peer;
    // CDP carries no chassis MAC: source MAC plus a protocol scoped vendor id
    REQUIRE(rtr1.at(fields::MAC) == "00:1b:2c:3d:4e:5f");
    REQUIRE(rtr1.at(fields::VENDOR_ID) == "cdp:rtr1");
    REQUIRE(rtr1.at(fields::MODEL) == "cisco ISR4331");
    REQUIRE(rtr1.at(fields::DEVICE_TYPE) == "router");
    REQUIRE(rtr1.at(fields::VENDOR) == "Cisco");
}

TEST_CASE("LinkLayerListenerProbe keeps the latest advertisement", "[discovery][lldp]") {
    auto script = std::make_shared<FakeFrameSource::Script>();
    script->frames.push_back(LldpBuilder()
                                 .ChassisMac(kNeighborChassis)
                                 .PortName("ether1")
                                 .Ttl(120)
                                 .SystemName("old-name")
                                 .Frame(kNeighborPort));
    script->frames.push_back(LldpBuilder()
                                 .ChassisMac(kNeighborChassis)
                                 .PortName("ether1")
                                 .Ttl(120)
                                 .SystemName("new-name")
                                 .SystemDescription("MikroTik RouterOS 7.11\nextra")
                                 .Frame(kNeighborPort));

    LinkLayerListenerProbe probe(FrameSourceFor(script));
    auto result = probe.Run(ListenTarget(), std::chrono::seconds(5), RoundToken());

    REQUIRE(result.observations.size() == 1);
    const auto &peer = *result.observations[0].peer;
    REQUIRE(peer.at(fields::HOSTNAME) == "new-name");
    REQUIRE(peer.at(fields::OS_VERSION) == "MikroTik RouterOS 7.11");
    REQUIRE(peer.at(fields::VENDOR) == "MikroTik");
}

TEST_CASE("LinkLayerListenerProbe errors", "[discovery][lldp]") {
    SECTION("Target without interface") {
        auto script = std::make_shared<FakeFrameSource::Script>();
        LinkLayerListenerProbe probe(FrameSourceFor(script));
        Target target;
        target.id = "10.0.0.5";
        target.address = "10.0.0.5";
        auto result = probe.Run(target, std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error->code == ProbeErrorCode::INTERNAL);
    }

    SECTION("Socket cannot be opened") {
        auto script = std::make_shared<FakeFrameSource::Script>();
        script->open_error = ProbeError{ProbeErrorCode::AUTH_FAILURE, "operation not permitted"};
        LinkLayerListenerProbe probe(FrameSourceFor(script));
        auto result = probe.Run(ListenTarget(), std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error->code == ProbeErrorCode::AUTH_FAILURE);
        REQUIRE(result.observations.empty());
    }

    SECTION("Cancellation returns what was heard") {
        auto script = std::make_shared<FakeFrameSource::Script>();
        script->frames.push_back(
            LldpBuilder().ChassisMac(kNeighborChassis).PortName("ether1").Ttl(120).Frame(kNeighborPort));
        script->final_error = ProbeError{ProbeErrorCode::TIMEOUT, "cancelled"};
        LinkLayerListenerProbe probe(FrameSourceFor(script));
        auto result = probe.Run(ListenTarget(), std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error->code == ProbeErrorCode::TIMEOUT);
        REQUIRE(result.observations.size() == 1);
    }
}
