// Unit tests for the RouterOS API probe
#include <catch2/catch_all.hpp>
#include "discovery/routeros_api.hpp"
#include "infra/scripted_stream.hpp"

using namespace topowatch::discovery;
using routeros::EncodeSentence;
using topowatch::test::FactoryFor;
using topowatch::test::ScriptedStream;

namespace {

Target RouterTarget() {
    Target target;
    target.id = "10.0.0.1";
    target.address = "10.0.0.1";
    target.credentials = Credentials{"api", "s3cret"};
    target.network = "branch";
    return target;
}

std::shared_ptr<ScriptedStream> RouterSession() {
    auto stream = std::make_shared<ScriptedStream>();
    stream->Then("/login", EncodeSentence({"!done"}))
        .Then("/system/identity/print", EncodeSentence({"!re", "=name=core-rtr"}) +
                                            EncodeSentence({"!done"}))
        .Then("/system/resource/print",
              EncodeSentence({"!re", "=board-name=CCR2004-1G-12S+2XS", "=version=7.11.2 (stable)"}) +
                  EncodeSentence({"!done"}))
        .Then("/system/routerboard/print",
              EncodeSentence({"!re", "=routerboard=true", "=serial-number=HD1081A2B3C"}) +
                  EncodeSentence({"!done"}))
        .Then("/interface/print",
              EncodeSentence({"!re", "=name=bridge1", "=type=bridge", "=mac-address=11:22:33:44:55:00"}) +
                  EncodeSentence({"!re", "=name=ether1", "=type=ether", "=mac-address=11:22:33:44:55:01"}) +
                  EncodeSentence({"!done"}))
        .Then("/ip/neighbor/print",
              EncodeSentence({"!re", "=interface=ether2,bridge1", "=mac-address=AA:BB:CC:DD:EE:FF",
                              "=address4=10.0.0.2", "=identity=sw1", "=platform=Cisco",
                              "=board=WS-C2960X", "=interface-name=GigabitEthernet1/0/2",
                              "=system-caps-enabled=bridge"}) +
                  EncodeSentence({"!re", "=interface=ether3", "=mac-address=DE:AD:BE:EF:00:01",
                                  "=address=10.0.0.9", "=identity=edge-ap", "=platform=MikroTik",
                                  "=system-caps=wlan-ap,router"}) +
                  EncodeSentence({"!done"}));
    return stream;
}

CancellationToken RoundToken() {
    return CancellationToken::WithDeadline(CancellationToken::Clock::now() + std::chrono::seconds(30));
}

} // namespace

TEST_CASE("VendorApiProbe reads identity, resources and neighbors", "[discovery][routeros]") {
    auto stream = RouterSession();
    VendorApiProbe probe(FactoryFor(stream));

    auto result = probe.Run(RouterTarget(), std::chrono::seconds(5), RoundToken());

    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(stream->connected_port() == routeros::DEFAULT_PORT);
    REQUIRE(stream->closed());
    REQUIRE(result.observations.size() == 3);

    const auto &device = result.observations[0];
    REQUIRE_FALSE(device.is_link());
    REQUIRE(device.probe_kind == ProbeKind::VENDOR_API);
    REQUIRE(device.confidence_hint == Catch::Approx(0.95));
    REQUIRE(device.payload.at(fields::HOSTNAME) == "core-rtr");
    // First ethernet port, not the bridge
    REQUIRE(device.payload.at(fields::MAC) == "11:22:33:44:55:01");
    REQUIRE(device.payload.at(fields::VENDOR_ID) == "serial:HD1081A2B3C");
    REQUIRE(device.payload.at(fields::VENDOR) == "MikroTik");
    REQUIRE(device.payload.at(fields::DEVICE_TYPE) == "router");
    REQUIRE(device.payload.at(fields::MODEL) == "CCR2004-1G-12S+2XS");
    REQUIRE(device.payload.at(fields::OS_VERSION) == "7.11.2 (stable)");
    REQUIRE(device.payload.at(fields::NETWORK) == "branch");

    const auto &sw1 = result.observations[1];
    REQUIRE(sw1.is_link());
    REQUIRE(sw1.confidence_hint == Catch::Approx(0.7));
    REQUIRE(sw1.payload.at(fields::PORT) == "ether2");
    REQUIRE(sw1.payload.count(fields::MODEL) == 0);
    REQUIRE(sw1.peer->at(fields::MAC) == "AA:BB:CC:DD:EE:FF");
    REQUIRE(sw1.peer->at(fields::IP) == "10.0.0.2");
    REQUIRE(sw1.peer->at(fields::HOSTNAME) == "sw1");
    REQUIRE(sw1.peer->at(fields::PORT) == "GigabitEthernet1/0/2");
    REQUIRE(sw1.peer->at(fields::VENDOR) == "Cisco");
    REQUIRE(sw1.peer->at(fields::DEVICE_TYPE) == "switch");

    const auto &ap = result.observations[2];
    REQUIRE(ap.payload.at(fields::PORT) == "ether3");
    REQUIRE(ap.peer->at(fields::IP) == "10.0.0.9");
    REQUIRE(ap.peer->at(fields::DEVICE_TYPE) == "router");
}

TEST_CASE("VendorApiProbe failures", "[discovery][routeros]") {
    SECTION("Credentials are mandatory") {
        VendorApiProbe probe(FactoryFor(std::make_shared<ScriptedStream>()));
        Target target = RouterTarget();
        target.credentials.reset();
        auto result = probe.Run(target, std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error->code == ProbeErrorCode::AUTH_FAILURE);
        REQUIRE(result.observations.empty());
    }

    SECTION("Bad password") {
        auto stream = std::make_shared<ScriptedStream>();
        stream->Then("/login", EncodeSentence({"!trap", "=message=invalid user name or password (6)"}) +
                                   EncodeSentence({"!done"}));
        VendorApiProbe probe(FactoryFor(stream));
        auto result = probe.Run(RouterTarget(), std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error->code == ProbeErrorCode::AUTH_FAILURE);
        REQUIRE(stream->closed());
    }

    SECTION("Neighbor query trapped keeps the device record") {
        auto stream = std::make_shared<ScriptedStream>();
        stream->Then("/login", EncodeSentence({"!done"}))
            .Then("/system/identity/print", EncodeSentence({"!re", "=name=core-rtr"}) +
                                                EncodeSentence({"!done"}))
            .Then("/system/resource/print", EncodeSentence({"!done"}))
            .Then("/system/routerboard/print", EncodeSentence({"!trap", "=message=no such command"}) +
                                                   EncodeSentence({"!done"}))
            .Then("/interface/print", EncodeSentence({"!done"}))
            .Then("/ip/neighbor/print", EncodeSentence({"!trap", "=message=not permitted"}) +
                                            EncodeSentence({"!done"}));
        VendorApiProbe probe(FactoryFor(stream));
        auto result = probe.Run(RouterTarget(), std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error->code == ProbeErrorCode::MALFORMED_RESPONSE);
        REQUIRE(result.observations.size() == 1);
        REQUIRE(result.observations[0].payload.at(fields::HOSTNAME) == "core-rtr");
        REQUIRE(result.observations[0].payload.count(fields::MAC) == 0);
        // No routerboard serial: the renameable identity is not used as a key
        REQUIRE(result.observations[0].payload.count(fields::VENDOR_ID) == 0);
    }
}
