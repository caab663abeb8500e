// Unit tests for the telnet CLI probe
#include <catch2/catch_all.hpp>
#include "discovery/remote_query_probe.hpp"
#include "infra/scripted_stream.hpp"

using namespace topowatch::discovery;
using topowatch::test::FactoryFor;
using topowatch::test::ScriptedStream;

namespace {

const char *kGreeting = "\r\n\r\nUser Access Verification\r\n\r\nUsername: ";

const char *kVersionReply =
    "show version\r\n"
    "Cisco IOS Software, C2960X Software (C2960X-UNIVERSALK9-M), Version 15.2(4)E8, RELEASE SOFTWARE\r\n"
    "sw1 uptime is 3 weeks, 2 days\r\n"
    "cisco WS-C2960X-48FPD-L (APM86XXX) processor (revision V05) with 524288K bytes of memory.\r\n"
    "Base ethernet MAC Address       : AA:BB:CC:DD:EE:FF\r\n"
    "System serial number            : FOC1932X0AB\r\n"
    "sw1#";

const char *kCdpReply =
    "show cdp neighbors detail\r\n"
    "-------------------------\r\n"
    "Device ID: rtr1\r\n"
    "Entry address(es): \r\n"
    "  IP address: 10.0.0.1\r\n"
    "Platform: Cisco ISR4331,  Capabilities: Router Switch IGMP \r\n"
    "Interface: GigabitEthernet1/0/2,  Port ID (outgoing port): GigabitEthernet0/0/0\r\n"
    "\r\n"
    "Version :\r\n"
    "Cisco IOS XE Software, Version 17.03.04a\r\n"
    "\r\n"
    "sw1#";

Target CliTarget() {
    Target target;
    target.id = "10.0.0.2";
    target.address = "10.0.0.2";
    target.credentials = Credentials{"admin", "secret"};
    target.network = "campus";
    target.location = "building-a";
    return target;
}

std::shared_ptr<ScriptedStream> FullSession() {
    auto stream = std::make_shared<ScriptedStream>(kGreeting);
    stream->Then("admin", "admin\r\nPassword: ")
        .Then("secret", "\r\nsw1#")
        .Then("terminal length 0", "terminal length 0\r\nsw1#")
        .Then("show version", kVersionReply)
        .Then("show cdp neighbors detail", kCdpReply);
    return stream;
}

CancellationToken RoundToken() {
    return CancellationToken::WithDeadline(CancellationToken::Clock::now() + std::chrono::seconds(30));
}

} // namespace

TEST_CASE("RemoteQueryProbe reports the device and its CDP neighbors", "[discovery][cli]") {
    auto stream = FullSession();
    RemoteQueryProbe probe(FactoryFor(stream));

    auto result = probe.Run(CliTarget(), std::chrono::seconds(5), RoundToken());

    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(stream->connected_host() == "10.0.0.2");
    REQUIRE(stream->connected_port() == 23);
    REQUIRE(stream->remaining_steps() == 0);
    REQUIRE(stream->closed());
    REQUIRE(result.observations.size() == 2);

    const auto &device = result.observations[0];
    REQUIRE_FALSE(device.is_link());
    REQUIRE(device.source_probe == "cli");
    REQUIRE(device.probe_kind == ProbeKind::REMOTE_QUERY);
    REQUIRE(device.confidence_hint == Catch::Approx(0.9));
    REQUIRE(device.payload.at(fields::IP) == "10.0.0.2");
    REQUIRE(device.payload.at(fields::HOSTNAME) == "sw1");
    REQUIRE(device.payload.at(fields::MAC) == "AA:BB:CC:DD:EE:FF");
    REQUIRE(device.payload.at(fields::VENDOR_ID) == "serial:FOC1932X0AB");
    REQUIRE(device.payload.at(fields::MODEL) == "WS-C2960X-48FPD-L");
    REQUIRE(device.payload.at(fields::OS_VERSION) == "15.2(4)E8");
    REQUIRE(device.payload.at(fields::VENDOR) == "Cisco");
    REQUIRE(device.payload.at(fields::NETWORK) == "campus");
    REQUIRE(device.payload.at(fields::LOCATION) == "building-a");

    const auto &link = result.observations[1];
    REQUIRE(link.is_link());
    REQUIRE(link.link_type == "physical");
    REQUIRE(link.confidence_hint == Catch::Approx(0.8));
    REQUIRE(link.payload.at(fields::MAC) == "AA:BB:CC:DD:EE:FF");
    REQUIRE(link.payload.at(fields::PORT) == "GigabitEthernet1/0/2");
    REQUIRE(link.peer->at(fields::HOSTNAME) == "rtr1");
    REQUIRE(link.peer->at(fields::IP) == "10.0.0.1");
    REQUIRE(link.peer->at(fields::PORT) == "GigabitEthernet0/0/0");
    REQUIRE(link.peer->at(fields::DEVICE_TYPE) == "router");
    REQUIRE(link.peer->at(fields::MODEL) == "Cisco ISR4331");
    REQUIRE(link.peer->at(fields::VENDOR) == "Cisco");
}

TEST_CASE("RemoteQueryProbe authentication failures", "[discovery][cli]") {
    SECTION("Rejected password") {
        auto stream = std::make_shared<ScriptedStream>(kGreeting);
        stream->Then("admin", "admin\r\nPassword: ")
            .Then("secret", "\r\n% Login invalid\r\n\r\nUsername: ");
        RemoteQueryProbe probe(FactoryFor(stream));

        auto result = probe.Run(CliTarget(), std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->code == ProbeErrorCode::AUTH_FAILURE);
        REQUIRE(result.error->message == "login rejected");
        REQUIRE_FALSE(result.error->retryable());
        REQUIRE(result.observations.empty());
    }

    SECTION("No credentials configured") {
        auto stream = std::make_shared<ScriptedStream>(kGreeting);
        RemoteQueryProbe probe(FactoryFor(stream));
        Target target = CliTarget();
        target.credentials.reset();

        auto result = probe.Run(target, std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error->code == ProbeErrorCode::AUTH_FAILURE);
        REQUIRE(result.error->message == "device requires credentials");
    }
}

TEST_CASE("RemoteQueryProbe transport failures", "[discovery][cli]") {
    SECTION("Connection refused") {
        auto stream = std::make_shared<ScriptedStream>();
        stream->FailConnect(ProbeErrorCode::UNREACHABLE, "connection refused");
        RemoteQueryProbe probe(FactoryFor(stream));

        Target target = CliTarget();
        target.port = 2323;
        auto result = probe.Run(target, std::chrono::seconds(5), RoundToken());
        REQUIRE(stream->connected_port() == 2323);
        REQUIRE(result.error->code == ProbeErrorCode::UNREACHABLE);
        REQUIRE(result.error->retryable());
    }

    SECTION("Device goes quiet after show version") {
        auto stream = std::make_shared<ScriptedStream>(kGreeting);
        stream->Then("admin", "admin\r\nPassword: ")
            .Then("secret", "\r\nsw1#")
            .Then("terminal length 0", "terminal length 0\r\nsw1#")
            .Then("show version", kVersionReply);
        RemoteQueryProbe probe(FactoryFor(stream));

        auto result = probe.Run(CliTarget(), std::chrono::seconds(5), RoundToken());
        // Device record survives as a partial result
        REQUIRE(result.error->code == ProbeErrorCode::TIMEOUT);
        REQUIRE(result.observations.size() == 1);
        REQUIRE(result.observations[0].payload.at(fields::HOSTNAME) == "sw1");
    }

    SECTION("Target without an address") {
        RemoteQueryProbe probe(FactoryFor(std::make_shared<ScriptedStream>()));
        Target target;
        target.id = "orphan";
        auto result = probe.Run(target, std::chrono::seconds(5), RoundToken());
        REQUIRE(result.error->code == ProbeErrorCode::INTERNAL);
    }
}

TEST_CASE("RemoteQueryProbe refuses telnet options", "[discovery][cli]") {
    // IAC DO ECHO ahead of the banner
    std::string greeting = std::string("\xff\xfd\x01", 3) + kGreeting;
    auto stream = std::make_shared<ScriptedStream>(greeting);
    stream->Then("admin", "admin\r\nPassword: ")
        .Then("secret", "\r\nsw1#")
        .Then("terminal length 0", "terminal length 0\r\nsw1#")
        .Then("show version", kVersionReply)
        .Then("show cdp neighbors detail", "show cdp neighbors detail\r\n\r\nsw1#");
    RemoteQueryProbe probe(FactoryFor(stream));

    auto result = probe.Run(CliTarget(), std::chrono::seconds(5), RoundToken());
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(result.observations.size() == 1);

    auto written = stream->written();
    REQUIRE_FALSE(written.empty());
    REQUIRE(written[0] == std::string("\xff\xfc\x01", 3));
}

TEST_CASE("CliSession::StripTelnetCommands", "[discovery][cli]") {
    std::string reply;

    SECTION("Plain text passes through") {
        std::string raw = "sw1#";
        REQUIRE(CliSession::StripTelnetCommands(raw, reply) == "sw1#");
        REQUIRE(raw.empty());
        REQUIRE(reply.empty());
    }

    SECTION("WILL is answered with DONT") {
        std::string raw = std::string("\xff\xfb\x03", 3) + "login: ";
        REQUIRE(CliSession::StripTelnetCommands(raw, reply) == "login: ");
        REQUIRE(reply == std::string("\xff\xfe\x03", 3));
    }

    SECTION("Subnegotiation is dropped") {
        std::string raw = std::string("ab\xff\xfa\x18\x01\xff\xf0", 8) + "cd";
        REQUIRE(CliSession::StripTelnetCommands(raw, reply) == "abcd");
    }

    SECTION("Incomplete sequence is kept for the next read") {
        std::string raw = std::string("xy\xff\xfd", 4);
        REQUIRE(CliSession::StripTelnetCommands(raw, reply) == "xy");
        REQUIRE(raw == std::string("\xff\xfd", 2));
    }

    SECTION("Escaped IAC is data") {
        std::string raw = std::string("\xff\xff", 2);
        REQUIRE(CliSession::StripTelnetCommands(raw, reply) == std::string("\xff", 1));
    }
}
