// Unit tests for identity resolution and attribute precedence
#include <catch2/catch_all.hpp>
#include "topology/identity_resolver.hpp"
#include "infra/records.hpp"

using namespace topowatch::topology;
using namespace topowatch::test;
namespace fields = topowatch::discovery::fields;
using topowatch::discovery::FieldMap;
using topowatch::discovery::ObservationSet;

namespace {

// Fold a delta into a graph the way the store would, without lifecycle
TopologyGraph Applied(TopologyGraph graph, const GraphDelta &delta) {
    for (const auto &[from, to] : delta.rekeyed) {
        graph.devices.erase(from);
        for (auto it = graph.links.begin(); it != graph.links.end();) {
            if (it->second.a == from || it->second.b == from) {
                it = graph.links.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto &device : delta.upserted_devices) {
        graph.devices[device.key] = device;
    }
    for (const auto &link : delta.upserted_links) {
        graph.links[link.key] = link;
    }
    return graph;
}

const Device &DeviceAt(const TopologyGraph &graph, const std::string &key) {
    const Device *device = graph.FindDevice(key);
    REQUIRE(device != nullptr);
    return *device;
}

} // namespace

TEST_CASE("Higher confidence active observation wins the hostname", "[topology][resolver]") {
    FieldMap active{{fields::MAC, "AA:BB:CC:DD:EE:FF"}, {fields::HOSTNAME, "sw1"}};
    FieldMap passive{{fields::MAC, "aabb.ccdd.eeff"}, {fields::HOSTNAME, "switch-unknown"}};

    ObservationSet forward{DeviceRecord("cli", active, 0.9, 100, true),
                           DeviceRecord("lldp", passive, 0.4, 105, false)};
    ObservationSet reversed{forward[1], forward[0]};

    IdentityResolver resolver;
    TopologyGraph empty;
    auto a = resolver.Resolve(forward, empty);
    auto b = resolver.Resolve(reversed, empty);

    REQUIRE(a.upserted_devices.size() == 1);
    const Device &device = a.upserted_devices[0];
    REQUIRE(device.key == "mac:aa:bb:cc:dd:ee:ff");
    REQUIRE(device.mac == "aa:bb:cc:dd:ee:ff");
    REQUIRE(device.Get(attr::HOSTNAME) == "sw1");
    REQUIRE(device.attributes.at(attr::HOSTNAME).source == "cli");
    REQUIRE(device.sources == std::set<std::string>{"cli", "lldp"});
    REQUIRE(device.first_seen == 100);
    REQUIRE(device.last_seen == 105);
    REQUIRE(device.status == DeviceStatus::ONLINE);
    // 1 - (0.1 * 0.6)
    REQUIRE(device.confidence == Catch::Approx(0.94));

    // Arrival order does not matter
    REQUIRE(b.upserted_devices.size() == 1);
    REQUIRE(b.upserted_devices[0] == device);
}

TEST_CASE("Attribute precedence tie-breaks", "[topology][resolver]") {
    Attribute base{"x", 0.5, 100, false, "lldp"};

    SECTION("Confidence first") {
        Attribute other{"y", 0.6, 50, false, "lldp"};
        REQUIRE(other.Outranks(base));
        REQUIRE_FALSE(base.Outranks(other));
    }
    SECTION("Then recency") {
        Attribute other{"y", 0.5, 101, false, "lldp"};
        REQUIRE(other.Outranks(base));
    }
    SECTION("Then active over passive") {
        Attribute other{"y", 0.5, 100, true, "cli"};
        REQUIRE(other.Outranks(base));
    }
    SECTION("Then the smaller value") {
        Attribute other{"w", 0.5, 100, false, "lldp"};
        REQUIRE(other.Outranks(base));
        REQUIRE_FALSE(base.Outranks(other));
    }
    SECTION("Identical attribute never outranks itself") {
        REQUIRE_FALSE(base.Outranks(base));
    }
}

TEST_CASE("Resolving the same records twice is a no-op", "[topology][resolver]") {
    ObservationSet records{
        DeviceRecord("cli", {{fields::MAC, "aa:bb:cc:dd:ee:01"}, {fields::IP, "10.0.0.2"},
                             {fields::HOSTNAME, "sw1"}}, 0.9, 100),
        LinkRecord("cli", MacPort("aa:bb:cc:dd:ee:01", "Gi1/0/1"),
                   {{fields::HOSTNAME, "rtr1"}, {fields::IP, "10.0.0.1"}, {fields::PORT, "Gi0/0"}},
                   0.8, 100),
        LinkRecord("lldp", MacPort("aa:bb:cc:dd:ee:01", "Gi1/0/2"), MacPort("aa:bb:cc:dd:ee:03", "eth0"),
                   0.4, 101, false),
    };

    IdentityResolver resolver;
    auto first = resolver.Resolve(records, TopologyGraph{});
    REQUIRE(first.records_consumed == 3);
    REQUIRE(first.records_dropped == 0);
    REQUIRE(first.upserted_devices.size() == 3);
    REQUIRE(first.upserted_links.size() == 2);

    TopologyGraph graph = Applied(TopologyGraph{}, first);
    auto second = resolver.Resolve(records, graph);
    REQUIRE(second.empty());
    REQUIRE(second.conflicts.empty());
    REQUIRE(second.records_consumed == 3);
}

TEST_CASE("Links are keyed by ordered endpoints and type", "[topology][resolver]") {
    IdentityResolver resolver;
    ObservationSet records{
        LinkRecord("cli", MacPort("aa:00:00:00:00:02", "Gi1"), MacPort("aa:00:00:00:00:01", "ether5"),
                   0.8, 100),
        // Same link reported from the other side
        LinkRecord("routeros", MacPort("aa:00:00:00:00:01", "ether5"), MacPort("aa:00:00:00:00:02", "Gi1"),
                   0.7, 102),
    };

    auto delta = resolver.Resolve(records, TopologyGraph{});
    REQUIRE(delta.upserted_links.size() == 1);
    const Link &link = delta.upserted_links[0];
    REQUIRE(link.a == "mac:aa:00:00:00:00:01");
    REQUIRE(link.b == "mac:aa:00:00:00:00:02");
    REQUIRE(link.key == "mac:aa:00:00:00:00:01|mac:aa:00:00:00:00:02|physical");
    REQUIRE(link.port_a == "ether5");
    REQUIRE(link.port_b == "Gi1");
    REQUIRE(link.discovered_via == std::set<std::string>{"cli", "routeros"});
    REQUIRE(link.first_seen == 100);
    REQUIRE(link.last_seen == 102);
    REQUIRE(link.status == DeviceStatus::ONLINE);

    SECTION("A logical link between the same devices is separate") {
        records.push_back(LinkRecord("cli", Mac("aa:00:00:00:00:01"), Mac("aa:00:00:00:00:02"), 0.8, 103,
                                     true, "logical"));
        auto with_logical = resolver.Resolve(records, TopologyGraph{});
        REQUIRE(with_logical.upserted_links.size() == 2);
    }
}

TEST_CASE("Provisional devices are re-keyed onto their MAC", "[topology][resolver]") {
    IdentityResolver resolver;

    SECTION("Within one pass") {
        ObservationSet records{
            DeviceRecord("cli", {{fields::IP, "10.0.0.5"}, {fields::HOSTNAME, "printer"}}, 0.8, 100),
            DeviceRecord("routeros", {{fields::IP, "10.0.0.5"}, {fields::MAC, "de:ad:be:ef:00:05"}}, 0.7, 101),
        };
        auto delta = resolver.Resolve(records, TopologyGraph{});
        REQUIRE(delta.upserted_devices.size() == 1);
        REQUIRE(delta.upserted_devices[0].key == "mac:de:ad:be:ef:00:05");
        REQUIRE(delta.upserted_devices[0].Get(attr::HOSTNAME) == "printer");
        REQUIRE(delta.upserted_devices[0].Get(attr::IP) == "10.0.0.5");
        REQUIRE(delta.rekeyed.at("ip:10.0.0.5") == "mac:de:ad:be:ef:00:05");
    }

    SECTION("Across rounds, carrying links along") {
        ObservationSet round1{
            LinkRecord("cli", MacPort("aa:00:00:00:00:01", "Gi1/0/7"),
                       {{fields::IP, "10.0.0.5"}, {fields::HOSTNAME, "printer"}}, 0.8, 100),
        };
        auto first = resolver.Resolve(round1, TopologyGraph{});
        TopologyGraph graph = Applied(TopologyGraph{}, first);
        REQUIRE(graph.FindDevice("ip:10.0.0.5") != nullptr);
        REQUIRE(graph.links.size() == 1);

        ObservationSet round2{
            DeviceRecord("routeros", {{fields::IP, "10.0.0.5"}, {fields::MAC, "de:ad:be:ef:00:05"}}, 0.7, 200),
        };
        auto second = resolver.Resolve(round2, graph);
        REQUIRE(second.rekeyed.at("ip:10.0.0.5") == "mac:de:ad:be:ef:00:05");
        REQUIRE(second.upserted_links.size() == 1);
        REQUIRE(second.upserted_links[0].a == "mac:aa:00:00:00:00:01");
        REQUIRE(second.upserted_links[0].b == "mac:de:ad:be:ef:00:05");
        REQUIRE(second.upserted_links[0].port_a == "Gi1/0/7");

        TopologyGraph after = Applied(graph, second);
        REQUIRE(after.FindDevice("ip:10.0.0.5") == nullptr);
        REQUIRE(DeviceAt(after, "mac:de:ad:be:ef:00:05").Get(attr::HOSTNAME) == "printer");
        REQUIRE(DeviceAt(after, "mac:de:ad:be:ef:00:05").first_seen == 100);
    }

    SECTION("Vendor id is the identity of last resort") {
        ObservationSet records{
            DeviceRecord("lldp", {{fields::VENDOR_ID, "cdp:rtr1"}, {fields::HOSTNAME, "rtr1"}}, 0.4, 100, false),
            DeviceRecord("lldp", {{fields::VENDOR_ID, "cdp:rtr1"}, {fields::MODEL, "ISR4331"}}, 0.4, 101, false),
        };
        auto delta = resolver.Resolve(records, TopologyGraph{});
        REQUIRE(delta.upserted_devices.size() == 1);
        REQUIRE(delta.upserted_devices[0].key == "vid:cdp:rtr1");
        REQUIRE(delta.upserted_devices[0].provisional());
        REQUIRE(delta.upserted_devices[0].Get(attr::MODEL) == "ISR4331");
    }
}

TEST_CASE("MAC to IP conflicts are reported, binding kept", "[topology][resolver]") {
    IdentityResolver resolver;
    auto first = resolver.Resolve(
        {DeviceRecord("cli", {{fields::MAC, "aa:bb:cc:00:00:01"}, {fields::IP, "10.0.0.1"}}, 0.9, 100)},
        TopologyGraph{});
    TopologyGraph graph = Applied(TopologyGraph{}, first);

    ObservationSet records{
        DeviceRecord("routeros", {{fields::MAC, "aa:bb:cc:00:00:01"}, {fields::IP, "10.0.0.99"}}, 0.95, 101),
        // Repeats are reported once
        DeviceRecord("routeros", {{fields::MAC, "aa:bb:cc:00:00:01"}, {fields::IP, "10.0.0.99"}}, 0.95, 102),
    };
    auto delta = resolver.Resolve(records, graph);

    REQUIRE(delta.conflicts.size() == 1);
    const auto &conflict = delta.conflicts[0];
    REQUIRE(conflict.device_key == "mac:aa:bb:cc:00:00:01");
    REQUIRE(conflict.existing_ip == "10.0.0.1");
    REQUIRE(conflict.existing_source == "cli");
    REQUIRE(conflict.conflicting_ip == "10.0.0.99");
    REQUIRE(conflict.conflicting_source == "routeros");
    REQUIRE(conflict.detected_at == 101);
    // The binding held by the graph stays, even against a higher hint
    REQUIRE(DeviceAt(Applied(graph, delta), "mac:aa:bb:cc:00:00:01").Get(attr::IP) == "10.0.0.1");

    SECTION("Same source changing its answer is not a conflict") {
        ObservationSet moved{
            DeviceRecord("cli", {{fields::MAC, "aa:bb:cc:00:00:01"}, {fields::IP, "10.0.0.1"}}, 0.9, 100),
            DeviceRecord("cli", {{fields::MAC, "aa:bb:cc:00:00:01"}, {fields::IP, "10.0.0.2"}}, 0.9, 200),
        };
        auto d = resolver.Resolve(moved, TopologyGraph{});
        REQUIRE(d.conflicts.empty());
        REQUIRE(d.upserted_devices[0].Get(attr::IP) == "10.0.0.2");
    }
}

TEST_CASE("Bindings first seen in one pass are chosen by precedence", "[topology][resolver]") {
    IdentityResolver resolver;
    const auto passive =
        DeviceRecord("lldp", {{fields::MAC, "aa:bb:cc:00:00:02"}, {fields::IP, "10.0.0.9"}}, 0.4, 100, false);
    const auto active =
        DeviceRecord("cli", {{fields::MAC, "aa:bb:cc:00:00:02"}, {fields::IP, "10.0.0.1"}}, 0.9, 105, true);

    for (const ObservationSet &records : {ObservationSet{passive, active}, ObservationSet{active, passive}}) {
        auto delta = resolver.Resolve(records, TopologyGraph{});
        REQUIRE(delta.upserted_devices.size() == 1);
        REQUIRE(delta.upserted_devices[0].Get(attr::IP) == "10.0.0.1");
        REQUIRE(delta.conflicts.size() == 1);
        REQUIRE(delta.conflicts[0].existing_ip == "10.0.0.1");
        REQUIRE(delta.conflicts[0].existing_source == "cli");
        REQUIRE(delta.conflicts[0].conflicting_ip == "10.0.0.9");
        REQUIRE(delta.conflicts[0].conflicting_source == "lldp");
        REQUIRE(delta.conflicts[0].detected_at == 105);
    }

    SECTION("Three sources: every loser names the final binding") {
        const auto middle =
            DeviceRecord("snmp", {{fields::MAC, "aa:bb:cc:00:00:02"}, {fields::IP, "10.0.0.5"}}, 0.7, 103, true);
        auto forward = resolver.Resolve({passive, middle, active}, TopologyGraph{});
        auto reversed = resolver.Resolve({active, middle, passive}, TopologyGraph{});

        for (const auto *delta : {&forward, &reversed}) {
            REQUIRE(delta->upserted_devices[0].Get(attr::IP) == "10.0.0.1");
            REQUIRE(delta->conflicts.size() == 2);
            for (const auto &conflict : delta->conflicts) {
                REQUIRE(conflict.existing_ip == "10.0.0.1");
            }
        }
        REQUIRE(forward.conflicts[0].conflicting_ip == reversed.conflicts[0].conflicting_ip);
        REQUIRE(forward.conflicts[1].conflicting_ip == reversed.conflicts[1].conflicting_ip);
    }
}

TEST_CASE("A shared vendor id does not merge distinct addresses", "[topology][resolver]") {
    IdentityResolver resolver;
    ObservationSet records{
        DeviceRecord("snmp", {{fields::IP, "10.0.0.1"}, {fields::VENDOR_ID, "routeros:MikroTik"}}, 0.8, 100),
        DeviceRecord("snmp", {{fields::IP, "10.0.0.2"}, {fields::VENDOR_ID, "routeros:MikroTik"}}, 0.8, 100),
    };
    auto delta = resolver.Resolve(records, TopologyGraph{});
    TopologyGraph graph = Applied(TopologyGraph{}, delta);

    REQUIRE(graph.devices.size() == 2);
    REQUIRE(DeviceAt(graph, "ip:10.0.0.1").Get(attr::IP) == "10.0.0.1");
    REQUIRE(DeviceAt(graph, "ip:10.0.0.2").Get(attr::IP) == "10.0.0.2");

    SECTION("A record without an address still matches by vendor id") {
        auto more = resolver.Resolve(
            {DeviceRecord("lldp", {{fields::VENDOR_ID, "serial:HD1081A2B3C"}}, 0.4, 100, false),
             DeviceRecord("snmp", {{fields::IP, "10.0.0.3"}, {fields::VENDOR_ID, "serial:HD1081A2B3C"},
                                   {fields::HOSTNAME, "edge"}}, 0.8, 101)},
            TopologyGraph{});
        REQUIRE(more.upserted_devices.size() == 1);
        REQUIRE(more.upserted_devices[0].Get(attr::IP) == "10.0.0.3");
        REQUIRE(more.upserted_devices[0].Get(attr::HOSTNAME) == "edge");
    }
}

TEST_CASE("A round result resolves like its records", "[topology][resolver]") {
    topowatch::discovery::RoundResult round;
    round.records = {
        DeviceRecord("cli", {{fields::MAC, "aa:bb:cc:00:00:03"}, {fields::HOSTNAME, "core"}}, 0.9, 100),
        LinkRecord("lldp", MacPort("aa:bb:cc:00:00:03", "ge-0/0/1"), Mac("aa:bb:cc:00:00:04"), 0.4, 100, false),
    };
    IdentityResolver resolver;
    auto from_round = resolver.Resolve(round, TopologyGraph{});
    auto from_records = resolver.Resolve(round.records, TopologyGraph{});

    REQUIRE(from_round.records_consumed == 2);
    REQUIRE(from_round.upserted_devices == from_records.upserted_devices);
    REQUIRE(from_round.upserted_links == from_records.upserted_links);
}

TEST_CASE("Records without identity are dropped", "[topology][resolver]") {
    IdentityResolver resolver;
    ObservationSet records{
        DeviceRecord("cli", {{fields::HOSTNAME, "mystery"}}, 0.9, 100),
        DeviceRecord("cli", {{fields::MAC, "00:00:00:00:00:00"}}, 0.9, 100),
        LinkRecord("lldp", Mac("aa:00:00:00:00:01"), {{fields::HOSTNAME, "nameless"}}, 0.4, 100, false),
        // Self-loop: both sides resolve to one device
        LinkRecord("lldp", Mac("aa:00:00:00:00:02"), Mac("AA-00-00-00-00-02"), 0.4, 100, false),
    };
    auto delta = resolver.Resolve(records, TopologyGraph{});

    REQUIRE(delta.records_consumed == 4);
    REQUIRE(delta.records_dropped == 3);
    REQUIRE(delta.upserted_links.empty());
    // Local ends of the link records still count as sightings
    REQUIRE(delta.upserted_devices.size() == 2);
}

TEST_CASE("Maintenance status survives new observations", "[topology][resolver]") {
    TopologyGraph graph;
    Device device;
    device.key = "mac:aa:00:00:00:00:01";
    device.mac = "aa:00:00:00:00:01";
    device.status = DeviceStatus::MAINTENANCE;
    device.last_seen = 50;
    graph.devices[device.key] = device;

    IdentityResolver resolver;
    auto delta = resolver.Resolve({DeviceRecord("cli", Mac("aa:00:00:00:00:01"), 0.9, 100)}, graph);
    REQUIRE(delta.upserted_devices.size() == 1);
    REQUIRE(delta.upserted_devices[0].status == DeviceStatus::MAINTENANCE);
    REQUIRE(delta.upserted_devices[0].last_seen == 100);
}
