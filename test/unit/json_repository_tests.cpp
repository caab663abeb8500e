// Unit tests for the JSON file repository and change log
#include <catch2/catch_all.hpp>
#include "storage/json_repository.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <random>

using namespace topowatch::storage;
using namespace topowatch::topology;
using topowatch::analytics::Finding;
using topowatch::analytics::FindingType;
using topowatch::analytics::Severity;

namespace {

std::filesystem::path MakeScratchDir() {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("topowatch_repo_test_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir;
}

void WriteRaw(const std::filesystem::path &path, const std::string &content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

Device MakeDevice(const std::string &mac, const std::string &hostname) {
    Device device;
    device.mac = mac;
    device.key = MacKey(mac);
    device.status = DeviceStatus::ONLINE;
    device.confidence = 0.9;
    device.first_seen = 100;
    device.last_seen = 200;
    device.sources = {"cli", "lldp"};
    device.source_confidence = {{"cli", 0.8}, {"lldp", 0.5}};
    Attribute name;
    name.value = hostname;
    name.confidence = 0.8;
    name.timestamp = 200;
    name.active_source = true;
    name.source = "cli";
    device.attributes[attr::HOSTNAME] = name;
    return device;
}

Link MakeLink(const std::string &a, const std::string &b) {
    Link link;
    link.a = std::min(a, b);
    link.b = std::max(a, b);
    link.link_type = "physical";
    link.key = LinkKey(link.a, link.b, link.link_type);
    link.port_a = "Gi1/0/1";
    link.port_b = "ether2";
    link.discovered_via = {"lldp"};
    link.first_seen = 100;
    link.last_seen = 200;
    return link;
}

Finding MakeFinding(const std::string &subject, uint64_t version) {
    Finding f;
    f.type = FindingType::SINGLE_POINT_OF_FAILURE;
    f.severity = Severity::CRITICAL;
    f.risk_score = 83.5;
    f.subjects = {subject};
    f.affected_nodes = 3;
    f.affected_links = 4;
    f.description = subject + " is an articulation point";
    f.snapshot_version = version;
    f.detected_at = 500;
    return f;
}

} // namespace

TEST_CASE("Device and link serialization", "[storage][json]") {
    SECTION("Devices keep provenance") {
        Device in = MakeDevice("00:11:22:33:44:55", "sw1");
        Device out;
        REQUIRE(DeserializeDevice(SerializeDevice(in), out));
        REQUIRE(out == in);
    }

    SECTION("Link keys are recomputed from endpoints") {
        Link in = MakeLink("mac:aa:00:00:00:00:02", "mac:aa:00:00:00:00:01");
        nlohmann::json j = SerializeLink(in);
        j["key"] = "stale";
        Link out;
        REQUIRE(DeserializeLink(j, out));
        REQUIRE(out == in);
    }

    SECTION("Malformed entries are rejected") {
        Device device;
        REQUIRE_FALSE(DeserializeDevice(nlohmann::json{{"mac", "x"}}, device));
        Link link;
        REQUIRE_FALSE(DeserializeLink(
            nlohmann::json{{"a", "z"}, {"b", "a"}, {"last_seen", 1}}, link));
        Finding finding;
        REQUIRE_FALSE(DeserializeFinding(
            nlohmann::json{{"type", "bogus"}, {"severity", "high"}}, finding));
        TopologyChange change;
        REQUIRE_FALSE(DeserializeChange(nlohmann::json{{"change_type", "device_added"}}, change));
    }
}

TEST_CASE("JsonFileRepository persists across reopen", "[storage][json]") {
    auto dir = MakeScratchDir();
    const Device sw1 = MakeDevice("00:11:22:33:44:55", "sw1");
    const Device sw2 = MakeDevice("00:11:22:33:44:66", "sw2");
    const Link link = MakeLink(sw1.key, sw2.key);

    {
        JsonFileRepository repo(dir);
        REQUIRE(repo.Open());
        REQUIRE_FALSE(repo.LoadGraphSnapshot().has_value());

        REQUIRE(repo.SaveDevice(sw1));
        REQUIRE(repo.SaveDevice(sw2));
        REQUIRE(repo.SaveLink(link));
        REQUIRE(repo.AppendFinding(MakeFinding(sw1.key, 4)));

        TopologyChange change;
        change.timestamp = 300;
        change.change_type = ChangeType::DEVICE_ADDED;
        change.subject = sw2.key;
        change.details = "discovered sw2 via cli";
        change.version = 4;
        REQUIRE(repo.AppendChange(change));
        REQUIRE(repo.Flush());
    }

    REQUIRE(std::filesystem::exists(dir / "topology.json"));
    REQUIRE(std::filesystem::exists(dir / "findings.json"));
    REQUIRE(std::filesystem::exists(dir / "changes.json"));

    JsonFileRepository repo(dir);
    REQUIRE(repo.Open());
    auto graph = repo.LoadGraphSnapshot();
    REQUIRE(graph.has_value());
    REQUIRE(graph->version == 4);
    REQUIRE(graph->devices.size() == 2);
    REQUIRE(graph->devices.at(sw1.key) == sw1);
    REQUIRE(graph->links.at(link.key) == link);

    REQUIRE(repo.findings().size() == 1);
    REQUIRE(repo.findings()[0].subjects == std::vector<std::string>{sw1.key});
    REQUIRE(repo.findings()[0].risk_score == Catch::Approx(83.5));
    REQUIRE(repo.changes().size() == 1);
    REQUIRE(repo.changes()[0].change_type == ChangeType::DEVICE_ADDED);

    SECTION("Removal drops dangling links on load") {
        REQUIRE(repo.RemoveDevice(sw2.key));
        REQUIRE(repo.Flush());
        JsonFileRepository reopened(dir);
        REQUIRE(reopened.Open());
        auto after = reopened.LoadGraphSnapshot();
        REQUIRE(after.has_value());
        REQUIRE(after->devices.size() == 1);
        REQUIRE(after->links.empty());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonFileRepository bounds its history", "[storage][json]") {
    auto dir = MakeScratchDir();
    JsonFileRepository repo(dir, 2, 2);
    REQUIRE(repo.Open());
    for (uint64_t v = 1; v <= 3; ++v) {
        REQUIRE(repo.AppendFinding(MakeFinding("dev" + std::to_string(v), v)));
    }
    auto findings = repo.findings();
    REQUIRE(findings.size() == 2);
    REQUIRE(findings[0].snapshot_version == 2);
    REQUIRE(findings[1].snapshot_version == 3);
    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonFileRepository refuses bad documents", "[storage][json]") {
    auto dir = MakeScratchDir();

    SECTION("Corrupt JSON") {
        WriteRaw(dir / "topology.json", "{\"version\":1, \"devices\": [");
        JsonFileRepository repo(dir);
        REQUIRE_FALSE(repo.Open());
    }

    SECTION("Unsupported version") {
        WriteRaw(dir / "findings.json", "{\"version\":2, \"findings\": []}");
        JsonFileRepository repo(dir);
        REQUIRE_FALSE(repo.Open());
    }

    SECTION("Invalid entries are skipped") {
        WriteRaw(dir / "topology.json",
                 "{\"version\":1, \"graph_version\":9, \"devices\":[{\"mac\":\"x\"},"
                 "{\"key\":\"ip:10.0.0.5\",\"last_seen\":10}], \"links\":[]}");
        JsonFileRepository repo(dir);
        REQUIRE(repo.Open());
        auto graph = repo.LoadGraphSnapshot();
        REQUIRE(graph.has_value());
        REQUIRE(graph->version == 9);
        REQUIRE(graph->devices.size() == 1);
        REQUIRE(graph->devices.count("ip:10.0.0.5") == 1);
        REQUIRE(graph->devices.at("ip:10.0.0.5").status == DeviceStatus::UNKNOWN);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Change log follows the diff", "[storage][changes]") {
    TopologyGraph before;
    before.version = 1;
    Device old_dev = MakeDevice("00:11:22:33:44:01", "old");
    old_dev.last_seen = 50;
    before.devices[old_dev.key] = old_dev;

    TopologyGraph after;
    after.version = 2;
    after.created_at = 900;
    Device new_dev = MakeDevice("00:11:22:33:44:02", "new");
    after.devices[new_dev.key] = new_dev;

    const auto log = BuildChangeLog(before, after, ComputeDiff(before, after));
    REQUIRE(log.size() == 2);
    REQUIRE(log[0].change_type == ChangeType::DEVICE_ADDED);
    REQUIRE(log[0].subject == new_dev.key);
    REQUIRE(log[0].details == "discovered new via cli");
    REQUIRE(log[0].timestamp == 900);
    REQUIRE(log[0].version == 2);
    REQUIRE(log[1].change_type == ChangeType::DEVICE_REMOVED);
    REQUIRE(log[1].details == "not seen since 50");

    REQUIRE(ChangeTypeFromString(ChangeTypeToString(ChangeType::LINK_STATUS)) ==
            ChangeType::LINK_STATUS);
    REQUIRE_FALSE(ChangeTypeFromString("nope").has_value());
}
