// Unit tests for graph metrics and vulnerability findings
#include <catch2/catch_all.hpp>
#include "analytics/graph_analytics.hpp"
#include "util/time.hpp"
#include <algorithm>

using namespace topowatch::analytics;
using namespace topowatch::topology;
using Catch::Approx;
using topowatch::util::MockTimeScope;

namespace {

void AddDevice(TopologyGraph &graph, const std::string &key,
               DeviceStatus status = DeviceStatus::ONLINE) {
    Device device;
    device.key = key;
    device.status = status;
    graph.devices[key] = device;
}

void AddLink(TopologyGraph &graph, const std::string &a, const std::string &b,
             const std::string &type = "physical") {
    Link link;
    link.a = std::min(a, b);
    link.b = std::max(a, b);
    link.link_type = type;
    link.key = link.a + "|" + link.b + "|" + type;
    graph.links[link.key] = link;
}

// hub with four leaves
TopologyGraph Star() {
    TopologyGraph graph;
    graph.version = 7;
    for (const char *key : {"hub", "l1", "l2", "l3", "l4"}) {
        AddDevice(graph, key);
    }
    for (const char *leaf : {"l1", "l2", "l3", "l4"}) {
        AddLink(graph, "hub", leaf);
    }
    return graph;
}

const Finding *FindType(const AnalysisReport &report, FindingType type) {
    for (const auto &f : report.findings) {
        if (f.type == type) {
            return &f;
        }
    }
    return nullptr;
}

} // namespace

TEST_CASE("Risk score and severity bands", "[analytics][finding]") {
    REQUIRE(RiskScore(1.0, 5, 1.0) == Approx(100.0));
    REQUIRE(RiskScore(2.0, 50, 3.0) == Approx(100.0));
    REQUIRE(RiskScore(0.0, 0, 0.0) == Approx(0.0));
    REQUIRE(RiskScore(0.5, 1, 0.0) == Approx(29.0));

    REQUIRE(SeverityForScore(70.0) == Severity::CRITICAL);
    REQUIRE(SeverityForScore(69.9) == Severity::HIGH);
    REQUIRE(SeverityForScore(45.0) == Severity::HIGH);
    REQUIRE(SeverityForScore(44.9) == Severity::MEDIUM);

    Finding f;
    f.type = FindingType::BOTTLENECK_LINK;
    f.subjects = {"a|b|physical", "a|b|logical"};
    REQUIRE(f.Id() == "bottleneck_link:a|b|physical,a|b|logical");

    REQUIRE(FindingTypeFromString("high_load_node") == FindingType::HIGH_LOAD_NODE);
    REQUIRE_FALSE(FindingTypeFromString("nope").has_value());
    REQUIRE(SeverityFromString(SeverityToString(Severity::HIGH)) == Severity::HIGH);
}

TEST_CASE("Star topology metrics", "[analytics]") {
    MockTimeScope time(5000);
    const AnalysisReport report = GraphAnalytics().Analyze(Star());

    REQUIRE(report.snapshot_version == 7);
    REQUIRE(report.node_count == 5);
    REQUIRE(report.edge_count == 4);
    REQUIRE(report.component_count() == 1);
    REQUIRE(report.diameter == 2u);
    REQUIRE(report.average_degree == Approx(1.6));
    REQUIRE(report.density == Approx(0.4));
    REQUIRE(report.degree_distribution.at(1) == 4);
    REQUIRE(report.degree_distribution.at(4) == 1);
    REQUIRE(report.average_clustering == Approx(0.0));

    REQUIRE(report.betweenness.at("hub") == Approx(1.0));
    REQUIRE(report.betweenness.at("l1") == Approx(0.0));
    REQUIRE(report.edge_betweenness.at("hub|l1|physical") == Approx(0.4));
    REQUIRE(report.critical_nodes.front() == "hub");

    SECTION("Hub is flagged") {
        REQUIRE(report.findings.size() == 2);

        const Finding &load = report.findings[0];
        REQUIRE(load.type == FindingType::HIGH_LOAD_NODE);
        REQUIRE(load.risk_score == Approx(96.0));

        const Finding &spof = report.findings[1];
        REQUIRE(spof.type == FindingType::SINGLE_POINT_OF_FAILURE);
        REQUIRE(spof.subjects == std::vector<std::string>{"hub"});
        REQUIRE(spof.affected_nodes == 3);
        REQUIRE(spof.affected_links == 4);
        REQUIRE(spof.centrality_percentile == Approx(1.0));
        REQUIRE(spof.risk_score == Approx(83.5));
        REQUIRE(spof.severity == Severity::CRITICAL);
        REQUIRE(spof.snapshot_version == 7);
        REQUIRE(spof.detected_at == 5000);
        REQUIRE_FALSE(spof.recommendation.empty());
    }

    SECTION("No bottleneck below the share threshold") {
        REQUIRE(FindType(report, FindingType::BOTTLENECK_LINK) == nullptr);
    }
}

TEST_CASE("Path of three has a heavy middle link", "[analytics]") {
    TopologyGraph graph;
    AddDevice(graph, "a");
    AddDevice(graph, "b");
    AddDevice(graph, "c");
    AddLink(graph, "a", "b");
    AddLink(graph, "b", "c");

    const AnalysisReport report = GraphAnalytics().Analyze(graph);
    REQUIRE(report.betweenness.at("b") == Approx(1.0));
    REQUIRE(report.edge_betweenness.at("a|b|physical") == Approx(4.0 / 6.0));

    size_t bottlenecks = 0;
    for (const auto &f : report.findings) {
        if (f.type == FindingType::BOTTLENECK_LINK) {
            ++bottlenecks;
        }
    }
    REQUIRE(bottlenecks == 2);
    REQUIRE(FindType(report, FindingType::SINGLE_POINT_OF_FAILURE) != nullptr);
}

TEST_CASE("Disconnected and degenerate graphs", "[analytics]") {
    SECTION("Two segments") {
        TopologyGraph graph;
        for (const char *key : {"a", "b", "c", "d"}) {
            AddDevice(graph, key);
        }
        AddLink(graph, "a", "b");
        AddLink(graph, "c", "d");

        const AnalysisReport report = GraphAnalytics().Analyze(graph);
        REQUIRE(report.component_count() == 2);
        REQUIRE_FALSE(report.diameter.has_value());
        REQUIRE(report.findings.size() == 1);

        const Finding &f = report.findings[0];
        REQUIRE(f.type == FindingType::CONNECTIVITY_RISK);
        REQUIRE(f.subjects == std::vector<std::string>{"c", "d"});
        REQUIRE(f.affected_nodes == 2);
        REQUIRE(f.risk_score == Approx(25.0));
        REQUIRE(f.severity == Severity::MEDIUM);
    }

    SECTION("Empty graph") {
        const AnalysisReport report = GraphAnalytics().Analyze(TopologyGraph{});
        REQUIRE(report.node_count == 0);
        REQUIRE(report.component_count() == 0);
        REQUIRE_FALSE(report.diameter.has_value());
        REQUIRE(report.findings.empty());
        REQUIRE(report.critical_nodes.empty());
    }

    SECTION("Single device") {
        TopologyGraph graph;
        AddDevice(graph, "solo");
        const AnalysisReport report = GraphAnalytics().Analyze(graph);
        REQUIRE(report.diameter == 0u);
        REQUIRE(report.betweenness.at("solo") == Approx(0.0));
        REQUIRE(report.findings.empty());
    }
}

TEST_CASE("Offline devices and parallel links", "[analytics]") {
    TopologyGraph graph = Star();
    graph.devices["l4"].status = DeviceStatus::OFFLINE;
    AddLink(graph, "hub", "l1", "logical");

    SECTION("Offline devices are left out by default") {
        const AnalysisReport report = GraphAnalytics().Analyze(graph);
        REQUIRE(report.node_count == 4);
        REQUIRE(report.edge_count == 3);
        REQUIRE(report.degree.at("hub") == 3);
        // Both parallel links share the pair's score
        REQUIRE(report.edge_betweenness.at("hub|l1|logical") ==
                Approx(report.edge_betweenness.at("hub|l1|physical")));
    }

    SECTION("include_offline keeps them") {
        AnalysisOptions options;
        options.include_offline = true;
        const AnalysisReport report = GraphAnalytics(options).Analyze(graph);
        REQUIRE(report.node_count == 5);
        REQUIRE(report.edge_count == 4);
    }
}
