// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "analytics/graph_analytics.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <deque>
#include <stack>
#include <utility>

namespace topowatch {
namespace analytics {

using topology::DeviceStatus;
using topology::TopologyGraph;

namespace {

using Edge = std::pair<int, int>; // first < second

/**
 * Simple undirected graph over the analyzed devices, indexed 0..n-1 in key
 * order
 */
struct SimpleGraph {
  std::vector<std::string> keys;
  std::vector<std::string> names;             // Hostname or key
  std::vector<std::vector<int>> adj;          // Sorted
  std::map<Edge, std::vector<std::string>> edge_links; // Pair -> link keys

  size_t size() const { return keys.size(); }
  bool Adjacent(int a, int b) const {
    return std::binary_search(adj[a].begin(), adj[a].end(), b);
  }
};

SimpleGraph BuildGraph(const TopologyGraph &graph, bool include_offline) {
  SimpleGraph g;
  std::map<std::string, int> index;
  for (const auto &[key, device] : graph.devices) {
    if (!include_offline && device.status == DeviceStatus::OFFLINE) {
      continue;
    }
    index[key] = static_cast<int>(g.keys.size());
    g.keys.push_back(key);
    std::string hostname = device.Get(topology::attr::HOSTNAME);
    g.names.push_back(hostname.empty() ? key : hostname);
  }
  g.adj.resize(g.keys.size());
  for (const auto &[key, link] : graph.links) {
    if (!include_offline && link.status == DeviceStatus::OFFLINE) {
      continue;
    }
    auto a = index.find(link.a);
    auto b = index.find(link.b);
    if (a == index.end() || b == index.end() || a->second == b->second) {
      continue;
    }
    Edge e = std::minmax(a->second, b->second);
    g.edge_links[e].push_back(key);
  }
  for (const auto &[e, links] : g.edge_links) {
    g.adj[e.first].push_back(e.second);
    g.adj[e.second].push_back(e.first);
  }
  for (auto &list : g.adj) {
    std::sort(list.begin(), list.end());
  }
  return g;
}

// Hop distances from `source`, -1 if unreachable. `skip` is treated as absent.
std::vector<int> Bfs(const SimpleGraph &g, int source, int skip = -1) {
  std::vector<int> dist(g.size(), -1);
  std::deque<int> queue;
  dist[source] = 0;
  queue.push_back(source);
  while (!queue.empty()) {
    int v = queue.front();
    queue.pop_front();
    for (int w : g.adj[v]) {
      if (w != skip && dist[w] < 0) {
        dist[w] = dist[v] + 1;
        queue.push_back(w);
      }
    }
  }
  return dist;
}

std::vector<std::vector<int>> Components(const SimpleGraph &g) {
  std::vector<std::vector<int>> out;
  std::vector<bool> seen(g.size(), false);
  for (int s = 0; s < static_cast<int>(g.size()); ++s) {
    if (seen[s]) {
      continue;
    }
    std::vector<int> dist = Bfs(g, s);
    std::vector<int> members;
    for (int v = 0; v < static_cast<int>(g.size()); ++v) {
      if (dist[v] >= 0) {
        seen[v] = true;
        members.push_back(v);
      }
    }
    out.push_back(std::move(members));
  }
  // Largest first, ties by smallest key (members are in key order)
  std::stable_sort(out.begin(), out.end(),
                   [](const auto &a, const auto &b) { return a.size() > b.size(); });
  return out;
}

// Diameter with `skip` removed; nullopt if empty or disconnected
std::optional<size_t> Diameter(const SimpleGraph &g, int skip = -1) {
  std::optional<size_t> diameter;
  for (int s = 0; s < static_cast<int>(g.size()); ++s) {
    if (s == skip) {
      continue;
    }
    std::vector<int> dist = Bfs(g, s, skip);
    size_t ecc = 0;
    for (int v = 0; v < static_cast<int>(g.size()); ++v) {
      if (v == skip) {
        continue;
      }
      if (dist[v] < 0) {
        return std::nullopt;
      }
      ecc = std::max(ecc, static_cast<size_t>(dist[v]));
    }
    diameter = std::max(diameter.value_or(0), ecc);
  }
  return diameter;
}

double Clustering(const SimpleGraph &g, int v) {
  const auto &nbrs = g.adj[v];
  const size_t k = nbrs.size();
  if (k < 2) {
    return 0.0;
  }
  size_t triangles = 0;
  for (size_t i = 0; i < k; ++i) {
    for (size_t j = i + 1; j < k; ++j) {
      if (g.Adjacent(nbrs[i], nbrs[j])) {
        ++triangles;
      }
    }
  }
  return 2.0 * static_cast<double>(triangles) / static_cast<double>(k * (k - 1));
}

/**
 * Brandes' algorithm, unweighted. Raw scores count ordered (s, t) pairs;
 * node scores are normalized by (n-1)(n-2), edge scores by n(n-1).
 */
void Betweenness(const SimpleGraph &g, std::vector<double> &node, std::map<Edge, double> &edge) {
  const int n = static_cast<int>(g.size());
  node.assign(n, 0.0);
  edge.clear();
  for (const auto &[e, links] : g.edge_links) {
    edge[e] = 0.0;
  }

  for (int s = 0; s < n; ++s) {
    std::vector<int> order;
    std::vector<std::vector<int>> pred(n);
    std::vector<double> sigma(n, 0.0);
    std::vector<int> dist(n, -1);
    std::deque<int> queue;
    sigma[s] = 1.0;
    dist[s] = 0;
    queue.push_back(s);
    while (!queue.empty()) {
      int v = queue.front();
      queue.pop_front();
      order.push_back(v);
      for (int w : g.adj[v]) {
        if (dist[w] < 0) {
          dist[w] = dist[v] + 1;
          queue.push_back(w);
        }
        if (dist[w] == dist[v] + 1) {
          sigma[w] += sigma[v];
          pred[w].push_back(v);
        }
      }
    }

    std::vector<double> delta(n, 0.0);
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
      int w = *it;
      for (int v : pred[w]) {
        double c = sigma[v] / sigma[w] * (1.0 + delta[w]);
        edge[std::minmax(v, w)] += c;
        delta[v] += c;
      }
      if (w != s) {
        node[w] += delta[w];
      }
    }
  }

  if (n > 2) {
    const double scale = 1.0 / (static_cast<double>(n - 1) * static_cast<double>(n - 2));
    for (double &b : node) {
      b *= scale;
    }
  } else {
    std::fill(node.begin(), node.end(), 0.0);
  }
  if (n > 1) {
    const double scale = 1.0 / (static_cast<double>(n) * static_cast<double>(n - 1));
    for (auto &[e, b] : edge) {
      b *= scale;
    }
  }
}

struct CutStructure {
  std::vector<bool> articulation;
  std::vector<Edge> bridges;
  std::vector<size_t> subtree;              // DFS subtree sizes
  std::vector<int> parent;
};

// Iterative Tarjan: articulation points and bridges
CutStructure FindCuts(const SimpleGraph &g) {
  const int n = static_cast<int>(g.size());
  CutStructure cuts;
  cuts.articulation.assign(n, false);
  cuts.subtree.assign(n, 1);
  cuts.parent.assign(n, -1);
  std::vector<int> disc(n, -1), low(n, 0);
  std::vector<size_t> next(n, 0);
  int timer = 0;

  for (int root = 0; root < n; ++root) {
    if (disc[root] >= 0) {
      continue;
    }
    int root_children = 0;
    disc[root] = low[root] = timer++;
    std::stack<int> stack;
    stack.push(root);
    while (!stack.empty()) {
      int v = stack.top();
      if (next[v] < g.adj[v].size()) {
        int w = g.adj[v][next[v]++];
        if (disc[w] < 0) {
          cuts.parent[w] = v;
          disc[w] = low[w] = timer++;
          if (v == root) {
            ++root_children;
          }
          stack.push(w);
        } else if (w != cuts.parent[v]) {
          low[v] = std::min(low[v], disc[w]);
        }
        continue;
      }
      stack.pop();
      int p = cuts.parent[v];
      if (p < 0) {
        continue;
      }
      low[p] = std::min(low[p], low[v]);
      cuts.subtree[p] += cuts.subtree[v];
      if (low[v] > disc[p]) {
        cuts.bridges.push_back(std::minmax(p, v));
      }
      if (p != root && low[v] >= disc[p]) {
        cuts.articulation[p] = true;
      }
    }
    if (root_children > 1) {
      cuts.articulation[root] = true;
    }
  }
  return cuts;
}

// Share of values strictly below `value` among the other entries
double Percentile(const std::vector<double> &values, double value) {
  if (values.size() < 2) {
    return 0.0;
  }
  size_t below = static_cast<size_t>(
      std::count_if(values.begin(), values.end(), [&](double v) { return v < value; }));
  return static_cast<double>(below) / static_cast<double>(values.size() - 1);
}

Finding MakeFinding(FindingType type, std::vector<std::string> subjects, size_t affected_nodes,
                    size_t total_nodes, size_t affected_links, double percentile) {
  Finding f;
  f.type = type;
  f.subjects = std::move(subjects);
  f.affected_nodes = affected_nodes;
  f.affected_links = affected_links;
  f.centrality_percentile = percentile;
  const double ratio = total_nodes > 0 ? static_cast<double>(affected_nodes) /
                                             static_cast<double>(total_nodes)
                                       : 0.0;
  f.risk_score = RiskScore(ratio, affected_links, percentile);
  f.severity = SeverityForScore(f.risk_score);
  return f;
}

} // namespace

GraphAnalytics::GraphAnalytics(AnalysisOptions options) : options_(options) {}

AnalysisReport GraphAnalytics::Analyze(const TopologyGraph &graph) const {
  AnalysisReport report;
  report.snapshot_version = graph.version;
  const SimpleGraph g = BuildGraph(graph, options_.include_offline);
  const size_t n = g.size();
  const size_t m = g.edge_links.size();
  report.node_count = n;
  report.edge_count = m;

  // ========== Degree, density ==========
  for (size_t v = 0; v < n; ++v) {
    report.degree[g.keys[v]] = g.adj[v].size();
    ++report.degree_distribution[g.adj[v].size()];
  }
  if (n > 0) {
    report.average_degree = 2.0 * static_cast<double>(m) / static_cast<double>(n);
  }
  if (n > 1) {
    report.density = 2.0 * static_cast<double>(m) / (static_cast<double>(n) * (n - 1));
  }

  // ========== Components, diameter ==========
  const auto components = Components(g);
  std::vector<size_t> component_of(n, 0);
  for (size_t c = 0; c < components.size(); ++c) {
    std::vector<std::string> keys;
    for (int v : components[c]) {
      component_of[v] = c;
      keys.push_back(g.keys[v]);
    }
    report.components.push_back(std::move(keys));
  }
  report.diameter = Diameter(g);

  // ========== Clustering, betweenness ==========
  double clustering_sum = 0.0;
  for (size_t v = 0; v < n; ++v) {
    double c = Clustering(g, static_cast<int>(v));
    report.clustering[g.keys[v]] = c;
    clustering_sum += c;
  }
  if (n > 0) {
    report.average_clustering = clustering_sum / static_cast<double>(n);
  }

  std::vector<double> node_betweenness;
  std::map<Edge, double> edge_betweenness;
  Betweenness(g, node_betweenness, edge_betweenness);
  std::vector<double> edge_values;
  for (size_t v = 0; v < n; ++v) {
    report.betweenness[g.keys[v]] = node_betweenness[v];
  }
  for (const auto &[e, b] : edge_betweenness) {
    edge_values.push_back(b);
    for (const auto &link_key : g.edge_links.at(e)) {
      report.edge_betweenness[link_key] = b;
    }
  }

  std::vector<int> ranked(n);
  for (size_t v = 0; v < n; ++v) {
    ranked[v] = static_cast<int>(v);
  }
  std::stable_sort(ranked.begin(), ranked.end(), [&](int a, int b) {
    return node_betweenness[a] > node_betweenness[b];
  });
  for (size_t i = 0; i < std::min(options_.top_n, n); ++i) {
    report.critical_nodes.push_back(g.keys[ranked[i]]);
  }

  // ========== Findings ==========
  const CutStructure cuts = FindCuts(g);
  Findings findings;

  // Single points of failure
  for (size_t v = 0; v < n; ++v) {
    const int node = static_cast<int>(v);
    const double pct = Percentile(node_betweenness, node_betweenness[v]);
    if (cuts.articulation[v]) {
      // Nodes cut off from the largest remaining piece of this component
      std::vector<bool> seen(n, false);
      size_t largest = 0;
      for (int start : g.adj[v]) {
        if (seen[start]) {
          continue;
        }
        std::vector<int> dist = Bfs(g, start, node);
        size_t piece = 0;
        for (size_t u = 0; u < n; ++u) {
          if (dist[u] >= 0) {
            seen[u] = true;
            ++piece;
          }
        }
        largest = std::max(largest, piece);
      }
      const size_t cut_off = components[component_of[v]].size() - 1 - largest;
      Finding f = MakeFinding(FindingType::SINGLE_POINT_OF_FAILURE, {g.keys[v]}, cut_off,
                              n > 1 ? n - 1 : 1, g.adj[v].size(), pct);
      f.description = g.names[v] + " is an articulation point; its failure disconnects " +
                      std::to_string(cut_off) + " device(s)";
      f.recommendation = "Add a redundant path so that devices behind " + g.names[v] +
                         " stay reachable if it fails";
      findings.push_back(std::move(f));
      continue;
    }

    if (report.diameter && *report.diameter > 0 && n > 2 &&
        n <= options_.max_nodes_for_removal_analysis) {
      auto reduced = Diameter(g, node);
      if (reduced && static_cast<double>(*reduced) >
                         options_.diameter_factor * static_cast<double>(*report.diameter)) {
        Finding f = MakeFinding(FindingType::SINGLE_POINT_OF_FAILURE, {g.keys[v]},
                                g.adj[v].size(), n - 1, g.adj[v].size(), pct);
        f.description = "Removing " + g.names[v] + " raises the network diameter from " +
                        std::to_string(*report.diameter) + " to " + std::to_string(*reduced);
        f.recommendation = "Add a shortcut link so traffic through " + g.names[v] +
                           " has an equally short alternative";
        findings.push_back(std::move(f));
      }
    }
  }

  // Bottleneck links
  std::map<Edge, size_t> bridge_far_side;
  for (const Edge &bridge : cuts.bridges) {
    // The DFS child side is the subtree below the deeper endpoint
    int child = cuts.parent[bridge.second] == bridge.first ? bridge.second : bridge.first;
    size_t below = cuts.subtree[child];
    size_t total = components[component_of[child]].size();
    bridge_far_side[bridge] = std::min(below, total - below);
  }
  for (const auto &[e, share] : edge_betweenness) {
    auto bridge = bridge_far_side.find(e);
    const bool heavy = share >= options_.bottleneck_share;
    const bool critical_bridge = bridge != bridge_far_side.end() && bridge->second >= 2;
    if (!heavy && !critical_bridge) {
      continue;
    }
    const size_t affected = bridge != bridge_far_side.end() ? bridge->second : 2;
    const std::vector<std::string> &links = g.edge_links.at(e);
    Finding f = MakeFinding(FindingType::BOTTLENECK_LINK, links, affected, n, links.size(),
                            Percentile(edge_values, share));
    const std::string ends = g.names[e.first] + " - " + g.names[e.second];
    if (critical_bridge) {
      f.description = "Link " + ends + " is the only path to " + std::to_string(affected) +
                      " device(s)";
    } else {
      f.description = "Link " + ends + " carries " +
                      std::to_string(static_cast<int>(share * 100.0 + 0.5)) +
                      "% of shortest paths";
    }
    f.recommendation = "Add a parallel link or an alternate path between " + g.names[e.first] +
                       " and " + g.names[e.second];
    findings.push_back(std::move(f));
  }

  // High-load nodes
  for (size_t v = 0; v < n; ++v) {
    if (node_betweenness[v] < options_.high_load_threshold || node_betweenness[v] <= 0.0) {
      continue;
    }
    Finding f = MakeFinding(FindingType::HIGH_LOAD_NODE, {g.keys[v]}, g.adj[v].size(),
                            n > 1 ? n - 1 : 1, g.adj[v].size(),
                            Percentile(node_betweenness, node_betweenness[v]));
    f.description = g.names[v] + " lies on " +
                    std::to_string(static_cast<int>(node_betweenness[v] * 100.0 + 0.5)) +
                    "% of shortest paths between other devices";
    f.recommendation = "Spread traffic away from " + g.names[v] + " or add capacity around it";
    findings.push_back(std::move(f));
  }

  // Fragmentation
  if (components.size() > 1) {
    std::vector<std::string> outside;
    for (size_t c = 1; c < components.size(); ++c) {
      for (int v : components[c]) {
        outside.push_back(g.keys[v]);
      }
    }
    std::sort(outside.begin(), outside.end());
    const size_t affected = outside.size();
    Finding f = MakeFinding(FindingType::CONNECTIVITY_RISK, outside, affected, n, 0, 0.0);
    f.description = "Topology is split into " + std::to_string(components.size()) +
                    " segments; " + std::to_string(affected) +
                    " device(s) are unreachable from the main segment";
    f.recommendation = "Check cabling and discovery coverage for devices outside the main "
                       "segment";
    findings.push_back(std::move(f));
  }

  const int64_t now = util::GetTime();
  for (auto &f : findings) {
    f.snapshot_version = graph.version;
    f.detected_at = now;
  }
  std::stable_sort(findings.begin(), findings.end(), [](const Finding &a, const Finding &b) {
    if (a.risk_score != b.risk_score) {
      return a.risk_score > b.risk_score;
    }
    return a.Id() < b.Id();
  });
  report.findings = std::move(findings);

  LOG_ANALYTICS_DEBUG("analyzed version {}: {} node(s), {} edge(s), {} component(s), "
                      "diameter {}, {} finding(s)",
                      graph.version, n, m, report.components.size(),
                      report.diameter ? std::to_string(*report.diameter) : "n/a",
                      report.findings.size());
  return report;
}

} // namespace analytics
} // namespace topowatch
