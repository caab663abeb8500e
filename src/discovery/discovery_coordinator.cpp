// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/discovery_coordinator.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <memory>
#include <iterator>
#include <thread>
#include <tuple>

namespace topowatch {
namespace discovery {

std::chrono::milliseconds BackoffPolicy::Delay(int retry) const {
  double delay = static_cast<double>(initial.count()) * std::pow(multiplier, retry);
  if (!std::isfinite(delay) || delay > static_cast<double>(max.count())) {
    return max;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::string PairStatusToString(PairStatus status) {
  switch (status) {
  case PairStatus::SUCCESS:
    return "success";
  case PairStatus::PARTIAL_SUCCESS:
    return "partial-success";
  case PairStatus::FAILED:
    return "failed";
  }
  return "unknown";
}

size_t RoundResult::SuccessCount() const {
  return static_cast<size_t>(std::count_if(pairs.begin(), pairs.end(), [](const PairReport &p) {
    return p.status != PairStatus::FAILED;
  }));
}

size_t RoundResult::FailureCount() const { return pairs.size() - SuccessCount(); }

bool RoundResult::TotalFailure() const {
  return deadline_exceeded && SuccessCount() == 0;
}

DiscoveryCoordinator::DiscoveryCoordinator(ProbeRegistry registry)
    : registry_(std::move(registry)) {}

namespace {

// Sleep for `delay`, returning early (false) if the token fires
bool InterruptibleSleep(std::chrono::milliseconds delay, const CancellationToken &token) {
  const auto until = CancellationToken::Clock::now() + delay;
  while (CancellationToken::Clock::now() < until) {
    if (token.IsCancelled()) {
      return false;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        until - CancellationToken::Clock::now());
    std::this_thread::sleep_for(std::clamp(left, std::chrono::milliseconds(1),
                                           std::chrono::milliseconds(20)));
  }
  return !token.IsCancelled();
}

int RetryLimit(ProbeErrorCode code, const RoundConfig &config) {
  switch (code) {
  case ProbeErrorCode::TIMEOUT:
    return config.max_retries;
  case ProbeErrorCode::UNREACHABLE:
    return std::min(config.max_retries, config.max_unreachable_retries);
  default:
    return 0;
  }
}

struct PairTask {
  Target target;
  std::string probe_id;
  ProbePtr probe;
  ObservationSet records;
  std::future<PairReport> future;
  std::optional<PairReport> report;
};

} // namespace

PairReport DiscoveryCoordinator::RunPair(const Target &target, Probe &probe,
                                         const RoundConfig &config,
                                         const CancellationToken &round_token,
                                         ObservationSet &records) {
  PairReport report;
  report.target = target.id;
  report.probe = probe.id();
  const auto start = std::chrono::steady_clock::now();

  int retries = 0;
  while (true) {
    if (round_token.IsCancelled()) {
      report.error = ProbeError{ProbeErrorCode::TIMEOUT, "round deadline reached"};
      break;
    }

    ++report.attempts;
    ProbeResult result;
    try {
      result = probe.Run(target, config.probe_timeout, round_token);
    } catch (const std::exception &e) {
      result = ProbeResult::Failure(ProbeErrorCode::INTERNAL, e.what());
    }

    report.observations += result.observations.size();
    std::move(result.observations.begin(), result.observations.end(),
              std::back_inserter(records));

    if (!result.error) {
      report.error.reset();
      break;
    }
    report.error = result.error;
    LOG_DISC_DEBUG("{}/{} attempt {} failed: {}", target.id, probe.id(), report.attempts,
                   result.error->ToString());

    if (retries >= RetryLimit(result.error->code, config)) {
      break;
    }
    if (!InterruptibleSleep(config.backoff.Delay(retries), round_token)) {
      report.error = ProbeError{ProbeErrorCode::TIMEOUT, "round deadline reached during backoff"};
      break;
    }
    ++retries;
  }

  if (!report.error) {
    report.status = PairStatus::SUCCESS;
  } else if (report.observations > 0) {
    report.status = PairStatus::PARTIAL_SUCCESS;
  } else {
    report.status = PairStatus::FAILED;
  }
  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  return report;
}

RoundResult DiscoveryCoordinator::RunRound(const std::vector<Target> &targets,
                                           const std::vector<std::string> &probe_set,
                                           const RoundConfig &config) {
  RoundResult result;
  result.round_id = next_round_id_.fetch_add(1);
  result.started_at = util::GetTime();

  std::vector<std::unique_ptr<PairTask>> tasks;
  for (const auto &target : targets) {
    for (const auto &probe_id : probe_set) {
      if (!target.WantsProbe(probe_id)) {
        continue;
      }
      auto task = std::make_unique<PairTask>();
      task->target = target;
      task->probe_id = probe_id;
      task->probe = registry_.Create(probe_id);
      if (!task->probe) {
        PairReport report;
        report.target = target.id;
        report.probe = probe_id;
        report.error = ProbeError{ProbeErrorCode::INTERNAL, "unknown probe " + probe_id};
        task->report = std::move(report);
      }
      tasks.push_back(std::move(task));
    }
  }

  LOG_DISC_INFO("round {}: {} target(s), {} pair(s)", result.round_id, targets.size(),
                tasks.size());

  const auto deadline = CancellationToken::Clock::now() + config.round_deadline;
  CancellationToken round_token = CancellationToken::WithDeadline(deadline);

  size_t runnable = static_cast<size_t>(std::count_if(
      tasks.begin(), tasks.end(), [](const auto &t) { return !t->report.has_value(); }));

  if (runnable > 0) {
    size_t workers = std::max<size_t>(1, std::min(config.max_concurrency, runnable));
    util::ThreadPool pool(workers, "round-" + std::to_string(result.round_id));

    for (auto &task : tasks) {
      if (task->report) {
        continue;
      }
      PairTask *t = task.get();
      t->future = pool.enqueue([this, t, &config, round_token]() {
        return RunPair(t->target, *t->probe, config, round_token, t->records);
      });
    }

    // Pairs not finished by the deadline are failed as timed out even if the
    // probe returns cleanly after cancellation
    std::vector<bool> late(tasks.size(), false);
    for (size_t i = 0; i < tasks.size(); ++i) {
      if (tasks[i]->report) {
        continue;
      }
      if (tasks[i]->future.wait_until(deadline) != std::future_status::ready) {
        late[i] = true;
      }
    }
    if (std::find(late.begin(), late.end(), true) != late.end()) {
      result.deadline_exceeded = true;
      round_token.Cancel();
      LOG_DISC_WARN("round {}: deadline exceeded, cancelling outstanding probes",
                    result.round_id);
    }

    for (size_t i = 0; i < tasks.size(); ++i) {
      auto &task = tasks[i];
      if (task->report) {
        continue;
      }
      PairReport report = task->future.get();
      if (late[i]) {
        report.status = PairStatus::FAILED;
        report.error = ProbeError{ProbeErrorCode::TIMEOUT, "round deadline exceeded"};
      }
      task->report = std::move(report);
    }
  }

  std::sort(tasks.begin(), tasks.end(), [](const auto &a, const auto &b) {
    return std::tie(a->target.id, a->probe_id) < std::tie(b->target.id, b->probe_id);
  });
  for (auto &task : tasks) {
    std::move(task->records.begin(), task->records.end(), std::back_inserter(result.records));
    result.pairs.push_back(std::move(*task->report));
  }

  result.finished_at = util::GetTime();
  LOG_DISC_INFO("round {}: {} record(s), {} ok, {} failed{}", result.round_id,
                result.records.size(), result.SuccessCount(), result.FailureCount(),
                result.deadline_exceeded ? " (deadline exceeded)" : "");
  return result;
}

} // namespace discovery
} // namespace topowatch
