#include "mcsim/concurrent/simulation_worker.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace mcsim {

namespace {

// How long the idle worker waits before re-checking running_ and the queue.
// Short enough that a submitted request starts promptly and stop() is
// responsive; long enough to avoid busy-waiting.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
SimulationWorker::~SimulationWorker() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SimulationWorker::start() {
  if (thread_.joinable()) {
    return;
  }

  // running_ must be true before the thread's first loop check.
  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[SimulationWorker] started.\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SimulationWorker::stop() {
  if (!thread_.joinable()) {
    return;
  }

  // running_ first: process() re-raises the cancel flag when it sees
  // running_ == false, so a job popped concurrently with stop() is cancelled
  // at its first yield point instead of running to completion.
  running_.store(false);
  cancel_requested_.store(true);
  stop_cv_.notify_all();

  thread_.join();

  std::size_t dropped = queue_.clear();
  if (dropped > 0) {
    std::cerr << "[SimulationWorker] dropped " << dropped
              << " queued request(s) on stop.\n";
  }
  std::cout << "[SimulationWorker] stopped.\n";
}

// -----------------------------------------------------------------------------
// submit(): validate on the caller's thread, then queue
// -----------------------------------------------------------------------------
std::uint64_t SimulationWorker::submit(domain::SimulationRequest request) {
  validate_request(request);

  Job job;
  job.run_id = next_run_id_.fetch_add(1);
  job.request = std::move(request);

  const std::uint64_t id = job.run_id;
  queue_.push(std::move(job));
  return id;
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void SimulationWorker::run() {
  while (running_.load()) {
    std::optional<Job> job = queue_.try_pop();

    if (job) {
      process(*job);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

// -----------------------------------------------------------------------------
// process(): one request through the driver
// -----------------------------------------------------------------------------
void SimulationWorker::process(const Job& job) {
  // A cancel() issued before this run started belongs to an earlier run.
  cancel_requested_.store(false);
  if (!running_.load()) {
    cancel_requested_.store(true);
  }
  busy_.store(true);

  try {
    auto result = driver_.run(job.request, job.run_id, &cancel_requested_);
    if (result) {
      runs_completed_.fetch_add(1);
    } else {
      runs_cancelled_.fetch_add(1);
    }
  } catch (const SimulationError& e) {
    // Terminal event already published by the driver.
    runs_failed_.fetch_add(1);
    std::cerr << "[SimulationWorker] " << e.what() << "\n";
  } catch (const std::exception& e) {
    // Failed before the first simulation (e.g. during estimation): the
    // driver published nothing, so the terminal failure signal is sent here.
    runs_failed_.fetch_add(1);
    std::cerr << "[SimulationWorker] run " << job.run_id
              << " could not start: " << e.what() << "\n";

    FailureEvent failure;
    failure.run_id = job.run_id;
    failure.progress = 0;
    failure.reason = e.what();
    bus_.publish(failure);
  }

  busy_.store(false);
}

}  // namespace mcsim
