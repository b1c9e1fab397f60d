#pragma once

#include "mcsim/concurrent/thread_safe_queue.hpp"
#include "mcsim/domain/simulation_request.hpp"
#include "mcsim/driver/simulation_driver.hpp"
#include "mcsim/eventbus/event_bus.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace mcsim {

// -----------------------------------------------------------------------------
// SimulationWorker
// -----------------------------------------------------------------------------
// Responsibility: Owns one background thread that drains a queue of
// SimulationRequests and runs each through a SimulationDriver. Every
// ProgressEvent / CompletionEvent / FailureEvent of those runs is published
// on the worker's EventBus, on the worker thread.
//
// Why in architecture: Simulation work must never run on the host's thread.
// The host (SimulationEngine, the CLI, a test) submits requests and
// subscribes to the bus; the worker runs one request at a time in FIFO
// order, a single logical thread of simulation work.
//
// Cancellation: cancel() raises a flag that the driver checks between two
// simulations; the run in flight stops without a terminal event. The flag
// is cleared when the next request starts, so cancel() never affects a
// request still waiting in the queue.
//
// Thread model: start(), stop(), submit(), cancel() and the accessors are
// safe from any thread. Bus subscribers run on the worker thread and must
// hand results to other threads themselves (e.g. via a ThreadSafeQueue).
// -----------------------------------------------------------------------------
class SimulationWorker {
 public:
  SimulationWorker() = default;

  // Stops and joins the thread; queued requests that never started are
  // dropped.
  ~SimulationWorker();

  // Owns a thread, a queue and a bus; neither copyable nor movable.
  SimulationWorker(const SimulationWorker&) = delete;
  SimulationWorker& operator=(const SimulationWorker&) = delete;
  SimulationWorker(SimulationWorker&&) = delete;
  SimulationWorker& operator=(SimulationWorker&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Spawns the worker thread. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Cancels the run in flight (at its next yield point), stops the
  // loop, joins the thread and drops requests that never started.
  // Idempotent; start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // submit(request)
  // -------------------------------------------------------------------------
  // What: Validates the request and queues it.
  // Output: The run id carried by every event of this run.
  // Throws: std::invalid_argument if validate_request() rejects it; nothing
  // is queued in that case.
  // -------------------------------------------------------------------------
  std::uint64_t submit(domain::SimulationRequest request);

  // -------------------------------------------------------------------------
  // cancel()
  // -------------------------------------------------------------------------
  // What: Requests cancellation of the run in flight, if any.
  // -------------------------------------------------------------------------
  void cancel() { cancel_requested_.store(true); }

  // True while a request is being run (not while merely queued).
  bool isBusy() const { return busy_.load(); }

  // Requests waiting behind the current run.
  std::size_t queued() const { return queue_.size(); }

  int runsCompleted() const { return runs_completed_.load(); }
  int runsFailed() const { return runs_failed_.load(); }
  int runsCancelled() const { return runs_cancelled_.load(); }

  // Bus on which the driver publishes. Subscribe before submit() to see
  // every event of a run.
  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  struct Job {
    std::uint64_t run_id{0};
    domain::SimulationRequest request;
  };

  // Worker thread entry point: try_pop(); run the job or idle-wait.
  void run();

  // Runs one job through the driver and books the outcome.
  void process(const Job& job);

  ThreadSafeQueue<Job> queue_;

  // Declared before driver_, which holds a reference to it.
  EventBus bus_;
  SimulationDriver driver_{bus_};

  std::atomic<bool> running_{false};
  std::atomic<bool> busy_{false};
  std::atomic<bool> cancel_requested_{false};
  std::atomic<std::uint64_t> next_run_id_{1};

  std::atomic<int> runs_completed_{0};
  std::atomic<int> runs_failed_{0};
  std::atomic<int> runs_cancelled_{0};

  // Wakes the idle worker in stop().
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::thread thread_;
};

}  // namespace mcsim
