// -----------------------------------------------------------------------------
// mcsim_engine — single executable entry point.
//
// Server mode (no argument):
//   1) Create the SimulationEngine with the default endpoints and start it.
//      The host sends "RUN <input json>" on tcp://127.0.0.1:5556 and
//      subscribes to progress / terminal messages on tcp://127.0.0.1:5557.
//   2) Wait on the main thread until Ctrl-C.
//   3) Shut down cleanly.
//
// Local mode (mcsim_engine request.json):
//   1) Decode the input message from the file.
//   2) Start an engine without sockets and submit the request.
//   3) Log progress, wait for the terminal event, print the outcome report.
//   Exit status 0 on success, 1 on a failed run or an unreadable request.
//
// Thread layout:
//   main thread              → lifecycle, waits for shutdown / result
//   simulation worker thread → SimulationDriver
//   server thread            → REP commands + PUB events (server mode only)
// -----------------------------------------------------------------------------

#include "mcsim/concurrent/thread_safe_queue.hpp"
#include "mcsim/engine/simulation_engine.hpp"
#include "mcsim/events/event.hpp"
#include "mcsim/protocol/message_codec.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <variant>

// -----------------------------------------------------------------------------
// Shutdown flag for the SIGINT handler. The only global in the program; the
// handler does nothing but an atomic store.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

// -----------------------------------------------------------------------------
// print_outcome
// -----------------------------------------------------------------------------
// Human-readable report of a completed run on stdout.
// -----------------------------------------------------------------------------
static void print_outcome(const mcsim::CompletionEvent& e) {
  const auto& o = e.outcome;

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "\n=== Simulation Results ===\n"
            << "Initial value:         " << o.initial_value << "\n"
            << "Expected value (p50):  " << o.expected_value << "\n"
            << "Worst case (p5):       " << o.worst_case << "\n"
            << "Best case (p95):       " << o.best_case << "\n"
            << "Expected return:       " << o.expected_return_pct << " %\n"
            << "P(return > 0):         " << o.prob_positive_return << " %\n"
            << "P(return > 10%):       " << o.prob_return_above_10 << " %\n"
            << "P(return > 20%):       " << o.prob_return_above_20 << " %\n"
            << "P(loss > 10%):         " << o.prob_loss_above_10 << " %\n"
            << "P(loss > 20%):         " << o.prob_loss_above_20 << " %\n";

  if (!e.final_data.empty()) {
    const auto& last = e.final_data.back();
    std::cout << "Day " << last.day << " band: p5=" << last.p5
              << " p50=" << last.p50 << " p95=" << last.p95 << "\n";
  }
}

// -----------------------------------------------------------------------------
// run_server
// -----------------------------------------------------------------------------
static int run_server() {
  mcsim::SimulationEngine engine;

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] engine failed to start: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] Commands on tcp://127.0.0.1:5556, progress on "
               "tcp://127.0.0.1:5557\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();
  return 0;
}

// -----------------------------------------------------------------------------
// run_local
// -----------------------------------------------------------------------------
static int run_local(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "[main] cannot open request file: " << path << "\n";
    return 1;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  mcsim::domain::SimulationRequest request;
  try {
    request = mcsim::MessageCodec::decode_request(buffer.str());
  } catch (const mcsim::MessageError& e) {
    std::cerr << "[main] invalid request in " << path << ": " << e.what()
              << "\n";
    return 1;
  }

  // No endpoints: the worker runs without a server.
  mcsim::SimulationEngine engine("", "");

  // Runs on the worker thread; terminal events are handed to main through
  // the queue.
  mcsim::ThreadSafeQueue<mcsim::Event> terminal_events;
  // Log every 10 percentage points.
  int next_log = 0;

  engine.eventBus().subscribe<mcsim::ProgressEvent>(
      [&next_log](const mcsim::ProgressEvent& e) {
        if (e.progress >= next_log) {
          std::cout << "[Progress] " << e.progress << "% (" << e.completed
                    << "/" << e.total << ")\n";
          next_log = e.progress / 10 * 10 + 10;
        }
      });
  engine.eventBus().subscribe<mcsim::CompletionEvent>(
      [&terminal_events](const mcsim::CompletionEvent& e) {
        terminal_events.push(e);
      });
  engine.eventBus().subscribe<mcsim::FailureEvent>(
      [&terminal_events](const mcsim::FailureEvent& e) {
        terminal_events.push(e);
      });

  engine.start();
  engine.submit(std::move(request));

  mcsim::Event terminal = terminal_events.pop();
  engine.stop();

  if (const auto* failure = std::get_if<mcsim::FailureEvent>(&terminal)) {
    std::cerr << "[main] simulation failed at " << failure->progress
              << "%: " << failure->reason << "\n";
    return 1;
  }

  print_outcome(std::get<mcsim::CompletionEvent>(terminal));
  return 0;
}

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [request.json]\n";
    return 1;
  }
  if (argc == 2) {
    return run_local(argv[1]);
  }
  return run_server();
}
