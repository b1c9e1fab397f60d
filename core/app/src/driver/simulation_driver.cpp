#include "mcsim/driver/simulation_driver.hpp"
#include "mcsim/estimation/parameter_estimator.hpp"
#include "mcsim/random/mt19937_uniform_source.hpp"
#include "mcsim/simulation/path_simulator.hpp"

#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mcsim {

namespace {

// 64-bit seed from the OS entropy source, for requests without a seed.
std::uint64_t fresh_seed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

}  // namespace

// -----------------------------------------------------------------------------
// run(): validate → estimate → simulate
// -----------------------------------------------------------------------------
std::optional<domain::SimulationResult> SimulationDriver::run(
    const domain::SimulationRequest& request, std::uint64_t run_id,
    const std::atomic<bool>* cancel_flag) {
  validate_request(request);

  ParameterEstimator estimator(request.lookback_period,
                               request.portfolio_amount);
  domain::AssetParameterSet params =
      estimator.estimate(request.sample_prices, request.allocations);

  PathSimulator simulator(params, request.time_steps);

  RunSettings settings;
  settings.total_simulations = request.total_simulations;
  settings.batch_size = request.batch_size;
  settings.seed = request.seed ? *request.seed : fresh_seed();

  std::cout << "[SimulationDriver] run " << run_id << ": "
            << settings.total_simulations << " simulations x "
            << request.time_steps << " steps, " << params.size()
            << " asset(s), initial value " << simulator.initial_value()
            << ", seed " << settings.seed << "\n";

  return execute(simulator, settings, run_id, cancel_flag);
}

// -----------------------------------------------------------------------------
// execute(): repetition loop with progress, then aggregation
// -----------------------------------------------------------------------------
std::optional<domain::SimulationResult> SimulationDriver::execute(
    const IPathSimulator& simulator, const RunSettings& settings,
    std::uint64_t run_id, const std::atomic<bool>* cancel_flag) {
  if (settings.total_simulations < 1) {
    throw std::invalid_argument("total_simulations must be >= 1");
  }
  if (settings.batch_size < 1) {
    throw std::invalid_argument("batch_size must be >= 1");
  }

  const int total = settings.total_simulations;
  const auto batch_size = static_cast<std::size_t>(settings.batch_size);

  std::vector<domain::SimulationPath> paths;
  paths.reserve(static_cast<std::size_t>(total));
  std::vector<domain::SimulationPath> pending;
  int last_progress = 0;

  CompletionEvent done;
  domain::SimulationResult result;

  try {
    for (int i = 0; i < total; ++i) {
      // --- Yield point: cancellation is only observed between simulations --
      if (cancel_flag != nullptr && cancel_flag->load()) {
        std::cout << "[SimulationDriver] run " << run_id << " cancelled after "
                  << i << "/" << total << " simulations.\n";
        return std::nullopt;
      }

      Mt19937UniformSource source(settings.seed, static_cast<std::uint64_t>(i));
      domain::SimulationPath path = simulator.simulate(source);

      paths.push_back(path);
      pending.push_back(std::move(path));

      const int completed = i + 1;
      if (pending.size() >= batch_size || completed == total) {
        last_progress = progress_percent(completed, total);

        ProgressEvent progress;
        progress.run_id = run_id;
        progress.progress = last_progress;
        progress.completed = completed;
        progress.total = total;
        progress.batch = std::move(pending);
        pending.clear();

        bus_.publish(progress);
      }

      std::this_thread::yield();
    }

    // --- All paths collected: aggregate exactly once ------------------------
    done.run_id = run_id;
    done.progress = 100;
    done.final_data = aggregator_.aggregate(paths, simulator.time_steps());
    done.outcome = analyzer_.analyze(paths, simulator.initial_value());

    result.final_data = done.final_data;
    result.outcome = done.outcome;
    result.simulations_completed = total;
  } catch (const std::exception& e) {
    std::cerr << "[SimulationDriver] run " << run_id
              << " FAILED after " << paths.size() << "/" << total
              << " simulations: " << e.what() << "\n";

    FailureEvent failure;
    failure.run_id = run_id;
    failure.progress = last_progress;
    failure.reason = e.what();
    bus_.publish(failure);

    throw SimulationError("run " + std::to_string(run_id) +
                          " aborted: " + e.what());
  }

  // --- Terminal signal, outside the try: once the CompletionEvent has gone
  //     out, no FailureEvent may follow it -------------------------------------
  try {
    bus_.publish(done);
  } catch (const std::exception& e) {
    std::cerr << "[SimulationDriver] run " << run_id
              << " completion subscriber threw: " << e.what() << "\n";
    throw SimulationError("run " + std::to_string(run_id) +
                          " completion not delivered: " + e.what());
  }

  std::cout << "[SimulationDriver] run " << run_id << " done: median final "
            << result.outcome.expected_value << " (p5 "
            << result.outcome.worst_case << ", p95 "
            << result.outcome.best_case << ").\n";

  return result;
}

// -----------------------------------------------------------------------------
// validate_request()
// -----------------------------------------------------------------------------
void validate_request(const domain::SimulationRequest& request) {
  if (request.total_simulations < 1) {
    throw std::invalid_argument("totalSimulations must be >= 1, got " +
                                std::to_string(request.total_simulations));
  }
  if (request.time_steps < 0) {
    throw std::invalid_argument("timeSteps must be >= 0, got " +
                                std::to_string(request.time_steps));
  }
  if (request.lookback_period < 1) {
    throw std::invalid_argument("lookbackPeriod must be >= 1, got " +
                                std::to_string(request.lookback_period));
  }
  if (request.batch_size < 1) {
    throw std::invalid_argument("batchSize must be >= 1, got " +
                                std::to_string(request.batch_size));
  }
  if (!(request.portfolio_amount >= 0.0)) {
    throw std::invalid_argument("portfolioAmount must be >= 0");
  }
}

// -----------------------------------------------------------------------------
// progress_percent()
// -----------------------------------------------------------------------------
// Integer arithmetic: 29 / 100 * 100.0 is 28.999... in double.
int progress_percent(int completed, int total) {
  return static_cast<int>(static_cast<long long>(completed) * 100 / total);
}

}  // namespace mcsim
