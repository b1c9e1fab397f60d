#include "mcsim/engine/simulation_engine.hpp"
#include "mcsim/protocol/message_codec.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace mcsim {

namespace {

constexpr const char* kRunPrefix = "RUN ";

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SimulationEngine::SimulationEngine(std::string cmd_endpoint,
                                   std::string pub_endpoint)
    : cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
SimulationEngine::~SimulationEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SimulationEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Progress tracker (read by STATUS) --------------------------------
  subscriptions_.push_back(worker_.eventBus().subscribe(
      [this](const Event& event) {
        std::visit([this](const auto& e) { last_progress_.store(e.progress); },
                   event);
      }));

  // ---  2) Worker thread ----------------------------------------------------
  worker_.start();

  // ---  3) Server (commands + event publication) ---------------------------
  if (!cmd_endpoint_.empty() && !pub_endpoint_.empty()) {
    server_ = std::make_unique<SimulationServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        cmd_endpoint_, pub_endpoint_);
    try {
      server_->start();
    } catch (const std::exception& e) {
      std::cerr << "[SimulationEngine] server failed to start: " << e.what()
                << "\n";
      server_.reset();
      for (auto id : subscriptions_) {
        worker_.eventBus().unsubscribe(id);
      }
      subscriptions_.clear();
      worker_.stop();
      throw;
    }

    SimulationServer* server = server_.get();
    subscriptions_.push_back(worker_.eventBus().subscribe(
        [server](const Event& event) { server->pushEvent(event); }));
  }

  running_ = true;

  std::cout << "[SimulationEngine] started. Threads: simulation_worker"
            << (server_ ? ", server" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SimulationEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop the worker first: once joined, nothing publishes on the bus,
  //          so no subscriber can reach a destroyed server ------------------
  worker_.stop();

  // ---  2) Stop the server (events already queued are still published) -----
  server_.reset();

  // ---  3) Drop the engine's subscriptions ----------------------------------
  for (auto id : subscriptions_) {
    worker_.eventBus().unsubscribe(id);
  }
  subscriptions_.clear();

  running_ = false;

  std::cout << "[SimulationEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// submit() / cancel()
// -----------------------------------------------------------------------------
std::uint64_t SimulationEngine::submit(domain::SimulationRequest request) {
  return worker_.submit(std::move(request));
}

void SimulationEngine::cancel() { worker_.cancel(); }

// -----------------------------------------------------------------------------
// executeCommand(): handle host command requests
// -----------------------------------------------------------------------------
std::string SimulationEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["busy"] = worker_.isBusy();
    response["progress"] = last_progress_.load();
    response["queued"] = worker_.queued();
    response["runs_completed"] = worker_.runsCompleted();
    response["runs_failed"] = worker_.runsFailed();
    response["runs_cancelled"] = worker_.runsCancelled();
  } else if (cmd.rfind(kRunPrefix, 0) == 0) {
    try {
      auto request =
          MessageCodec::decode_request(cmd.substr(std::string(kRunPrefix).size()));
      std::uint64_t run_id = worker_.submit(std::move(request));
      response["status"] = "ok";
      response["response"] = "Simulation queued";
      response["run_id"] = run_id;
      std::cout << "[SimulationEngine] run " << run_id << " queued.\n";
    } catch (const MessageError& e) {
      response["status"] = "error";
      response["response"] = e.what();
      std::cerr << "[SimulationEngine] RUN rejected: " << e.what() << "\n";
    }
  } else if (cmd == "CANCEL") {
    worker_.cancel();
    response["status"] = "ok";
    response["response"] = "Cancel requested";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace mcsim
