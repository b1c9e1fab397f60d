#include "mcsim/network/simulation_server.hpp"
#include "mcsim/protocol/message_codec.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace mcsim {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
SimulationServer::SimulationServer(CommandHandler command_handler,
                                   std::string cmd_endpoint,
                                   std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
SimulationServer::~SimulationServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn the server thread
// -----------------------------------------------------------------------------
void SimulationServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  // Do not let queued progress messages hold the process open on close.
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[SimulationServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void SimulationServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[SimulationServer] stopped.\n";
}

// -----------------------------------------------------------------------------
// pushEvent(): thread-safe enqueue from the worker thread
// -----------------------------------------------------------------------------
void SimulationServer::pushEvent(Event event) {
  outbound_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined drain/poll loop
// -----------------------------------------------------------------------------
void SimulationServer::run() {
  while (running_.load()) {
    processOutbound();
    processCommands();
  }

  // Final drain so a terminal message queued just before stop() still goes
  // out.
  processOutbound();
}

// -----------------------------------------------------------------------------
// processOutbound(): encode and publish every queued event
// -----------------------------------------------------------------------------
void SimulationServer::processOutbound() {
  while (auto maybe_event = outbound_queue_.try_pop()) {
    std::string json_str = MessageCodec::encode_event(*maybe_event);
    zmq::message_t msg(json_str.data(), json_str.size());
    auto sent = pub_socket_->send(msg, zmq::send_flags::dontwait);
    if (!sent.has_value()) {
      std::cerr << "[SimulationServer] PUB send would block, message dropped.\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll the REP socket and dispatch
// -----------------------------------------------------------------------------
void SimulationServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace mcsim
