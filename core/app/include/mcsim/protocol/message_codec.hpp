#pragma once

#include "mcsim/domain/outcome_summary.hpp"
#include "mcsim/domain/simulation_path.hpp"
#include "mcsim/domain/simulation_request.hpp"
#include "mcsim/events/event.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace mcsim {

// -----------------------------------------------------------------------------
// MessageError
// -----------------------------------------------------------------------------
// Thrown by MessageCodec::decode_request() for anything that is not a usable
// input message: invalid JSON, wrong types, missing samplePrices, values
// rejected by validate_request().
// -----------------------------------------------------------------------------
class MessageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// MessageCodec — JSON wire format between the engine and its host
// -----------------------------------------------------------------------------
//
// @brief  Decodes the host's input message into a SimulationRequest and
//         encodes run events into the host's progress / terminal messages.
//
// @details
// Input message (every field but samplePrices optional):
//   {
//     "totalSimulations": 1000,
//     "timeSteps":        1260,
//     "samplePrices":     {"AAPL": [187.2, 188.0, ...], ...},
//     "allocations":      {"AAPL": 60.0, "MSFT": 40.0},
//     "lookbackPeriod":   252,
//     "portfolioAmount":  100000,
//     "batchSize":        1,
//     "seed":             42
//   }
//
// Progress message:
//   {"progress": 37, "batch": [[{"day": 0, "value": 100000.0}, ...], ...]}
//
// Terminal message (exactly once per successful run):
//   {"progress": 100,
//    "finalData": [{"day": 0, "percentile_5": ..., "percentile_50": ...,
//                   "percentile_95": ...}, ...],
//    "done": true}
//
// Failure message (instead of the terminal message):
//   {"progress": 37, "error": "...", "done": false}
//
// Key names follow what the charting host already consumes; run_id and the
// outcome summary are not part of the streamed messages.
//
// Thread model:
//   Stateless; every method is static.
// -----------------------------------------------------------------------------
class MessageCodec {
 public:
  // @throws MessageError
  static domain::SimulationRequest decode_request(const std::string& payload);

  // @throws MessageError
  static domain::SimulationRequest decode_request(const nlohmann::json& j);

  static nlohmann::json encode_path(const domain::SimulationPath& path);
  static nlohmann::json encode_progress(const ProgressEvent& e);
  static nlohmann::json encode_completion(const CompletionEvent& e);
  static nlohmann::json encode_failure(const FailureEvent& e);

  // Outcome summary, keyed the way the results view names its figures
  // (expectedValue, worstCase, probOfPositiveReturn, ...).
  static nlohmann::json encode_outcome(const domain::OutcomeSummary& o);

  // Serialized message for any event kind.
  static std::string encode_event(const Event& event);
};

}  // namespace mcsim
