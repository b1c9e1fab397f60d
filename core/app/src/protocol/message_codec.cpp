#include "mcsim/protocol/message_codec.hpp"
#include "mcsim/driver/simulation_driver.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <utility>
#include <vector>

namespace mcsim {

namespace {

constexpr std::int64_t kIntMin = std::numeric_limits<int>::min();
constexpr std::int64_t kIntMax = std::numeric_limits<int>::max();

MessageError out_of_range(const char* key, const nlohmann::json& value) {
  return MessageError(std::string(key) + " does not fit an int: " +
                      value.dump());
}

// Integer field of the input message; an absent key keeps fallback.
// Values are range-checked before narrowing: nlohmann's get<int>() would
// truncate 4294967297 to 1.
int read_int(const nlohmann::json& j, const char* key, int fallback) {
  auto it = j.find(key);
  if (it == j.end()) {
    return fallback;
  }
  const nlohmann::json& value = *it;

  if (value.is_number_unsigned()) {
    auto u = value.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(kIntMax)) {
      throw out_of_range(key, value);
    }
    return static_cast<int>(u);
  }
  if (value.is_number_integer()) {
    auto i = value.get<std::int64_t>();
    if (i < kIntMin || i > kIntMax) {
      throw out_of_range(key, value);
    }
    return static_cast<int>(i);
  }
  if (value.is_number_float()) {
    double d = value.get<double>();
    if (!(d >= static_cast<double>(kIntMin) &&
          d <= static_cast<double>(kIntMax)) ||
        d != std::floor(d)) {
      throw out_of_range(key, value);
    }
    return static_cast<int>(d);
  }
  throw MessageError(std::string(key) + " must be an integer, got " +
                     value.type_name());
}

}  // namespace

// -----------------------------------------------------------------------------
// decode_request(string): parse, then decode the object
// -----------------------------------------------------------------------------
domain::SimulationRequest MessageCodec::decode_request(
    const std::string& payload) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error& e) {
    throw MessageError(std::string("invalid JSON: ") + e.what());
  }
  return decode_request(j);
}

// -----------------------------------------------------------------------------
// decode_request(json)
// -----------------------------------------------------------------------------
domain::SimulationRequest MessageCodec::decode_request(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw MessageError("input message must be a JSON object");
  }
  if (!j.contains("samplePrices") || !j.at("samplePrices").is_object()) {
    throw MessageError("input message needs a samplePrices object");
  }

  domain::SimulationRequest request;

  try {
    // Absent keys keep the SimulationRequest defaults; a key present with
    // the wrong type throws.
    request.total_simulations =
        read_int(j, "totalSimulations", request.total_simulations);
    request.time_steps = read_int(j, "timeSteps", request.time_steps);
    request.lookback_period =
        read_int(j, "lookbackPeriod", request.lookback_period);
    request.batch_size = read_int(j, "batchSize", request.batch_size);
    request.portfolio_amount =
        j.value("portfolioAmount", request.portfolio_amount);

    request.sample_prices =
        j.at("samplePrices").get<std::map<std::string, std::vector<double>>>();

    if (j.contains("allocations") && !j.at("allocations").is_null()) {
      request.allocations =
          j.at("allocations").get<std::map<std::string, double>>();
    }

    if (j.contains("seed") && !j.at("seed").is_null()) {
      request.seed = j.at("seed").get<std::uint64_t>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw MessageError(std::string("malformed input message: ") + e.what());
  }

  try {
    validate_request(request);
  } catch (const std::invalid_argument& e) {
    throw MessageError(e.what());
  }

  return request;
}

// -----------------------------------------------------------------------------
// encode_path()
// -----------------------------------------------------------------------------
nlohmann::json MessageCodec::encode_path(const domain::SimulationPath& path) {
  nlohmann::json points = nlohmann::json::array();
  for (const auto& point : path) {
    points.push_back(nlohmann::json{{"day", point.day}, {"value", point.value}});
  }
  return points;
}

// -----------------------------------------------------------------------------
// encode_progress()
// -----------------------------------------------------------------------------
nlohmann::json MessageCodec::encode_progress(const ProgressEvent& e) {
  nlohmann::json batch = nlohmann::json::array();
  for (const auto& path : e.batch) {
    batch.push_back(encode_path(path));
  }

  nlohmann::json j;
  j["progress"] = e.progress;
  j["batch"] = std::move(batch);
  return j;
}

// -----------------------------------------------------------------------------
// encode_completion()
// -----------------------------------------------------------------------------
nlohmann::json MessageCodec::encode_completion(const CompletionEvent& e) {
  nlohmann::json final_data = nlohmann::json::array();
  for (const auto& band : e.final_data) {
    final_data.push_back(nlohmann::json{{"day", band.day},
                                        {"percentile_5", band.p5},
                                        {"percentile_50", band.p50},
                                        {"percentile_95", band.p95}});
  }

  nlohmann::json j;
  j["progress"] = e.progress;
  j["finalData"] = std::move(final_data);
  j["done"] = true;
  return j;
}

// -----------------------------------------------------------------------------
// encode_failure()
// -----------------------------------------------------------------------------
nlohmann::json MessageCodec::encode_failure(const FailureEvent& e) {
  nlohmann::json j;
  j["progress"] = e.progress;
  j["error"] = e.reason;
  j["done"] = false;
  return j;
}

// -----------------------------------------------------------------------------
// encode_outcome()
// -----------------------------------------------------------------------------
nlohmann::json MessageCodec::encode_outcome(const domain::OutcomeSummary& o) {
  nlohmann::json j;
  j["initialValue"] = o.initial_value;
  j["expectedValue"] = o.expected_value;
  j["worstCase"] = o.worst_case;
  j["bestCase"] = o.best_case;
  j["expectedReturn"] = o.expected_return_pct;
  j["probOfPositiveReturn"] = o.prob_positive_return;
  j["probOfReturnGreaterThan10"] = o.prob_return_above_10;
  j["probOfReturnGreaterThan20"] = o.prob_return_above_20;
  j["probOfLossGreaterThan10"] = o.prob_loss_above_10;
  j["probOfLossGreaterThan20"] = o.prob_loss_above_20;
  return j;
}

// -----------------------------------------------------------------------------
// encode_event(): dispatch on the variant
// -----------------------------------------------------------------------------
std::string MessageCodec::encode_event(const Event& event) {
  if (const auto* e = std::get_if<ProgressEvent>(&event)) {
    return encode_progress(*e).dump();
  }
  if (const auto* e = std::get_if<CompletionEvent>(&event)) {
    return encode_completion(*e).dump();
  }
  return encode_failure(std::get<FailureEvent>(event)).dump();
}

}  // namespace mcsim
