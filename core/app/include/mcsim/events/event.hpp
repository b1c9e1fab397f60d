#pragma once

#include "simulation_events.hpp"
#include <variant>

namespace mcsim {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for everything a simulation run
// reports. One EventBus carries all three kinds; subscribers pick theirs
// with subscribe<T>() or std::get_if.
//
// Value semantics: events are copied into queues (e.g. the server's
// outbound queue) without heap-allocated base classes or casts. Adding a new
// kind means adding it here and to MessageCodec::encode_event().
// -----------------------------------------------------------------------------
using Event = std::variant<
    ProgressEvent,
    CompletionEvent,
    FailureEvent>;

}  // namespace mcsim
