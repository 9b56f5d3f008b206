#pragma once

#include "internal/engines/engine_types.hpp"
#include "internal/model/derived_state.hpp"

namespace beacon::engines {

inline constexpr std::size_t kMinSamplesForGreen = 3;

/*
  Trust tier, evaluated in order:

    no heartbeats            red
    age > 2 * grace          red
    fewer than 3 samples     yellow
    age <= grace             green
    otherwise                yellow
*/
beacon::model::Confidence ComputeConfidence(const HeartbeatHistory& history, std::chrono::seconds grace, util::TimePoint now);

} // namespace beacon::engines
