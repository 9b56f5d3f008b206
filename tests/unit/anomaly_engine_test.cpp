#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/engines/anomaly_engine.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using beacon::engines::AnomalyOptions;
using beacon::engines::AnomalyState;
using beacon::engines::DetectPlayerSpike;
using beacon::engines::HeartbeatHistory;
using beacon::engines::HeartbeatSample;

const beacon::util::TimePoint kT = beacon::util::FromUnixMillis(1'700'000'000'000ULL);

HeartbeatSample Sample(beacon::util::TimePoint t, std::optional<std::int64_t> players, std::optional<std::int64_t> capacity = std::nullopt) {
  return HeartbeatSample{t, players, capacity};
}

// 0 -> 70 -> 0 over 40 seconds, newest at kT
HeartbeatHistory SpikeHistory() {
  return {Sample(kT, 0), Sample(kT - 20s, 70), Sample(kT - 40s, 0)};
}

void TestSpikeAndReturnTriggers() {
  auto state = DetectPlayerSpike(SpikeHistory(), {}, kT + 1s);
  assert(state.players_spike);
  assert(state.last_detected_at == kT);
}

void TestSpikeOutsideWindowIgnored() {
  HeartbeatHistory slow{Sample(kT, 0), Sample(kT - 30s, 70), Sample(kT - 60s, 0)};
  assert(!DetectPlayerSpike(slow, {}, kT).players_spike);
}

void TestSuspiciousJump() {
  // +40 players on a capacity of 70 inside 60s
  HeartbeatHistory jump{Sample(kT, 45, 70), Sample(kT - 30s, 5, 70), Sample(kT - 60s, 5, 70)};
  assert(DetectPlayerSpike(jump, {}, kT).players_spike);

  // same jump on a large server is normal
  HeartbeatHistory big{Sample(kT, 45, 200), Sample(kT - 30s, 5, 200), Sample(kT - 60s, 5, 200)};
  assert(!DetectPlayerSpike(big, {}, kT).players_spike);

  // unset capacity falls back to the configured default
  HeartbeatHistory defaulted{Sample(kT, 45), Sample(kT - 30s, 5), Sample(kT - 60s, 5)};
  assert(DetectPlayerSpike(defaulted, {}, kT).players_spike);
  AnomalyOptions large;
  large.default_capacity = 200;
  assert(!DetectPlayerSpike(defaulted, {}, kT, large).players_spike);
}

void TestImpossibleDrop() {
  HeartbeatHistory drop{Sample(kT, 0), Sample(kT - 5s, 40), Sample(kT - 300s, 40)};
  assert(DetectPlayerSpike(drop, {}, kT).players_spike);

  HeartbeatHistory gradual{Sample(kT, 0), Sample(kT - 15s, 40), Sample(kT - 300s, 40)};
  assert(!DetectPlayerSpike(gradual, {}, kT).players_spike);
}

void TestUnknownPlayerCountsSkipped() {
  HeartbeatHistory gaps{Sample(kT, std::nullopt), Sample(kT - 20s, 70), Sample(kT - 40s, 0)};
  assert(!DetectPlayerSpike(gaps, {}, kT).players_spike);
}

void TestFewerThanThreeSamples() {
  HeartbeatHistory two{Sample(kT, 0), Sample(kT - 5s, 60)};
  assert(!DetectPlayerSpike(two, {}, kT).players_spike);
}

void TestNewestMatchRecorded() {
  HeartbeatHistory twice{Sample(kT, 0), Sample(kT - 20s, 70), Sample(kT - 40s, 0), Sample(kT - 60s, 70), Sample(kT - 80s, 0)};
  auto             state = DetectPlayerSpike(twice, {}, kT);
  assert(state.players_spike);
  assert(state.last_detected_at == kT);
}

void TestDecayBoundary() {
  const auto epsilon = 1ms;

  // the triggering heartbeats are still in the history; detection is time-bounded
  auto before = DetectPlayerSpike(SpikeHistory(), {}, kT + 30min - epsilon);
  assert(before.players_spike);
  assert(before.last_detected_at == kT);

  auto after = DetectPlayerSpike(SpikeHistory(), before, kT + 30min + epsilon);
  assert(!after.players_spike);
  assert(!after.last_detected_at.has_value());
}

void TestHoldWithoutNewTrigger() {
  HeartbeatHistory quiet{Sample(kT + 10min, 10), Sample(kT + 9min, 10), Sample(kT + 8min, 10)};
  AnomalyState     raised{true, kT};

  auto held = DetectPlayerSpike(quiet, raised, kT + 29min);
  assert(held.players_spike);
  assert(held.last_detected_at == kT);

  auto decayed = DetectPlayerSpike(quiet, raised, kT + 30min);
  assert(!decayed.players_spike);

  // a flag without a detection time is held
  auto untimed = DetectPlayerSpike(quiet, AnomalyState{true, std::nullopt}, kT + 10h);
  assert(untimed.players_spike);
}

void TestCustomDecay() {
  AnomalyOptions options;
  options.decay = 5min;
  AnomalyState raised{true, kT};
  assert(DetectPlayerSpike({}, raised, kT + 4min, options).players_spike);
  assert(!DetectPlayerSpike({}, raised, kT + 5min, options).players_spike);
}

void TestDeterminism() {
  auto a = DetectPlayerSpike(SpikeHistory(), {}, kT + 1min);
  auto b = DetectPlayerSpike(SpikeHistory(), {}, kT + 1min);
  assert(a.players_spike == b.players_spike && a.last_detected_at == b.last_detected_at);
}

} // namespace

int main() {
  TestSpikeAndReturnTriggers();
  TestSpikeOutsideWindowIgnored();
  TestSuspiciousJump();
  TestImpossibleDrop();
  TestUnknownPlayerCountsSkipped();
  TestFewerThanThreeSamples();
  TestNewestMatchRecorded();
  TestDecayBoundary();
  TestHoldWithoutNewTrigger();
  TestCustomDecay();
  TestDeterminism();

  std::cout << "beacon_unit_anomaly_engine: pass\n";
  return 0;
}
