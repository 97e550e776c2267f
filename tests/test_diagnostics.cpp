#include "test.h"

#include <iostream>
#include <string>

#include "stratai/core/diagnostics.h"
#include "stratai/core/evaluator.h"

using namespace stratai;

#define SAI_ASSERT(cond)                                                                                              \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << " expected " << #cond << "\n";                        \
      ++failed;                                                                                                        \
    }                                                                                                                  \
  } while (0)

namespace {

DiagnosticsEntry make_entry(std::uint64_t tick) {
  DiagnosticsEntry e;
  e.tick = tick;
  e.selected_action_id = "action_" + std::to_string(tick);
  e.components.set("economic_lead", static_cast<double>(tick) / 10.0);
  return e;
}

} // namespace

int test_diagnostics() {
  int failed = 0;

  // Recorder appends, evicting the oldest entry first.
  {
    EvaluationHistory history(2);
    DiagnosticsRecorder recorder(history);
    SAI_ASSERT(history.size() == 0);

    DiagnosticsEntry latest;
    SAI_ASSERT(!history.latest(latest));

    recorder.record(make_entry(1));
    recorder.record(make_entry(2));
    recorder.record(make_entry(3));

    const auto entries = history.entries();
    SAI_ASSERT(history.capacity() == 2);
    SAI_ASSERT(entries.size() == 2);
    SAI_ASSERT(entries[0].tick == 2);
    SAI_ASSERT(entries[1].tick == 3);
    SAI_ASSERT(entries[1].selected_action_id == "action_3");

    SAI_ASSERT(history.latest(latest));
    SAI_ASSERT(latest.tick == 3);
  }

  // A zero capacity still keeps the latest tick.
  {
    EvaluationHistory history(0);
    DiagnosticsRecorder recorder(history);
    recorder.record(make_entry(7));
    recorder.record(make_entry(8));
    SAI_ASSERT(history.capacity() == 1);
    SAI_ASSERT(history.size() == 1);
    SAI_ASSERT(history.entries()[0].tick == 8);
  }

  // After N + k ticks the history holds N entries, the oldest being tick k + 1.
  {
    EvaluatorConfig cfg;
    cfg.diagnostics.history_capacity = 5;
    EvaluationSession session(cfg);

    Observation o;
    o.our_total_economy = 800.0;
    o.enemy_total_economy = 1200.0;

    const int k = 7;
    for (int i = 0; i < 5 + k; ++i) (void)evaluate_tick(session, o, cfg);

    const auto entries = session.history().entries();
    SAI_ASSERT(session.tick_count() == 12);
    SAI_ASSERT(entries.size() == 5);
    SAI_ASSERT(entries.front().tick == static_cast<std::uint64_t>(k + 1));
    SAI_ASSERT(entries.back().tick == 12);
    for (std::size_t i = 1; i < entries.size(); ++i) SAI_ASSERT(entries[i].tick == entries[i - 1].tick + 1);
  }

  // Snapshots are copies; later ticks do not change them.
  {
    EvaluatorConfig cfg;
    cfg.diagnostics.history_capacity = 2;
    EvaluationSession session(cfg);
    const auto first = evaluate_tick(session, Observation{}, cfg);
    SAI_ASSERT(first.diagnostics_snapshot.size() == 1);
    (void)evaluate_tick(session, Observation{}, cfg);
    (void)evaluate_tick(session, Observation{}, cfg);
    SAI_ASSERT(first.diagnostics_snapshot.size() == 1);
    SAI_ASSERT(first.diagnostics_snapshot[0].tick == 1);
    SAI_ASSERT(session.history().size() == 2);
  }

  return failed;
}
