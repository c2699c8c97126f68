#include "asteria/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "asteria/jsonlite.hpp"

namespace asteria {

namespace {
StageEventHook g_event_hook = nullptr;
}  // namespace

std::string event_to_json(const StageEvent& ev) {
  std::string line;
  line.reserve(160);
  line += "{\"stage\":\"";
  line += jsonlite::escape(ev.stage);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += "}";
  return line;
}

StageStats& global_stage_stats() {
  static StageStats inst;
  return inst;
}

void set_stage_event_hook(StageEventHook hook) {
  g_event_hook = hook;
}

void emit_event(const StageEvent& ev) {
  auto& stats = global_stage_stats();
  ++stats.events;
  if (!ev.ok) ++stats.failures;

  if (g_event_hook) {
    g_event_hook(ev);
    return;
  }

  // Activation: ASTERIA_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("ASTERIA_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = event_to_json(ev) + "\n";
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void emit_failure(const std::string& stage, const Error& error, uint64_t duration_ns) {
  StageEvent ev;
  ev.stage = stage;
  ev.ok = false;
  ev.error_code = to_string(error.code);
  ev.detail = error.message;
  ev.duration_ns = duration_ns;
  emit_event(ev);
}

void report_error(const Error& error) {
  std::cerr << error.to_json() << "\n";
  if (!error.remediation.empty()) {
    std::cerr << "  hint: " << error.remediation << "\n";
  }
}

}  // namespace asteria
