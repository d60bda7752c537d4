// **********************************************************************
// sgpu/src/Debugger.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Debugger REPL for the GPU simulator.  Breakpoints are program addresses; a core
stops the run when it is about to execute the instruction at one.
*/
#pragma once

#include "Gpu.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace sgpu {

struct DebuggerState {
  Gpu &gpu;
  MemoryPort &prog_mem;
  MemoryPort &data_mem;
  bool kernel_done;
  bool user_quit;
  int cycle;
  bool trace_enabled;
  std::vector<uint32_t> breakpoints;
  std::vector<uint64_t> break_inst; // per core: inst_count at its last breakpoint stop
  size_t faults_seen;

  DebuggerState(Gpu &g, MemoryPort &p, MemoryPort &d);
  void reset();
};

void auto_run(DebuggerState &state, int max_cycles);
// One REPL line; false once the session should end (quit or kernel done).
bool run_command(DebuggerState &state, const std::string &line);
void run_debugger(DebuggerState &state, std::istream &in);

} // namespace sgpu
