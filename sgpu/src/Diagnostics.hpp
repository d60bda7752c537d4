// **********************************************************************
// sgpu/src/Diagnostics.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
For diagnosing runs that stop before the kernel raised done: per-core state, faults
and controller bindings, so a hung handshake or a faulted block is easy to spot.
*/
#pragma once
#include "Gpu.hpp"

namespace sgpu {

void verify_and_report_postmortem(Gpu& gpu, MemoryPort& data_mem, int cycle);

// one-line-per-core statistics table (used by the debugger's "stats" and batch runs)
void print_stats(Gpu& gpu);

} // namespace sgpu
