// **********************************************************************
// sgpu/src/Diagnostics.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "Diagnostics.hpp"

#include <iomanip>
#include <iostream>

namespace sgpu {
namespace {

const char* state_name(SimdCore::State s) {
  switch (s) {
    case SimdCore::State::Idle:      return "IDLE";
    case SimdCore::State::Fetching:  return "FETCHING";
    case SimdCore::State::Executing: return "EXECUTING";
  }
  return "?";
}

void report_ctrl(const char* name, MemCtrl& ctrl) {
  std::cout << "  " << name << ": rr=" << ctrl.rr_pointer()
            << " grants=" << ctrl.grants();
  if (!ctrl.write_enable()) std::cout << " refused_writes=" << ctrl.refused_writes();
  std::cout << std::endl;
  for (unsigned ch = 0; ch < ctrl.num_channels(); ++ch) {
    const int who = ctrl.channel_consumer(ch);
    std::cout << "    ch" << ch << ": ";
    if (who < 0) std::cout << "idle";
    else         std::cout << "bound to consumer " << who;
    std::cout << std::endl;
  }
  for (unsigned j = 0; j < ctrl.num_consumers(); ++j) {
    if (ctrl.port(j).pending()) {
      std::cout << "    consumer " << j << " waiting @0x" << std::hex << ctrl.port(j).req().addr
                << std::dec << (ctrl.port(j).req().write ? " (write)" : " (read)") << std::endl;
    }
  }
}

} // namespace

void verify_and_report_postmortem(Gpu& gpu, MemoryPort& data_mem, int cycle) {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');

  BlockDispatcher& d = gpu.dispatcher();
  std::cout << "Kernel did not finish after " << cycle << " cycles" << std::endl;
  std::cout << "  dispatcher: blocks " << d.blocks_done() << "/" << d.total_blocks()
            << " done, " << d.blocks_dispatched() << " dispatched" << std::endl;

  for (unsigned i = 0; i < gpu.num_cores(); ++i) {
    const SimdCore& c = gpu.core(i);
    std::cout << "  core" << i << ": " << state_name(c.state())
              << (c.done() ? " done" : "")
              << " block=" << unsigned(c.block_id())
              << " pc=0x" << std::hex << std::setw(2) << c.pc()
              << " instr=0x" << std::setw(4) << c.instr() << std::dec
              << " (" << opcode_name(c.instr() >> 12) << ")" << std::endl;
    for (const SimdCore::FaultRecord& f : c.fault_log()) {
      std::cout << "    fault " << fault_name(f.cause) << " block=" << unsigned(f.block_id)
                << " pc=0x" << std::hex << std::setw(2) << f.pc
                << " instr=0x" << std::setw(4) << f.instr << std::dec << std::endl;
    }
  }
  report_ctrl("program ctrl", gpu.program_ctrl());
  report_ctrl("data ctrl", gpu.data_ctrl());

  std::cout << "  data[0x00..0x0f]:";
  for (uint32_t a = 0; a < 16; ++a) {
    std::cout << " " << std::hex << std::setw(2) << data_mem.read(a);
  }
  std::cout << std::dec << std::endl;

  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}

void print_stats(Gpu& gpu) {
  std::cout << "cycles=" << gpu.cycles()
            << " blocks=" << gpu.dispatcher().blocks_done() << "/" << gpu.dispatcher().total_blocks()
            << " faults=" << gpu.fault_count() << std::endl;
  for (unsigned i = 0; i < gpu.num_cores(); ++i) {
    const SimdCore& c = gpu.core(i);
    std::cout << "  core" << i
              << " inst=" << c.inst_count()
              << " ld=" << c.load_count()
              << " st=" << c.store_count()
              << " br=" << c.branch_count() << "/" << c.branch_taken_count()
              << " busy=" << c.busy_cycles()
              << " fetch_stall=" << c.fetch_stalls()
              << " mem_stall=" << c.mem_stalls() << std::endl;
  }
  std::cout << "  program ctrl grants=" << gpu.program_ctrl().grants()
            << " data ctrl grants=" << gpu.data_ctrl().grants() << std::endl;
}

} // namespace sgpu
