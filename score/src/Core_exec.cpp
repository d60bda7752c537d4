// **********************************************************************
// score/src/Core_exec.cpp
// **********************************************************************
// sgpu Oct 19 2026
/*
How to execute SIMD core instructions.  Inactive lanes are skipped everywhere, so
they neither change state nor touch the data bus.
*/

#include "Core_exec.hpp"
#include "SimdCore.hpp"
#include "Alu.hpp"

#include <cstdint>

namespace {
// one pass over the active lanes' LSUs: issue where idle, poll where in flight
bool step_lsus(SimdCore& core, const Instruction& instr, bool store) {
  bool all_done = true;
  for (unsigned t = 0; t < core.num_lanes(); ++t) {
    if (!core.lane_active(t)) continue;
    LoadStoreUnit& lsu = core.lsu(t);
    const uint32_t addr = core.read_reg(t, instr.rs);
    if (lsu.state() == LoadStoreUnit::State::Idle) {
      const bool issued = store ? lsu.issue_store(addr, core.read_reg(t, instr.rt))
                                : lsu.issue_load(addr);
      if (!issued) { // port still held, retry next cycle
        all_done = false;
        continue;
      }
    }
    if (!lsu.poll()) all_done = false;
  }
  return all_done;
}
} // namespace

void exec_cmp(SimdCore& core, const Instruction& instr) {
  for (unsigned t = 0; t < core.num_lanes(); ++t) {
    if (!core.lane_active(t)) continue;
    const AluResult r = alu_execute(instr.opcode, core.read_reg(t, instr.rs), core.read_reg(t, instr.rt));
    core.set_nzp(t, r.nzp);
  }
}

void exec_alu(SimdCore& core, const Instruction& instr) {
  for (unsigned t = 0; t < core.num_lanes(); ++t) {
    if (!core.lane_active(t)) continue;
    const AluResult r = alu_execute(instr.opcode, core.read_reg(t, instr.rs), core.read_reg(t, instr.rt));
    core.write_reg(t, instr.rd, r.result);
  }
}

void exec_const(SimdCore& core, const Instruction& instr) {
  for (unsigned t = 0; t < core.num_lanes(); ++t) {
    if (!core.lane_active(t)) continue;
    core.write_reg(t, instr.rd, static_cast<uint8_t>(instr.imm8));
  }
}

bool exec_brnzp(SimdCore& core, const Instruction& instr, bool* diverged) {
  const uint32_t mask = instr.cond & (Instruction::NZP_N | Instruction::NZP_Z | Instruction::NZP_P);
  unsigned taken = 0, not_taken = 0;
  for (unsigned t = 0; t < core.num_lanes(); ++t) {
    if (!core.lane_active(t)) continue;
    if ((core.nzp(t) & mask) != 0) {
      ++taken;
    } else {
      ++not_taken;
    }
  }
  *diverged = (taken != 0 && not_taken != 0);
  return taken != 0 && not_taken == 0;
}

bool exec_ldr(SimdCore& core, const Instruction& instr) {
  if (!step_lsus(core, instr, false)) return false;
  for (unsigned t = 0; t < core.num_lanes(); ++t) { // barrier passed, write back and free LSUs
    if (!core.lane_active(t)) continue;
    core.write_reg(t, instr.rd, core.lsu(t).data());
    core.lsu(t).clear();
  }
  return true;
}

bool exec_str(SimdCore& core, const Instruction& instr) {
  if (!step_lsus(core, instr, true)) return false;
  for (unsigned t = 0; t < core.num_lanes(); ++t) {
    if (core.lane_active(t)) core.lsu(t).clear();
  }
  return true;
}
