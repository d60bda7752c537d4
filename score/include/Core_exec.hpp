// **********************************************************************
// score/include/Core_exec.hpp
// **********************************************************************
// sgpu Oct 19 2026

// Per-instruction execution helpers for SimdCore.  Each helper applies one decoded
// instruction to every active lane.

#pragma once

#include "Instruction.hpp"

class SimdCore;

void exec_cmp(SimdCore& core, const Instruction& instr);
void exec_alu(SimdCore& core, const Instruction& instr);
void exec_const(SimdCore& core, const Instruction& instr);
// true if taken; *diverged set when active lanes disagree
bool exec_brnzp(SimdCore& core, const Instruction& instr, bool* diverged);
// memory ops: issue/poll every active lane, true once all of them completed
bool exec_ldr(SimdCore& core, const Instruction& instr);
bool exec_str(SimdCore& core, const Instruction& instr);
