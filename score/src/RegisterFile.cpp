// **********************************************************************
// score/src/RegisterFile.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "RegisterFile.hpp"

void RegisterFile::reset(uint8_t block_id, uint8_t thread_count, uint8_t thread_idx) {
  regs_.fill(0);
  regs_[REG_BLOCK_ID]  = block_id;
  regs_[REG_BLOCK_DIM] = thread_count;
  regs_[REG_THREAD_ID] = thread_idx;
}

bool RegisterFile::write(uint32_t idx, uint8_t value) {
  if (idx >= FIRST_READ_ONLY) return false; // R13-R15 hard-wired
  regs_[idx] = value;
  return true;
}
