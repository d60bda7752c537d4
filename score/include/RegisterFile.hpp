// **********************************************************************
// score/include/RegisterFile.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Per-lane register file: 16 x 8b.  R0-R12 are general purpose, R13-R15 hold the
lane's identity and are read-only.  Writes aimed at R13 and up are dropped.
*/
#pragma once

#include <array>
#include <cstdint>

class RegisterFile {
public:
  static constexpr unsigned NUM_REGS        = 16;
  static constexpr unsigned FIRST_READ_ONLY = 13;
  static constexpr unsigned REG_BLOCK_ID    = 13; // %blockIdx
  static constexpr unsigned REG_BLOCK_DIM   = 14; // %blockDim, threads in this block
  static constexpr unsigned REG_THREAD_ID   = 15; // %threadIdx, local lane index

  // clear R0-R12 and latch identity registers for a new block
  void reset(uint8_t block_id, uint8_t thread_count, uint8_t thread_idx);

  uint8_t read(uint32_t idx) const { return idx < NUM_REGS ? regs_[idx] : 0; }
  bool    write(uint32_t idx, uint8_t value); // false when the write was dropped

private:
  std::array<uint8_t, NUM_REGS> regs_{};
};
