// **********************************************************************
// sgpu/src/Kernels.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "Kernels.hpp"
#include "Instruction.hpp"
#include "RegisterFile.hpp"

using Op = Instruction::Opcode;

static constexpr uint32_t BID = RegisterFile::REG_BLOCK_ID;
static constexpr uint32_t BDIM = RegisterFile::REG_BLOCK_DIM;
static constexpr uint32_t TID = RegisterFile::REG_THREAD_ID;

Kernel kernel_matadd() {
  Kernel k;
  k.name = "matadd";
  k.program = {
    Instruction::rrr(Op::MUL, 0, BID, BDIM),
    Instruction::rrr(Op::ADD, 0, 0, TID),     // i = blockIdx * blockDim + threadIdx
    Instruction::constant(1, 0),              // baseA
    Instruction::constant(2, 8),              // baseB
    Instruction::constant(3, 16),             // baseC
    Instruction::rrr(Op::ADD, 4, 1, 0),
    Instruction::ldr(4, 4),                   // A[i]
    Instruction::rrr(Op::ADD, 5, 2, 0),
    Instruction::ldr(5, 5),                   // B[i]
    Instruction::rrr(Op::ADD, 6, 4, 5),
    Instruction::rrr(Op::ADD, 7, 3, 0),
    Instruction::str(7, 6),                   // C[i] = A[i] + B[i]
    Instruction::halt(),
  };
  k.thread_count = 8;
  for (uint8_t i = 0; i < 8; ++i) k.data.push_back(i);
  for (uint8_t i = 0; i < 8; ++i) k.data.push_back(i);
  k.out_addr = 16;
  for (uint8_t i = 0; i < 8; ++i) k.expected.push_back(static_cast<uint8_t>(2 * i));
  return k;
}

Kernel kernel_matmul() {
  Kernel k;
  k.name = "matmul";
  const uint32_t loop = 12;
  k.program = {
    Instruction::rrr(Op::MUL, 0, BID, BDIM),
    Instruction::rrr(Op::ADD, 0, 0, TID),     // i
    Instruction::constant(1, 1),              // increment
    Instruction::constant(2, 2),              // N
    Instruction::constant(3, 0),              // baseA
    Instruction::constant(4, 4),              // baseB
    Instruction::constant(5, 8),              // baseC
    Instruction::rrr(Op::DIV, 6, 0, 2),       // row = i / N
    Instruction::rrr(Op::MUL, 7, 6, 2),
    Instruction::rrr(Op::SUB, 7, 0, 7),       // col = i % N
    Instruction::constant(8, 0),              // acc
    Instruction::constant(9, 0),              // k
    // loop:
    Instruction::rrr(Op::MUL, 10, 6, 2),
    Instruction::rrr(Op::ADD, 10, 10, 9),
    Instruction::rrr(Op::ADD, 10, 10, 3),
    Instruction::ldr(10, 10),                 // A[row][k]
    Instruction::rrr(Op::MUL, 11, 9, 2),
    Instruction::rrr(Op::ADD, 11, 11, 7),
    Instruction::rrr(Op::ADD, 11, 11, 4),
    Instruction::ldr(11, 11),                 // B[k][col]
    Instruction::rrr(Op::MUL, 12, 10, 11),
    Instruction::rrr(Op::ADD, 8, 8, 12),
    Instruction::rrr(Op::ADD, 9, 9, 1),
    Instruction::cmp(9, 2),
    Instruction::brnzp(Instruction::NZP_N, loop),
    Instruction::rrr(Op::ADD, 9, 5, 0),
    Instruction::str(9, 8),                   // C[i] = acc
    Instruction::halt(),
  };
  k.thread_count = 4;
  k.data = {1, 2, 3, 4,   // A
            1, 2, 3, 4};  // B
  k.out_addr = 8;
  k.expected = {7, 10, 15, 22};
  return k;
}

bool find_kernel(const std::string& name, Kernel* out) {
  if (name == "matadd") { *out = kernel_matadd(); return true; }
  if (name == "matmul") { *out = kernel_matmul(); return true; }
  return false;
}
