// **********************************************************************
// score/include/Instruction.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
SIMD core instruction decoder.  Pass a raw 16b instruction word in and this parses
it into an executable product like the hardware decoder would.

  [15:12 opcode] [11:8 Rd | cond] [7:4 Rs] [3:0 Rt]   or   [7:0 IMM8]
*/
#pragma once

#include <cstdint>

// Instruction structure, feed it a 16b word and it extracts the useful fields from it
// (opcode, registers, immediate, branch condition) plus its category
struct Instruction {
  enum class Opcode : uint32_t {
    NOP   = 0x0,
    BRNZP = 0x1,
    CMP   = 0x2,
    ADD   = 0x3,
    SUB   = 0x4,
    MUL   = 0x5,
    DIV   = 0x6,
    LDR   = 0x7,
    STR   = 0x8,
    CONST = 0x9,
    HALT  = 0xF,
  };

  enum class Category {
    NOP,
    BRANCH,
    CMP,
    ALU,
    LOAD,
    STORE,
    CONST,
    HALT,
    Unknown, // opcodes 0xA-0xE
  };

  // NZP condition/flag bits (one-hot result of CMP, mask for BRNZP)
  static constexpr uint32_t NZP_N = 0x4u;
  static constexpr uint32_t NZP_Z = 0x2u;
  static constexpr uint32_t NZP_P = 0x1u;

  explicit Instruction(uint16_t raw_instr); // call it like: Instruction decoded(word)

  bool valid()   const { return category != Category::Unknown; }
  bool is_mem()  const { return category == Category::LOAD || category == Category::STORE; }
  Opcode op()    const { return static_cast<Opcode>(opcode); }

  uint16_t raw      = 0; // full 16b instruction
  uint32_t opcode   = 0;
  uint32_t rd       = 0;
  uint32_t rs       = 0;
  uint32_t rt       = 0;
  uint32_t imm8     = 0;
  uint32_t cond     = 0; // BRNZP condition nibble, bits [2:0] are N/Z/P
  Category category = Category::Unknown;

  // encoders, handy for building kernels in testbenches
  static uint16_t nop()                                             { return 0x0000u; }
  static uint16_t halt()                                            { return 0xF000u; }
  static uint16_t brnzp(uint32_t cond, uint32_t target);
  static uint16_t cmp(uint32_t rs, uint32_t rt);
  static uint16_t rrr(Opcode op, uint32_t rd, uint32_t rs, uint32_t rt); // ADD/SUB/MUL/DIV
  static uint16_t ldr(uint32_t rd, uint32_t rs);
  static uint16_t str(uint32_t rs, uint32_t rt);
  static uint16_t constant(uint32_t rd, uint32_t imm8);
};

const char* opcode_name(uint32_t opcode);
