// **********************************************************************
// score/src/Instruction.cpp
// **********************************************************************
// sgpu Oct 19 2026
/*
The SIMD core instruction decoder.  Allows you to inspect instructions symbolically
(e.g., decoded.category, decoded.rd, decoded.imm8, etc.) without need for bit-twiddling.
Unknown opcodes come back with every field cleared and Category::Unknown; it is up
to the core to treat them as fatal.
*/

#include "Instruction.hpp"

namespace {
inline uint16_t pack(uint32_t opcode, uint32_t hi, uint32_t mid, uint32_t lo) {
  return static_cast<uint16_t>(((opcode & 0xfu) << 12) | ((hi & 0xfu) << 8) |
                               ((mid & 0xfu) << 4) | (lo & 0xfu));
}
} // namespace

// Fields not used by an opcode stay 0
Instruction::Instruction(uint16_t raw_instr) : raw(raw_instr) {
  opcode = (raw >> 12) & 0xfu; // 4b

  const uint32_t f_hi  = (raw >> 8) & 0xfu; // Rd or condition
  const uint32_t f_mid = (raw >> 4) & 0xfu; // Rs
  const uint32_t f_lo  =  raw       & 0xfu; // Rt
  const uint32_t f_imm =  raw       & 0xffu;

  switch (static_cast<Opcode>(opcode)) {
    case Opcode::NOP:
      category = Category::NOP;
      break;
    case Opcode::BRNZP:
      category = Category::BRANCH;
      cond = f_hi;
      imm8 = f_imm;
      break;
    case Opcode::CMP:
      category = Category::CMP;
      rs = f_mid;
      rt = f_lo;
      break;
    case Opcode::ADD:
    case Opcode::SUB:
    case Opcode::MUL:
    case Opcode::DIV:
      category = Category::ALU;
      rd = f_hi;
      rs = f_mid;
      rt = f_lo;
      break;
    case Opcode::LDR:
      category = Category::LOAD;
      rd = f_hi;
      rs = f_mid;
      break;
    case Opcode::STR:
      category = Category::STORE;
      rs = f_mid;
      rt = f_lo;
      break;
    case Opcode::CONST:
      category = Category::CONST;
      rd = f_hi;
      imm8 = f_imm;
      break;
    case Opcode::HALT:
      category = Category::HALT;
      break;
    default:
      category = Category::Unknown;
      break;
  }
}

uint16_t Instruction::brnzp(uint32_t cond, uint32_t target) {
  return static_cast<uint16_t>((static_cast<uint32_t>(Opcode::BRNZP) << 12) | ((cond & 0xfu) << 8) | (target & 0xffu));
}

uint16_t Instruction::cmp(uint32_t rs, uint32_t rt) {
  return pack(static_cast<uint32_t>(Opcode::CMP), 0, rs, rt);
}

uint16_t Instruction::rrr(Opcode op, uint32_t rd, uint32_t rs, uint32_t rt) {
  return pack(static_cast<uint32_t>(op), rd, rs, rt);
}

uint16_t Instruction::ldr(uint32_t rd, uint32_t rs) {
  return pack(static_cast<uint32_t>(Opcode::LDR), rd, rs, 0);
}

uint16_t Instruction::str(uint32_t rs, uint32_t rt) {
  return pack(static_cast<uint32_t>(Opcode::STR), 0, rs, rt);
}

uint16_t Instruction::constant(uint32_t rd, uint32_t imm8) {
  return static_cast<uint16_t>((static_cast<uint32_t>(Opcode::CONST) << 12) | ((rd & 0xfu) << 8) | (imm8 & 0xffu));
}

const char* opcode_name(uint32_t opcode) {
  switch (static_cast<Instruction::Opcode>(opcode & 0xfu)) {
    case Instruction::Opcode::NOP:   return "NOP";
    case Instruction::Opcode::BRNZP: return "BRNZP";
    case Instruction::Opcode::CMP:   return "CMP";
    case Instruction::Opcode::ADD:   return "ADD";
    case Instruction::Opcode::SUB:   return "SUB";
    case Instruction::Opcode::MUL:   return "MUL";
    case Instruction::Opcode::DIV:   return "DIV";
    case Instruction::Opcode::LDR:   return "LDR";
    case Instruction::Opcode::STR:   return "STR";
    case Instruction::Opcode::CONST: return "CONST";
    case Instruction::Opcode::HALT:  return "HALT";
    default:                         return "???";
  }
}
