// **********************************************************************
// score/src/Alu.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "Alu.hpp"
#include "Instruction.hpp"

AluResult alu_execute(uint32_t opcode, uint8_t a, uint8_t b) {
  AluResult out;
  switch (static_cast<Instruction::Opcode>(opcode)) {
    case Instruction::Opcode::ADD:
      out.result = static_cast<uint8_t>(a + b); // wraps mod 256
      break;
    case Instruction::Opcode::SUB:
      out.result = static_cast<uint8_t>(a - b);
      break;
    case Instruction::Opcode::MUL:
      out.result = static_cast<uint8_t>(a * b);
      break;
    case Instruction::Opcode::DIV:
      out.result = (b == 0) ? 0 : static_cast<uint8_t>(a / b); // no trap on /0
      break;
    case Instruction::Opcode::CMP: {
      const int8_t sa = static_cast<int8_t>(a); // signed compare
      const int8_t sb = static_cast<int8_t>(b);
      if (sa < sb) {
        out.nzp = Instruction::NZP_N;
      } else if (sa == sb) {
        out.nzp = Instruction::NZP_Z;
      } else {
        out.nzp = Instruction::NZP_P;
      }
      break;
    }
    default:
      break;
  }
  return out;
}
