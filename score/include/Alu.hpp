// **********************************************************************
// score/include/Alu.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Per-lane ALU.  Purely combinational: 8b operands in, 8b result plus NZP flags out.
*/
#pragma once

#include <cstdint>

struct AluResult {
  uint8_t result = 0;
  uint8_t nzp    = 0; // only set by CMP
};

// opcode is the 4b instruction opcode (ADD/SUB/MUL/DIV/CMP); anything else yields {0, 0}
AluResult alu_execute(uint32_t opcode, uint8_t a, uint8_t b);
