// **********************************************************************
// score/include/FetchUnit.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Instruction fetcher: one outstanding read on the program bus at a time.
request(pc) raises valid on the attached port; poll() completes the handshake once
the controller answers and latches the instruction word.
*/
#pragma once

#include "MemoryPort.hpp"

#include <cstdint>

class FetchUnit {
public:
  enum class State { Idle, Fetching, Fetched };

  void attach_port(MemClientPort* port) { port_ = port; }
  bool request(uint32_t pc); // false if a fetch is already in flight or the port is busy
  bool poll();               // true once the word is latched (consumes the response)
  void reset();

  State    state()       const { return state_; }
  uint16_t instruction() const { return instr_; }
  uint32_t pc()          const { return pc_; }

private:
  MemClientPort* port_ = nullptr;
  State    state_ = State::Idle;
  uint32_t pc_    = 0;
  uint16_t instr_ = 0;
};
