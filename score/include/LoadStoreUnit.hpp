// **********************************************************************
// score/include/LoadStoreUnit.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Per-lane load/store unit: one outstanding transaction on the data bus at a time.
*/
#pragma once

#include "MemoryPort.hpp"

#include <cstdint>

class LoadStoreUnit {
public:
  enum class State { Idle, Requesting, Done };

  void attach_port(MemClientPort* port) { port_ = port; }
  bool issue_load(uint32_t addr);
  bool issue_store(uint32_t addr, uint8_t data);
  bool poll();    // true once the transaction completed (consumes the response)
  void clear();   // back to Idle after the core has retired the instruction
  void reset();

  State   state() const { return state_; }
  bool    done()  const { return state_ == State::Done; }
  uint8_t data()  const { return data_; } // loaded byte

private:
  bool issue(const MemReq& req);

  MemClientPort* port_ = nullptr;
  State   state_ = State::Idle;
  uint8_t data_  = 0;
};
