// **********************************************************************
// score/src/FetchUnit.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "FetchUnit.hpp"

bool FetchUnit::request(uint32_t pc) {
  if (!port_ || state_ == State::Fetching || !port_->can_request()) return false;
  MemReq r{}; r.addr = pc; r.write = false;
  port_->request(r);
  pc_    = pc;
  state_ = State::Fetching;
  return true;
}

bool FetchUnit::poll() {
  if (state_ == State::Fetched) return true;
  if (state_ != State::Fetching || !port_->resp_valid()) return false;
  instr_ = static_cast<uint16_t>(port_->resp().rdata);
  port_->resp_consume(); // drop valid, frees the port
  state_ = State::Fetched;
  return true;
}

void FetchUnit::reset() {
  state_ = State::Idle;
  pc_    = 0;
  instr_ = 0;
}
