// **********************************************************************
// score/src/LoadStoreUnit.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "LoadStoreUnit.hpp"

bool LoadStoreUnit::issue(const MemReq& req) {
  if (!port_ || state_ != State::Idle || !port_->can_request()) return false;
  port_->request(req);
  state_ = State::Requesting;
  return true;
}

bool LoadStoreUnit::issue_load(uint32_t addr) {
  MemReq r{}; r.addr = addr; r.write = false;
  return issue(r);
}

bool LoadStoreUnit::issue_store(uint32_t addr, uint8_t data) {
  MemReq w{}; w.addr = addr; w.write = true; w.wdata = data;
  return issue(w);
}

bool LoadStoreUnit::poll() {
  if (state_ == State::Done) return true;
  if (state_ != State::Requesting || !port_->resp_valid()) return false;
  const MemResp& resp = port_->resp();
  if (!resp.write) data_ = static_cast<uint8_t>(resp.rdata);
  port_->resp_consume();
  state_ = State::Done;
  return true;
}

void LoadStoreUnit::clear() {
  state_ = State::Idle;
}

void LoadStoreUnit::reset() {
  state_ = State::Idle;
  data_  = 0;
}
