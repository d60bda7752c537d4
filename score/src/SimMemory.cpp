// **********************************************************************
// score/src/SimMemory.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "SimMemory.hpp"

#include <cascade/Cascade.hpp>

SimMemory::SimMemory(unsigned addr_bits, unsigned data_bits, unsigned num_channels, unsigned latency)
  : latency_(latency)
{
  assert_always(addr_bits > 0 && addr_bits <= 16, "SimMemory: addr_bits must be 1..16");
  assert_always(data_bits > 0 && data_bits <= 32, "SimMemory: data_bits must be 1..32");
  assert_always(num_channels > 0, "SimMemory: need at least one channel");
  addr_mask_ = (1u << addr_bits) - 1u;
  data_mask_ = (data_bits == 32) ? 0xffffffffu : ((1u << data_bits) - 1u);
  storage_.assign(static_cast<size_t>(addr_mask_) + 1u, 0u);
  channels_.resize(num_channels);
}

uint32_t SimMemory::read(uint32_t addr) {
  return storage_[wrap(addr)];
}

void SimMemory::write(uint32_t addr, uint32_t value) {
  storage_[wrap(addr)] = value & data_mask_;
}

// Channels that hold a request count down their latency; on expiry the access is
// performed and ready raised.  Ready stays up until the controller consumes it.
void SimMemory::cycle() {
  for (Channel& ch : channels_) {
    if (!ch.busy || ch.ready) continue;
    if (ch.remaining > 0) {
      --ch.remaining;
      continue;
    }
    if (ch.req.write) {
      write(ch.req.addr, ch.req.wdata);
      ch.resp = MemResp{0u, true};
      ++writes_;
    } else {
      ch.resp = MemResp{read(ch.req.addr), false};
      ++reads_;
    }
    ch.ready = true;
  }
}

bool SimMemory::can_request(unsigned ch) const {
  return ch < channels_.size() && !channels_[ch].busy;
}

void SimMemory::request(unsigned ch, const MemReq& req) {
  assert_always(can_request(ch), "SimMemory: request on a busy channel");
  Channel& c = channels_[ch];
  c.busy      = true;
  c.ready     = false;
  c.remaining = latency_;
  c.req       = req;
}

bool SimMemory::resp_valid(unsigned ch) const {
  return ch < channels_.size() && channels_[ch].ready;
}

MemResp SimMemory::resp(unsigned ch) const {
  return ch < channels_.size() ? channels_[ch].resp : MemResp{};
}

void SimMemory::resp_consume(unsigned ch) {
  if (ch >= channels_.size()) return;
  channels_[ch] = Channel{};
}

void SimMemory::clear() {
  for (uint32_t& w : storage_) w = 0;
}

void SimMemory::reset() {
  for (Channel& ch : channels_) ch = Channel{};
}
