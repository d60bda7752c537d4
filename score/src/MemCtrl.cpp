// **********************************************************************
// score/src/MemCtrl.cpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Round-robin channel arbitration.  Each round, for each channel in index order:
retire a finished transaction (channel goes idle straight away), then, if idle,
grant the channel to the first pending consumer at or after the RR pointer.
*/

#include "MemCtrl.hpp"

using namespace Cascade;

MemCtrl::MemCtrl(std::string /*name*/, unsigned num_consumers, unsigned num_channels, bool write_enable, IMPL_CTOR)
  : write_enable_(write_enable)
{
  assert_always(num_consumers > 0, "MemCtrl: need at least one consumer");
  assert_always(num_channels > 0, "MemCtrl: need at least one channel");
  ports_.resize(num_consumers);
  channels_.resize(num_channels);
  bound_.assign(num_consumers, false);
  refused_.assign(num_consumers, false);
  served_.assign(num_consumers, 0);
}

void MemCtrl::attach_memory(MemoryPort* mem) {
  assert_always(mem != nullptr, "MemCtrl: null memory");
  assert_always(mem->num_channels() == channels_.size(), "MemCtrl: channel count differs from memory");
  mem_ = mem;
}

// Default update function is unused; the owner steps us via cycle() in a fixed order
void MemCtrl::update() {}

void MemCtrl::reset() {
  for (MemClientPort& p : ports_) p.reset();
  for (Channel& ch : channels_) ch = Channel{};
  bound_.assign(ports_.size(), false);
  refused_.assign(ports_.size(), false);
  served_.assign(ports_.size(), 0);
  rr_ = 0;
  grants_ = 0;
  refused_writes_ = 0;
}

void MemCtrl::cycle() {
  if (!mem_) return;
  for (unsigned j = 0; j < ports_.size(); ++j) {
    if (!ports_[j].valid()) refused_[j] = false; // requester gave up its refused write
  }
  for (unsigned ch = 0; ch < channels_.size(); ++ch) {
    if (channels_[ch].state == ChannelState::Waiting) {
      retire(ch);
    }
    if (channels_[ch].state == ChannelState::Idle) {
      grant(ch);
    }
  }
}

void MemCtrl::retire(unsigned ch) {
  if (!mem_->resp_valid(ch)) return; // memory not ready yet, keep holding the request
  Channel& c = channels_[ch];
  const MemResp resp = mem_->resp(ch);
  mem_->resp_consume(ch);
  ports_[c.consumer].respond(resp);
  bound_[c.consumer] = false;
  ++served_[c.consumer];
  trace("ch%u: %s done for consumer %u data=0x%x\n", ch, resp.write ? "write" : "read",
        c.consumer, resp.rdata);
  c = Channel{};
}

void MemCtrl::grant(unsigned ch) {
  if (!mem_->can_request(ch)) return;
  const unsigned n = static_cast<unsigned>(ports_.size());
  for (unsigned k = 0; k < n; ++k) {
    const unsigned j = (rr_ + k) % n;
    MemClientPort& p = ports_[j];
    if (bound_[j] || !p.pending()) continue; // already served by another channel, or nothing to do
    if (p.req().write && !write_enable_) {   // read-only bus: write path does not exist
      if (!refused_[j]) {
        refused_[j] = true;
        ++refused_writes_;
        trace("ch%u: consumer %u write @0x%x ignored (read-only)\n", ch, j, p.req().addr);
      }
      continue;
    }
    refused_[j] = false;
    mem_->request(ch, p.req());
    bound_[j] = true;
    channels_[ch].state    = ChannelState::Waiting;
    channels_[ch].consumer = j;
    rr_ = (j + 1) % n;
    ++grants_;
    trace("ch%u: grant consumer %u %s @0x%x\n", ch, j, p.req().write ? "write" : "read", p.req().addr);
    return;
  }
}

bool MemCtrl::idle() const {
  for (const Channel& c : channels_) {
    if (c.state != ChannelState::Idle) return false;
  }
  return true;
}

int MemCtrl::channel_consumer(unsigned ch) const {
  if (ch >= channels_.size() || channels_[ch].state == ChannelState::Idle) return -1;
  return static_cast<int>(channels_[ch].consumer);
}
