// **********************************************************************
// score/include/SimMemory.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Simple backing store behind a MemCtrl: 2^addr_bits words of data_bits each, split into
num_channels independent channels.  A request accepted in cycle t raises ready at the
end of cycle t+latency and holds it until consumed.  Addresses wrap to addr_bits and
data is truncated to data_bits.
*/
#pragma once

#include "MemoryPort.hpp"

#include <cstdint>
#include <vector>

class SimMemory : public MemoryPort {
public:
  SimMemory(unsigned addr_bits, unsigned data_bits, unsigned num_channels, unsigned latency = 0);

  uint32_t read(uint32_t addr) override;
  void     write(uint32_t addr, uint32_t value) override;

  unsigned num_channels() const override { return static_cast<unsigned>(channels_.size()); }
  void     cycle() override;
  bool     can_request(unsigned ch) const override;
  void     request(unsigned ch, const MemReq& req) override;
  bool     resp_valid(unsigned ch) const override;
  MemResp  resp(unsigned ch) const override;
  void     resp_consume(unsigned ch) override;

  void     set_latency(unsigned cycles) { latency_ = cycles; }
  void     clear();     // zero contents
  void     reset();     // drop in-flight requests, keep contents

  uint64_t channel_reads()  const { return reads_; }  // timed accesses only
  uint64_t channel_writes() const { return writes_; }

private:
  struct Channel {
    bool     busy      = false;
    bool     ready     = false;
    unsigned remaining = 0;
    MemReq   req{};
    MemResp  resp{};
  };

  uint32_t wrap(uint32_t addr) const { return addr & addr_mask_; }

  std::vector<uint32_t> storage_;
  std::vector<Channel>  channels_;
  uint32_t addr_mask_ = 0;
  uint32_t data_mask_ = 0;
  unsigned latency_   = 0;
  uint64_t reads_     = 0;
  uint64_t writes_    = 0;
};
