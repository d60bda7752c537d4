// **********************************************************************
// score/include/MemCtrl.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Memory controller: multiplexes num_consumers requester ports onto the num_channels
channels of a backing MemoryPort, round-robin.

 consumer ports         channels            backing store
 port(0) ---+
 port(1) ---+--> [ch0] [ch1] ... ----> MemoryPort::request(ch)
 ...        |       ^                          |
 port(N-1) -+       +-- respond() <-- resp_valid(ch)

A channel binds to at most one consumer per round; a consumer is never bound to two
channels at once.  The round-robin pointer moves past whichever consumer was bound
last, so nobody starves while others wait.  With write_enable=false (program bus)
write requests are never forwarded.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "MemoryPort.hpp"

#include <cstdint>
#include <string>
#include <vector>

class MemCtrl : public Component {
  DECLARE_COMPONENT(MemCtrl);
public:
  MemCtrl(std::string name, unsigned num_consumers, unsigned num_channels, bool write_enable, COMPONENT_CTOR);

  Clock(clk);

  void update();
  void reset();
  void cycle();                          // one arbitration round, called by the owner each clock

  void attach_memory(MemoryPort* mem);   // channel counts must agree
  MemClientPort& port(unsigned consumer) { return ports_[consumer]; }

  unsigned num_consumers() const { return static_cast<unsigned>(ports_.size()); }
  unsigned num_channels()  const { return static_cast<unsigned>(channels_.size()); }
  bool     write_enable()  const { return write_enable_; }
  bool     idle()          const;        // no channel bound
  int      channel_consumer(unsigned ch) const; // -1 when the channel is idle
  unsigned rr_pointer()    const { return rr_; }

  // stats
  uint64_t grants()                      const { return grants_; }
  uint64_t served(unsigned consumer)     const { return served_[consumer]; }
  uint64_t refused_writes()              const { return refused_writes_; }

private:
  enum class ChannelState { Idle, Waiting };
  struct Channel {
    ChannelState state    = ChannelState::Idle;
    unsigned     consumer = 0;
  };

  void retire(unsigned ch);  // deliver memory's response to the bound consumer
  void grant(unsigned ch);   // bind an idle channel to the next pending consumer

  MemoryPort*                mem_ = nullptr;
  bool                       write_enable_ = true;
  std::vector<MemClientPort> ports_;
  std::vector<Channel>       channels_;
  std::vector<bool>          bound_;          // consumer currently owned by some channel
  std::vector<bool>          refused_;        // write already reported as refused
  unsigned                   rr_ = 0;         // round-robin pointer
  uint64_t                   grants_ = 0;
  std::vector<uint64_t>      served_;
  uint64_t                   refused_writes_ = 0;
};
