// **********************************************************************
// sgpu/src/BlockDispatcher.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Splits a kernel of thread_count threads into ceil(thread_count / threads_per_block)
blocks and hands them, in block_id order, to whichever cores are free.  Each cycle:

  1. every core that raised done is released (free again, one cycle after done)
  2. every free core gets the next block, if any remain

Kernel done is raised when all blocks were handed out and all of them came back.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "BlockPort.hpp"

#include <cstdint>
#include <string>
#include <vector>

class BlockDispatcher : public Component {
  DECLARE_COMPONENT(BlockDispatcher);
public:
  struct BlockRecord {           // one entry per completed block
    uint8_t  block_id     = 0;
    uint8_t  thread_count = 0;
    unsigned core         = 0;
    uint64_t start_cycle  = 0;
    uint64_t end_cycle    = 0;   // cycle the core was seen done
  };

  BlockDispatcher(std::string name, unsigned threads_per_block, COMPONENT_CTOR);
  Clock(clk);

  void update();
  void reset();
  void cycle();

  void attach_cores(const std::vector<BlockPort*>& cores) { cores_ = cores; slots_.assign(cores.size(), Slot{}); }
  void launch(unsigned thread_count); // kernel start

  bool     active()            const { return active_; }
  bool     done()              const { return done_; }
  unsigned total_blocks()      const { return total_blocks_; }
  unsigned blocks_dispatched() const { return blocks_dispatched_; }
  unsigned blocks_done()       const { return blocks_done_; }
  uint64_t cycles()            const { return cycle_; }
  const std::vector<BlockRecord>& completed() const { return completed_; }

private:
  struct Slot {
    bool     running      = false;
    uint8_t  block_id     = 0;
    uint8_t  thread_count = 0;
    uint64_t start_cycle  = 0;
  };

  std::vector<BlockPort*> cores_;
  std::vector<Slot>       slots_;
  std::vector<BlockRecord> completed_;
  unsigned threads_per_block_ = 1;
  unsigned thread_count_      = 0;
  unsigned total_blocks_      = 0;
  unsigned blocks_dispatched_ = 0;
  unsigned blocks_done_       = 0;
  bool     active_            = false;
  bool     done_              = false;
  uint64_t cycle_             = 0;
};
