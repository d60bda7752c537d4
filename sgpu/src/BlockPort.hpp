// **********************************************************************
// sgpu/src/BlockPort.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Abstract API (not a simulatable object), just a protocol, for handing thread blocks
to something that runs them.  Gpu backs it with a SimdCore; testbenches can back it
with a scripted stand-in to check dispatch timing on its own.
*/
#pragma once

#include <cstdint>

class BlockPort {
public:
  virtual ~BlockPort() = default;

  // Begin running block_id with thread_count threads.  Only called while idle().
  virtual void start(uint8_t block_id, uint8_t thread_count) = 0;

  // Raised once the block has finished (HALT or fault); stays up until release().
  virtual bool done() const = 0;

  // Acknowledge done; afterwards the runner is idle and may be started again.
  virtual void release() = 0;

  virtual bool idle() const = 0;
};
