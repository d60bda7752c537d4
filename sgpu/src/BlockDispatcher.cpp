// **********************************************************************
// sgpu/src/BlockDispatcher.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "BlockDispatcher.hpp"

#include <algorithm>

using namespace Cascade;

BlockDispatcher::BlockDispatcher(std::string /*name*/, unsigned threads_per_block, IMPL_CTOR)
  : threads_per_block_(threads_per_block)
{
  assert_always(threads_per_block > 0, "BlockDispatcher: threads_per_block must be > 0");
}

// Default update function is unused; kept to satisfy DECLARE_COMPONENT
void BlockDispatcher::update() {}

void BlockDispatcher::reset() {
  slots_.assign(cores_.size(), Slot{});
  completed_.clear();
  thread_count_      = 0;
  total_blocks_      = 0;
  blocks_dispatched_ = 0;
  blocks_done_       = 0;
  active_            = false;
  done_              = false;
  cycle_             = 0;
}

void BlockDispatcher::launch(unsigned thread_count) {
  assert_always(!active_ || done_, "BlockDispatcher: kernel already running");
  assert_always(!cores_.empty(), "BlockDispatcher: no cores attached");
  reset();
  thread_count_ = thread_count;
  total_blocks_ = (thread_count + threads_per_block_ - 1) / threads_per_block_; // ceiling division
  active_       = true;
  trace("dispatch: launch threads=%u blocks=%u\n", thread_count, total_blocks_);
}

void BlockDispatcher::cycle() {
  if (!active_ || done_) return;

  // ---- retire: a core seen done is released this cycle ----
  for (unsigned i = 0; i < cores_.size(); ++i) {
    Slot& s = slots_[i];
    if (!s.running || !cores_[i]->done()) continue;
    BlockRecord rec;
    rec.block_id     = s.block_id;
    rec.thread_count = s.thread_count;
    rec.core         = i;
    rec.start_cycle  = s.start_cycle;
    rec.end_cycle    = cycle_;
    completed_.push_back(rec);
    cores_[i]->release();
    s.running = false;
    ++blocks_done_;
    trace("dispatch: core%u finished block %u\n", i, rec.block_id);
  }

  // ---- dispatch: next blocks onto free cores ----
  for (unsigned i = 0; i < cores_.size() && blocks_dispatched_ < total_blocks_; ++i) {
    Slot& s = slots_[i];
    if (s.running || !cores_[i]->idle()) continue;
    const unsigned remaining = thread_count_ - blocks_dispatched_ * threads_per_block_;
    const unsigned count     = std::min(threads_per_block_, remaining); // final block may be partial
    s.running      = true;
    s.block_id     = static_cast<uint8_t>(blocks_dispatched_);
    s.thread_count = static_cast<uint8_t>(count);
    s.start_cycle  = cycle_;
    cores_[i]->start(s.block_id, s.thread_count);
    ++blocks_dispatched_;
    trace("dispatch: block %u (%u threads) -> core%u\n", s.block_id, count, i);
  }

  if (blocks_done_ == total_blocks_) {
    done_ = true;
    trace("dispatch: kernel done after %u blocks\n", total_blocks_);
  }
  ++cycle_;
}
