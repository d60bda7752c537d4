// **********************************************************************
// sgpu/src/DeviceControl.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Device control register: holds the kernel's thread count.  Host writes it once before
launch; writes while a kernel is running, or above 255, are refused.
*/
#pragma once

#include <cstdint>

class DeviceControl {
public:
  static constexpr unsigned MAX_THREADS = 255;

  bool     write_thread_count(unsigned count); // false when refused
  unsigned thread_count() const { return thread_count_; }
  bool     configured()   const { return configured_; }
  void     lock()   { locked_ = true; }        // kernel running
  void     unlock() { locked_ = false; }
  void     reset();

private:
  uint8_t thread_count_ = 0;
  bool    configured_   = false;
  bool    locked_       = false;
};
