// **********************************************************************
// sgpu/src/DeviceControl.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "DeviceControl.hpp"

bool DeviceControl::write_thread_count(unsigned count) {
  if (locked_ || count > MAX_THREADS) return false;
  thread_count_ = static_cast<uint8_t>(count);
  configured_   = true;
  return true;
}

void DeviceControl::reset() {
  thread_count_ = 0;
  configured_   = false;
  locked_       = false;
}
