// **********************************************************************
// score/include/MemTypes.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Request/response packets carried over the program and data buses.
*/
#pragma once

#include <cstdint>

struct MemReq {
  uint32_t addr  = 0;
  bool     write = false;
  uint32_t wdata = 0; // only meaningful for writes
};

struct MemResp {
  uint32_t rdata = 0; // read data (0 for write acks)
  bool     write = false;
};
