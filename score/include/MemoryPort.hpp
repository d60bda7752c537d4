// **********************************************************************
// score/include/MemoryPort.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
The two sides of a bus, as software protocols (not simulatable objects).

MemoryPort      : what a memory controller sees of a backing store.  One in-flight
                  request per channel with a valid/ready handshake, plus untimed
                  read/write helpers so harnesses can load programs and inspect results.

MemClientPort   : a single-slot request/response channel between one requester
                  (fetch unit, LSU) and a memory controller.

------ requester ------+   +----------- MemCtrl -----------+   +--- MemoryPort ---
 request()   -> valid  |==>| bind channel     request(ch)  |==>|
 resp_valid() <- ready |<==| respond()     resp_valid(ch)  |<==|
-----------------------+   +-------------------------------+   +------------------
*/
#pragma once

#include <cstdint>
#include "MemTypes.hpp"

class MemoryPort {
public:
  virtual          ~MemoryPort()                          = default;
  // untimed helpers (HAL), bypass channels
  virtual uint32_t read(uint32_t addr)                    = 0;
  virtual void     write(uint32_t addr, uint32_t value)   = 0;
  // timed channel interface
  virtual unsigned num_channels() const                   = 0;
  virtual void     cycle()                                = 0; // advance one clock
  virtual bool     can_request(unsigned ch) const         = 0; // true when channel holds no request
  virtual void     request(unsigned ch, const MemReq& req) = 0;
  virtual bool     resp_valid(unsigned ch) const          = 0; // memory's ready
  virtual MemResp  resp(unsigned ch) const                = 0;
  virtual void     resp_consume(unsigned ch)              = 0; // frees the channel
};

// Requester holds valid (and its request) until the controller raises ready, then consumes.
class MemClientPort {
public:
  // requester side
  bool           can_request() const { return !valid_; }
  void           request(const MemReq& req) { req_ = req; valid_ = true; ready_ = false; }
  bool           resp_valid()  const { return ready_; }
  const MemResp& resp()        const { return resp_; }
  void           resp_consume()      { valid_ = false; ready_ = false; }

  // controller side
  bool           valid()       const { return valid_; }
  bool           pending()     const { return valid_ && !ready_; } // request not yet answered
  const MemReq&  req()         const { return req_; }
  void           respond(const MemResp& resp) { resp_ = resp; ready_ = true; }

  void           reset() { valid_ = false; ready_ = false; req_ = MemReq{}; resp_ = MemResp{}; }

private:
  bool    valid_ = false;
  bool    ready_ = false;
  MemReq  req_{};
  MemResp resp_{};
};
