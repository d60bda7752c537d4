// **********************************************************************
// score/include/SimdCore.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
One SIMD compute core.  A single PC is shared by all lanes of the thread block the
core is running; each clock the core either waits on its instruction fetch or
executes the fetched instruction across every active lane.

  IDLE --start()--> FETCHING --word latched--> EXECUTING --retired--> FETCHING
                                                   |
                                      HALT / fault +--> IDLE (done raised)

LDR/STR stay in EXECUTING until every active lane's transaction has completed.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "FetchUnit.hpp"
#include "Instruction.hpp"
#include "LoadStoreUnit.hpp"
#include "MemoryPort.hpp"
#include "RegisterFile.hpp"

#include <cstdint>
#include <string>
#include <vector>

class SimdCore : public Component { // inherit from Component,
  DECLARE_COMPONENT(SimdCore);      // macro boilerplate to plug Component into sim engine

public:
  enum class State { Idle, Fetching, Executing };

  enum class Fault : uint32_t {
    None             = 0u,
    InvalidOpcode    = 1u,
    BranchDivergence = 2u,
  };

  struct FaultRecord {
    uint8_t  block_id = 0;
    uint32_t pc       = 0;
    uint16_t instr    = 0;
    Fault    cause    = Fault::None;
  };

  SimdCore(std::string name, unsigned core_id, unsigned threads_per_block, unsigned pc_bits, COMPONENT_CTOR);
  Clock(clk);

  void update();
  void reset();
  void cycle();                                          // advance one clock, called by the owner

  void attach_program_port(MemClientPort* port) { fetcher_.attach_port(port); }
  void attach_data_port(unsigned lane, MemClientPort* port);

  // block control (dispatcher side)
  void start(uint8_t block_id, uint8_t thread_count);
  void release();                                        // clear done, core becomes free again

  // status helpers
  unsigned id()             const { return id_; }
  State    state()          const { return state_; }
  bool     busy()           const { return state_ != State::Idle; }
  bool     done()           const { return done_; }
  uint32_t pc()             const { return pc_; }
  uint16_t instr()          const { return instr_; }     // last fetched word
  uint8_t  block_id()       const { return block_id_; }
  uint8_t  thread_count()   const { return thread_count_; }
  unsigned num_lanes()      const { return static_cast<unsigned>(lanes_.size()); }
  Fault    fault()          const { return fault_; }     // fault of the current/last block
  const std::vector<FaultRecord>& fault_log() const { return fault_log_; }

  // lane helpers (used by Core_exec)
  bool     lane_active(unsigned lane)              const { return lane < lanes_.size() && lanes_[lane].active; }
  uint8_t  read_reg(unsigned lane, uint32_t idx)   const { return lane < lanes_.size() ? lanes_[lane].regs.read(idx) : 0; }
  void     write_reg(unsigned lane, uint32_t idx, uint8_t value);
  uint8_t  nzp(unsigned lane)                      const { return lane < lanes_.size() ? lanes_[lane].nzp : 0; }
  void     set_nzp(unsigned lane, uint8_t flags);
  LoadStoreUnit& lsu(unsigned lane)                      { return lanes_[lane].lsu; }
  uint32_t branch_target(uint32_t imm8)            const;

  // counters
  uint64_t inst_count()         const { return inst_count_; }
  uint64_t load_count()         const { return load_count_; }
  uint64_t store_count()        const { return store_count_; }
  uint64_t branch_count()       const { return branch_count_; }
  uint64_t branch_taken_count() const { return branch_taken_count_; }
  uint64_t busy_cycles()        const { return busy_cycles_; }
  uint64_t fetch_stalls()       const { return fetch_stalls_; }
  uint64_t mem_stalls()         const { return mem_stalls_; }

private:
  struct Lane {               // per-thread state, one per lane
    RegisterFile  regs;
    uint8_t       nzp    = 0;
    bool          active = false;
    LoadStoreUnit lsu;
  };

  void fetch();
  void execute();
  void finish();              // HALT
  void raise_fault(Fault cause);

  unsigned          id_       = 0;
  uint32_t          pc_mask_  = 0xffu;
  FetchUnit         fetcher_;
  std::vector<Lane> lanes_;

  State    state_        = State::Idle;
  bool     done_         = false;
  uint32_t pc_           = 0;   // shared PC
  uint16_t instr_        = 0;
  uint8_t  block_id_     = 0;
  uint8_t  thread_count_ = 0;
  Fault    fault_        = Fault::None;
  std::vector<FaultRecord> fault_log_;

  // Simple micro-architectural counters
  uint64_t inst_count_         = 0;
  uint64_t load_count_         = 0;
  uint64_t store_count_        = 0;
  uint64_t branch_count_       = 0;
  uint64_t branch_taken_count_ = 0;
  uint64_t busy_cycles_        = 0;
  uint64_t fetch_stalls_       = 0;
  uint64_t mem_stalls_         = 0;
};

const char* fault_name(SimdCore::Fault cause);
