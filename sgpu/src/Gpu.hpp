// **********************************************************************
// sgpu/src/Gpu.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Top level: dispatcher, cores, and the two memory controllers.

                +------------ Gpu ---------------------------------------------+
 DeviceControl  |  BlockDispatcher --start/done--> SimdCore[0..C-1]            |
 (thread_count) |                                   | fetch       | lanes' LSU |
                |                                   v             v            |
                |                  MemCtrl(program, RO)   MemCtrl(data, RW)    |
                +-----------------------|---------------------|----------------+
                                        v                     v
                               program MemoryPort      data MemoryPort

Program controller consumer i is core i's fetcher; data controller consumer
i*threads_per_block + t is lane t of core i.  Each clock, update() steps the parts
in a fixed order: dispatcher, cores, program ctrl, data ctrl, program mem, data mem.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "BlockDispatcher.hpp"
#include "DeviceControl.hpp"
#include "MemCtrl.hpp"
#include "MemoryPort.hpp"
#include "SimdCore.hpp"

#include <cstdint>
#include <vector>

using namespace Cascade; // ok in project headers (macros expect it), but avoid in sub-component headers

struct GpuConfig {
  unsigned num_cores         = 2;
  unsigned threads_per_block = 4;
  unsigned program_channels  = 1;
  unsigned data_channels     = 4;
  unsigned program_addr_bits = 8; // PC width
};

class Gpu : public Component {
  DECLARE_COMPONENT(Gpu);

public:
  Gpu(const GpuConfig& cfg, COMPONENT_CTOR);
  ~Gpu() override;

  Clock(clk);

  void update();
  void reset();

  void attach_program_memory(MemoryPort* mem);
  void attach_data_memory(MemoryPort* mem);

  // host interface
  bool set_thread_count(unsigned count) { return dcr_.write_thread_count(count); } // DCR write
  void start();                                                                    // kernel launch
  bool running() const { return running_; }
  bool done()    const { return dispatcher_->done(); }

  const GpuConfig& config()  const { return cfg_; }
  unsigned  num_cores()      const { return static_cast<unsigned>(cores_.size()); }
  SimdCore& core(unsigned i)       { return *cores_[i]; }
  const SimdCore& core(unsigned i) const { return *cores_[i]; }
  BlockDispatcher& dispatcher()    { return *dispatcher_; }
  MemCtrl&  program_ctrl()         { return *program_ctrl_; }
  MemCtrl&  data_ctrl()            { return *data_ctrl_; }
  DeviceControl& dcr()             { return dcr_; }
  uint64_t  cycles()         const { return cycle_; }
  size_t    fault_count()    const;

private:
  class CoreBlockPort;

  GpuConfig                   cfg_;
  DeviceControl               dcr_;
  BlockDispatcher*            dispatcher_   = nullptr;
  MemCtrl*                    program_ctrl_ = nullptr;
  MemCtrl*                    data_ctrl_    = nullptr;
  std::vector<SimdCore*>      cores_;
  std::vector<CoreBlockPort*> core_ports_;
  MemoryPort*                 program_mem_  = nullptr;
  MemoryPort*                 data_mem_     = nullptr;
  bool                        running_      = false;
  uint64_t                    cycle_        = 0;
};
