// **********************************************************************
// sgpu/src/Gpu.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "Gpu.hpp"

#include <string>

using namespace Cascade;

// Simple adapter/shim class that exposes a SimdCore as a BlockPort for the dispatcher (only viewable in this .cpp)
class Gpu::CoreBlockPort : public BlockPort {
public:
  explicit CoreBlockPort(SimdCore& core) : core_(core) {}

  void start(uint8_t block_id, uint8_t thread_count) override { core_.start(block_id, thread_count); }
  bool done() const override { return core_.done(); }
  void release() override { core_.release(); }
  bool idle() const override { return !core_.busy() && !core_.done(); }

private:
  SimdCore& core_;
};

Gpu::Gpu(const GpuConfig& cfg, IMPL_CTOR)
  : cfg_(cfg)
{
  assert_always(cfg.num_cores > 0, "Gpu: num_cores must be > 0");
  assert_always(cfg.threads_per_block > 0, "Gpu: threads_per_block must be > 0");

  // ---- Allocate blocks ----
  dispatcher_   = new BlockDispatcher("dispatch", cfg.threads_per_block);
  program_ctrl_ = new MemCtrl("pmem_ctrl", cfg.num_cores, cfg.program_channels, /*write_enable*/ false);
  data_ctrl_    = new MemCtrl("dmem_ctrl", cfg.num_cores * cfg.threads_per_block, cfg.data_channels, /*write_enable*/ true);
  for (unsigned i = 0; i < cfg.num_cores; ++i) {
    cores_.push_back(new SimdCore("core" + std::to_string(i), i, cfg.threads_per_block, cfg.program_addr_bits));
  }

  // ---- Clocking ----
  dispatcher_->clk << clk; program_ctrl_->clk << clk; data_ctrl_->clk << clk;
  for (SimdCore* c : cores_) c->clk << clk;

  // ---- Wiring: fetchers and LSUs onto controller ports ----
  std::vector<BlockPort*> ports;
  for (unsigned i = 0; i < cfg.num_cores; ++i) {
    SimdCore* c = cores_[i];
    c->attach_program_port(&program_ctrl_->port(i));
    for (unsigned t = 0; t < cfg.threads_per_block; ++t) {
      c->attach_data_port(t, &data_ctrl_->port(i * cfg.threads_per_block + t));
    }
    core_ports_.push_back(new CoreBlockPort(*c));
    ports.push_back(core_ports_.back());
  }
  dispatcher_->attach_cores(ports);
}

void Gpu::attach_program_memory(MemoryPort* mem) {
  program_mem_ = mem;
  program_ctrl_->attach_memory(mem);
}

void Gpu::attach_data_memory(MemoryPort* mem) {
  data_mem_ = mem;
  data_ctrl_->attach_memory(mem);
}

void Gpu::start() {
  assert_always(program_mem_ && data_mem_, "Gpu: attach program and data memory before start");
  assert_always(dcr_.configured(), "Gpu: thread_count not configured");
  assert_always(!running_, "Gpu: kernel already running");
  dcr_.lock();
  dispatcher_->launch(dcr_.thread_count());
  running_ = true;
}

void Gpu::update() {
  if (!program_mem_ || !data_mem_) return;
  dispatcher_->cycle();
  for (SimdCore* c : cores_) c->cycle();
  program_ctrl_->cycle();
  data_ctrl_->cycle();
  program_mem_->cycle();
  data_mem_->cycle();
  if (running_ && dispatcher_->done()) { // kernel retired; DCR writable again
    running_ = false;
    dcr_.unlock();
    trace("gpu: kernel done at cycle %llu\n", (unsigned long long)cycle_);
  }
  ++cycle_;
}

void Gpu::reset() {
  dispatcher_->reset();
  program_ctrl_->reset();
  data_ctrl_->reset();
  for (SimdCore* c : cores_) c->reset();
  dcr_.reset();
  running_ = false;
  cycle_   = 0;
}

size_t Gpu::fault_count() const {
  size_t n = 0;
  for (const SimdCore* c : cores_) n += c->fault_log().size();
  return n;
}

Gpu::~Gpu() {
  delete dispatcher_;
  delete program_ctrl_;
  delete data_ctrl_;
  for (CoreBlockPort* p : core_ports_) delete p;
  for (SimdCore* c : cores_) delete c;
}
