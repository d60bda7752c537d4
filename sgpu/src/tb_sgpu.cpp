// **********************************************************************
// sgpu/src/tb_sgpu.cpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Testbench for the whole GPU.

  -suite=<name>  run a self-checking suite (dispatch, DCR, kernels, faults) and exit
  (no suite)     load -prog/-data files, or a built-in -kernel, launch it, then either
                 auto-run -steps cycles or drop into the interactive debugger (-steps<=0)
*/

#include <descore/Parameter.hpp>
#include "Gpu.hpp"
#include "BlockDispatcher.hpp"
#include "Debugger.hpp"
#include "Diagnostics.hpp"
#include "Kernels.hpp"
#include "SimMemory.hpp"
#include "util/ProgramLoader.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// **************
// Parameters (CLI flags): name, default value, help text
// **************
BoolParameter(showcontexts, false, "List component instance names (contexts) and exit");
StringParameter(suite, "", "Suite: dispatch_partial|dispatch_empty|dcr|kernel_const|matadd|matmul|"
                           "fault_isolation|divergence|zero_threads|latency|release_timing|debugger|all; "
                           "empty runs a program");
StringParameter(kernel, "matadd", "Built-in kernel when no -prog is given: matadd|matmul");
StringParameter(prog, "", "Program image (.hex text or flat .bin of 16b words)");
StringParameter(data, "", "Data image (.hex text or flat .bin of bytes)");
IntParameter(prog_addr, 0x0, "Program load address");
IntParameter(data_addr, 0x0, "Data load address");
IntParameter(threads, -1, "Kernel thread count; <0 uses the built-in kernel's");
IntParameter(num_cores, 2, "Number of compute cores");
IntParameter(threads_per_block, 4, "Threads (lanes) per core");
IntParameter(prog_channels, 1, "Program memory channels");
IntParameter(data_channels, 4, "Data memory channels");
IntParameter(prog_latency, 0, "Program memory latency (cycles)");
IntParameter(data_latency, 0, "Data memory latency (cycles)");
IntParameter(steps, 0, "Cycles to auto-run; <=0 enters interactive debugger");
IntParameter(dump_addr, 0x0, "First data address to print after the run");
IntParameter(dump_count, 0, "Data bytes to print after the run (0 = none)");

namespace {

// Stand-in for a core: finishes each block a fixed number of cycles after start.
// `now` is the harness cycle, so starts and done edges can be compared.
class ScriptedBlockPort : public BlockPort {
public:
  struct Started { uint8_t block_id; uint8_t thread_count; int at; };

  ScriptedBlockPort(int latency, const int& now) : latency_(latency), now_(now) {}

  void start(uint8_t block_id, uint8_t thread_count) override {
    assert_always(idle(), "dispatch: block handed to a runner that is not idle");
    busy_ = true;
    left_ = latency_;
    started.push_back(Started{block_id, thread_count, now_});
  }
  bool done() const override { return done_; }
  void release() override { done_ = false; }
  bool idle() const override { return !busy_ && !done_; }

  void tick() {
    if (busy_ && --left_ <= 0) { busy_ = false; done_ = true; done_at.push_back(now_); }
  }

  std::vector<Started> started;
  std::vector<int>     done_at; // cycle in which done was raised

private:
  int        latency_;
  const int& now_;
  int        left_ = 0;
  bool       busy_ = false;
  bool       done_ = false;
};

struct Rig {
  Gpu&       gpu;
  SimMemory& pmem;
  SimMemory& dmem;
};

// reset everything and load a kernel; memory latencies come from the command line
void load(Rig& rig, const std::vector<uint16_t>& program, const std::vector<uint8_t>& input) {
  Sim::reset();
  rig.pmem.clear(); rig.pmem.reset(); rig.pmem.set_latency((unsigned)(int)prog_latency);
  rig.dmem.clear(); rig.dmem.reset(); rig.dmem.set_latency((unsigned)(int)data_latency);
  for (size_t i = 0; i < program.size(); ++i) rig.pmem.write(static_cast<uint32_t>(i), program[i]);
  for (size_t i = 0; i < input.size(); ++i)   rig.dmem.write(static_cast<uint32_t>(i), input[i]);
}

int run_to_done(Gpu& gpu, int max_cycles) {
  int n = 0;
  while (!gpu.done() && n < max_cycles) {
    Sim::run();
    ++n;
  }
  return n;
}

void launch(Rig& rig, unsigned thread_count) {
  assert_always(rig.gpu.set_thread_count(thread_count), "DCR write refused");
  rig.gpu.start();
}

void check_output(Rig& rig, const Kernel& k) {
  for (size_t i = 0; i < k.expected.size(); ++i) {
    const uint32_t got = rig.dmem.read(k.out_addr + static_cast<uint32_t>(i));
    if (got != k.expected[i]) {
      std::cout << k.name << ": data[" << (k.out_addr + i) << "] = " << got
                << ", expected " << unsigned(k.expected[i]) << std::endl;
    }
    assert_always(got == k.expected[i], "kernel output mismatch");
  }
}

// -------------------- dispatcher on its own --------------------

void suite_dispatch_partial(BlockDispatcher& d) {
  int now = 0;
  ScriptedBlockPort a(3, now), b(5, now);
  d.attach_cores({&a, &b});
  d.launch(10);
  assert_always(d.total_blocks() == 3, "dispatch_partial: ceil(10/4) != 3");

  for (now = 0; now < 100 && !d.done(); ++now) {
    d.cycle();
    if (d.done()) {
      assert_always(d.blocks_done() == 3, "dispatch_partial: done before every block completed");
      assert_always(a.idle() && b.idle(), "dispatch_partial: done with a runner still busy");
      break;
    }
    a.tick();
    b.tick();
  }
  assert_always(d.done(), "dispatch_partial: kernel never finished");

  std::vector<int> count(3, -1);
  for (const ScriptedBlockPort* p : {&a, &b}) {
    for (const ScriptedBlockPort::Started& s : p->started) {
      assert_always(s.block_id < 3 && count[s.block_id] < 0, "dispatch_partial: block dispatched twice");
      count[s.block_id] = s.thread_count;
    }
  }
  assert_always(count[0] == 4 && count[1] == 4 && count[2] == 2, "dispatch_partial: block sizes != {4,4,2}");

  // blocks go out in id order
  assert_always(a.started.front().block_id == 0 && b.started.front().block_id == 1, "dispatch_partial: dispatch order");

  // a runner that raised done in cycle k is released and refilled in cycle k+1
  assert_always(a.started.size() == 2 && a.started[1].block_id == 2, "dispatch_partial: faster runner did not take block 2");
  for (const ScriptedBlockPort* p : {&a, &b}) {
    assert_always(p->done_at.size() == p->started.size(), "dispatch_partial: block never finished");
    for (size_t k = 1; k < p->started.size(); ++k) {
      assert_always(p->started[k].at == p->done_at[k - 1] + 1, "dispatch_partial: release not exactly one cycle after done");
    }
  }
  for (const BlockDispatcher::BlockRecord& r : d.completed()) {
    const ScriptedBlockPort& p = (r.core == 0) ? a : b;
    bool matched = false;
    for (size_t k = 0; k < p.started.size(); ++k) {
      if (p.started[k].block_id != r.block_id) continue;
      assert_always(r.start_cycle == (uint64_t)p.started[k].at, "dispatch_partial: start cycle record");
      assert_always(r.end_cycle == (uint64_t)p.done_at[k] + 1, "dispatch_partial: release cycle record");
      matched = true;
    }
    assert_always(matched, "dispatch_partial: completion for a block never started");
  }
}

void suite_dispatch_empty(BlockDispatcher& d) {
  int now = 0;
  ScriptedBlockPort a(1, now);
  d.attach_cores({&a});
  d.launch(0);
  assert_always(!d.done(), "dispatch_empty: done before first cycle");
  d.cycle();
  assert_always(d.done() && d.total_blocks() == 0, "dispatch_empty: zero-thread kernel not done");
  assert_always(a.started.empty(), "dispatch_empty: runner started");
}

// -------------------- whole GPU --------------------

void suite_dcr(Rig& rig) {
  load(rig, {Instruction::halt()}, {});
  Gpu& gpu = rig.gpu;
  assert_always(!gpu.set_thread_count(256), "dcr: accepted thread_count > 255");
  assert_always(!gpu.dcr().configured(), "dcr: refused write applied");
  assert_always(gpu.set_thread_count(8), "dcr: valid write refused");
  gpu.start();
  assert_always(!gpu.set_thread_count(4), "dcr: write accepted while kernel running");
  assert_always(gpu.dcr().thread_count() == 8, "dcr: running kernel's count changed");
  run_to_done(gpu, 200);
  assert_always(gpu.done() && !gpu.running(), "dcr: kernel did not finish");
  assert_always(gpu.dispatcher().total_blocks() == (8 + gpu.config().threads_per_block - 1) / gpu.config().threads_per_block,
                "dcr: wrong block count");
  assert_always(gpu.set_thread_count(4), "dcr: still locked after kernel done");
}

void suite_kernel_const(Rig& rig) {
  load(rig, {Instruction::constant(0, 5), Instruction::halt()}, {});
  launch(rig, 1);
  run_to_done(rig.gpu, 100);
  assert_always(rig.gpu.done(), "kernel_const: not done");
  assert_always(rig.gpu.core(0).read_reg(0, 0) == 5, "kernel_const: R0 != 5");
  for (unsigned t = 1; t < rig.gpu.config().threads_per_block; ++t) {
    assert_always(rig.gpu.core(0).read_reg(t, 0) == 0, "kernel_const: inactive lane written");
  }
  assert_always(rig.gpu.fault_count() == 0, "kernel_const: unexpected fault");
}

void suite_kernel(Rig& rig, const Kernel& k) {
  assert_always(k.thread_count % rig.gpu.config().threads_per_block == 0,
                "built-in kernels index by blockIdx*blockDim and need full blocks");
  load(rig, k.program, k.data);
  launch(rig, k.thread_count);
  const int cycles = run_to_done(rig.gpu, 5000);
  assert_always(rig.gpu.done(), "kernel did not finish");
  check_output(rig, k);
  assert_always(rig.gpu.fault_count() == 0, "unexpected fault");
  std::cout << k.name << ": " << cycles << " cycles" << std::endl;
}

// block 0 hits a reserved opcode; the other block must still run and the kernel finish
void suite_fault_isolation(Rig& rig) {
  assert_always(rig.gpu.num_cores() >= 2, "fault_isolation: needs two cores");
  const uint32_t out = 0x30;
  load(rig, {Instruction::constant(1, 0),                       // 0
             Instruction::constant(2, out),                     // 1
             Instruction::rrr(Instruction::Opcode::ADD, 2, 2, 13), // 2  addr = out + block
             Instruction::cmp(13, 1),                           // 3
             Instruction::brnzp(Instruction::NZP_Z, 8),         // 4  block 0 -> bad word
             Instruction::constant(3, 0x55),                    // 5
             Instruction::str(2, 3),                            // 6
             Instruction::halt(),                               // 7
             0xB000},                                           // 8
       {});
  launch(rig, 2 * rig.gpu.config().threads_per_block);
  run_to_done(rig.gpu, 1000);
  assert_always(rig.gpu.done(), "fault_isolation: kernel did not finish");
  assert_always(rig.gpu.fault_count() == 1, "fault_isolation: expected exactly one fault");
  const SimdCore& bad = rig.gpu.core(0);
  assert_always(bad.fault_log().size() == 1, "fault_isolation: fault not on core 0");
  assert_always(bad.fault_log()[0].cause == SimdCore::Fault::InvalidOpcode && bad.fault_log()[0].pc == 8,
                "fault_isolation: fault record");
  assert_always(rig.dmem.read(out) == 0, "fault_isolation: faulted block stored");
  assert_always(rig.dmem.read(out + 1) == 0x55, "fault_isolation: healthy block did not store");
  assert_always(rig.gpu.core(1).fault() == SimdCore::Fault::None, "fault_isolation: healthy core faulted");
}

void suite_divergence(Rig& rig) {
  load(rig, {Instruction::constant(1, 1),
             Instruction::cmp(15, 1),                   // lane 0 N, lane 1 Z, others P
             Instruction::brnzp(Instruction::NZP_Z | Instruction::NZP_P, 4),
             Instruction::halt(),
             Instruction::halt()},
       {});
  launch(rig, 2);
  run_to_done(rig.gpu, 200);
  assert_always(rig.gpu.done(), "divergence: kernel did not finish");
  assert_always(rig.gpu.core(0).fault() == SimdCore::Fault::BranchDivergence, "divergence: not reported");
}

void suite_zero_threads(Rig& rig) {
  load(rig, {Instruction::halt()}, {});
  launch(rig, 0);
  assert_always(!rig.gpu.done(), "zero_threads: done before first cycle");
  Sim::run();
  assert_always(rig.gpu.done(), "zero_threads: not done after one cycle");
  for (unsigned i = 0; i < rig.gpu.num_cores(); ++i) {
    assert_always(rig.gpu.core(i).busy_cycles() == 0, "zero_threads: a core ran");
  }
}

// HALT-only blocks through real cores: every core is refilled the cycle after it raised
// done.  Cycles are the dispatcher's, which count from launch.
void suite_release_timing(Rig& rig) {
  load(rig, {Instruction::halt()}, {});
  Gpu& gpu = rig.gpu;
  const unsigned tpb = gpu.config().threads_per_block;
  const unsigned nthreads = 2 * tpb * gpu.num_cores() + tpb / 2 + 1; // partial last block
  launch(rig, nthreads);

  std::vector<std::vector<uint64_t>> raised(gpu.num_cores());
  std::vector<bool> was_done(gpu.num_cores(), false);
  for (int n = 0; n < 2000 && !gpu.done(); ++n) {
    Sim::run();
    for (unsigned i = 0; i < gpu.num_cores(); ++i) {
      const bool d = gpu.core(i).done();
      if (d && !was_done[i]) raised[i].push_back(gpu.dispatcher().cycles()); // first cycle that can see it
      was_done[i] = d;
    }
  }
  assert_always(gpu.done(), "release_timing: kernel did not finish");

  const unsigned blocks = (nthreads + tpb - 1) / tpb;
  assert_always(gpu.dispatcher().completed().size() == blocks, "release_timing: block count");
  for (unsigned i = 0; i < gpu.num_cores(); ++i) {
    std::vector<BlockDispatcher::BlockRecord> mine;
    for (const BlockDispatcher::BlockRecord& r : gpu.dispatcher().completed()) {
      if (r.core == i) mine.push_back(r);
    }
    assert_always(mine.size() == raised[i].size(), "release_timing: done edges and completions differ");
    for (size_t k = 0; k < mine.size(); ++k) {
      assert_always(mine[k].end_cycle == raised[i][k], "release_timing: core not released the cycle after done");
      if (k + 1 < mine.size()) {
        assert_always(mine[k + 1].start_cycle == mine[k].end_cycle, "release_timing: freed core not refilled at once");
      }
    }
  }
  assert_always(gpu.fault_count() == 0, "release_timing: unexpected fault");
}

// debugger driven by command lines: step, breakpoint stop, inspection, run to completion
void suite_debugger(Rig& rig) {
  const std::vector<uint16_t> prog = {Instruction::constant(0, 5), Instruction::halt()};
  load(rig, prog, {});
  launch(rig, 1);
  sgpu::DebuggerState dbg(rig.gpu, rig.pmem, rig.dmem);
  assert_always(sgpu::run_command(dbg, "step 2") && dbg.cycle == 2, "debugger: step 2");
  assert_always(sgpu::run_command(dbg, "break 1") && dbg.breakpoints.size() == 1, "debugger: break");
  assert_always(sgpu::run_command(dbg, "br 0x1") && dbg.breakpoints.size() == 1, "debugger: duplicate breakpoint kept");
  for (const char* line : {"", "regs", "regs 0:0", "regs 9", "mem 0 4", "prog 0 2", "trace off", "stats", "frobnicate"}) {
    assert_always(sgpu::run_command(dbg, line), "debugger: inspection ended the session");
  }
  assert_always(dbg.cycle == 2, "debugger: inspection advanced the clock");

  assert_always(sgpu::run_command(dbg, "cont"), "debugger: cont ran past the breakpoint");
  const SimdCore& c = rig.gpu.core(0);
  assert_always(!dbg.kernel_done && c.state() == SimdCore::State::Executing && c.pc() == 1,
                "debugger: not stopped at pc 1");
  assert_always(c.read_reg(0, 0) == 5, "debugger: CONST before the breakpoint not retired");
  const int stop = dbg.cycle;

  assert_always(!sgpu::run_command(dbg, "cont"), "debugger: session open after kernel done");
  assert_always(dbg.kernel_done && rig.gpu.done() && dbg.cycle > stop, "debugger: kernel did not finish");
  assert_always(!dbg.user_quit, "debugger: quit without being asked");

  // same thing through the line reader; quit ends it and later lines are ignored
  load(rig, prog, {});
  launch(rig, 1);
  sgpu::DebuggerState dbg2(rig.gpu, rig.pmem, rig.dmem);
  std::istringstream script("step 2\nbreak 1\ndelete 1\ndelete 1\nquit\nstep 5\n");
  sgpu::run_debugger(dbg2, script);
  assert_always(dbg2.user_quit && dbg2.cycle == 2, "debugger: scripted session");
  assert_always(dbg2.breakpoints.empty(), "debugger: delete left a breakpoint");
}

// matadd again with slow memories: same answer, more cycles
void suite_latency(Rig& rig) {
  const Kernel k = kernel_matadd();
  load(rig, k.program, k.data);
  rig.pmem.set_latency(2);
  rig.dmem.set_latency(3);
  launch(rig, k.thread_count);
  run_to_done(rig.gpu, 20000);
  assert_always(rig.gpu.done(), "latency: kernel did not finish");
  check_output(rig, k);
  uint64_t stalls = 0;
  for (unsigned i = 0; i < rig.gpu.num_cores(); ++i) stalls += rig.gpu.core(i).mem_stalls();
  assert_always(stalls > 0, "latency: no memory stalls with slow memory");
}

int run_suites(const std::string& S, Rig& rig, BlockDispatcher& d) {
  const bool all = (S == "all");
  int ran = 0;
  auto want = [&](const char* name) { return all || S == name; };
  auto pass = [&](const char* name) { std::cout << "suite " << name << ": PASS" << std::endl; ++ran; };

  if (want("dispatch_partial")) { suite_dispatch_partial(d);          pass("dispatch_partial"); }
  if (want("dispatch_empty"))   { suite_dispatch_empty(d);            pass("dispatch_empty"); }
  if (want("dcr"))              { suite_dcr(rig);                     pass("dcr"); }
  if (want("kernel_const"))     { suite_kernel_const(rig);            pass("kernel_const"); }
  if (want("matadd"))           { suite_kernel(rig, kernel_matadd()); pass("matadd"); }
  if (want("matmul"))           { suite_kernel(rig, kernel_matmul()); pass("matmul"); }
  if (want("fault_isolation"))  { suite_fault_isolation(rig);         pass("fault_isolation"); }
  if (want("divergence"))       { suite_divergence(rig);              pass("divergence"); }
  if (want("zero_threads"))     { suite_zero_threads(rig);            pass("zero_threads"); }
  if (want("latency"))          { suite_latency(rig);                 pass("latency"); }
  if (want("release_timing"))   { suite_release_timing(rig);          pass("release_timing"); }
  if (want("debugger"))         { suite_debugger(rig);                pass("debugger"); }
  return ran;
}

void dump_data(SimMemory& dmem, uint32_t addr, uint32_t count) {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');
  for (uint32_t i = 0; i < count; ++i) {
    if (i % 8 == 0) std::cout << (i ? "\n" : "") << "  [0x" << std::hex << std::setw(2) << addr + i << "]";
    std::cout << " " << std::hex << std::setw(2) << dmem.read(addr + i);
  }
  std::cout << std::dec << std::endl;
  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}

} // namespace

int main(int argc, char *argv[])
{
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);        // scans argv for trace options
  Parameter::parseCommandLine(argc, argv); // parses cmd line flags and fills *Parameter() globals (above)
  Sim::parseDumps(argc, argv);             // dump signals, denote what to write to VCD waves

  // **************
  // Step 2: Create components
  // **************
  GpuConfig cfg;
  cfg.num_cores         = (unsigned)(int)num_cores;
  cfg.threads_per_block = (unsigned)(int)threads_per_block;
  cfg.program_channels  = (unsigned)(int)prog_channels;
  cfg.data_channels     = (unsigned)(int)data_channels;
  Gpu gpu(cfg);
  SimMemory pmem(8, 16, cfg.program_channels, (unsigned)(int)prog_latency); // 256 x 16b program words
  SimMemory dmem(8, 8, cfg.data_channels, (unsigned)(int)data_latency);     // 256 x 8b data bytes
  gpu.attach_program_memory(&pmem);
  gpu.attach_data_memory(&dmem);
  BlockDispatcher scratch_dispatcher("dispatch_tb", 4); // dispatcher-only suites

  // **************
  // Step 3: Optional: list component instance names & exit
  // **************
  if (showcontexts) {
    Sim::dumpComponentNames();
    return 0;
  }

  // **************
  // Step 4: Hook clock and initialize & reset simulator
  // **************
  Clock clk;
  gpu.clk << clk;
  scratch_dispatcher.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  Rig rig{gpu, pmem, dmem};

  // **************
  // Step 5: Self-checking suites
  // **************
  const std::string S = std::string(suite);
  if (!S.empty()) {
    const int ran = run_suites(S, rig, scratch_dispatcher);
    assert_always(ran > 0, "unknown -suite");
    log("\n");
    return 0;
  }

  // **************
  // Step 6: Load program + data (files, or a built-in kernel)
  // **************
  Kernel builtin;
  const std::string prog_path = std::string(prog);
  const std::string data_path = std::string(data);
  const bool using_builtin = prog_path.empty();
  unsigned thread_count = 0;
  if (using_builtin) {
    assert_always(find_kernel(std::string(kernel), &builtin), "unknown -kernel");
    load(rig, builtin.program, builtin.data);
    thread_count = builtin.thread_count;
  } else {
    load(rig, {}, {});
    uint32_t nwords = 0;
    bool ok = load_image(prog_path, &pmem, (uint32_t)(int)prog_addr, 2, &nwords);
    assert_always(ok, "Program load failed");
    std::cout << "Loaded " << nwords << " program words from " << prog_path << std::endl;
    if (!data_path.empty()) {
      ok = load_image(data_path, &dmem, (uint32_t)(int)data_addr, 1, &nwords);
      assert_always(ok, "Data load failed");
      std::cout << "Loaded " << nwords << " data bytes from " << data_path << std::endl;
    }
  }
  if ((int)threads >= 0) thread_count = (unsigned)(int)threads;
  assert_always(gpu.set_thread_count(thread_count), "thread count refused (0..255)");
  gpu.start();
  std::cout << "Kernel: " << (using_builtin ? builtin.name : prog_path)
            << "  threads=" << thread_count
            << "  cores=" << cfg.num_cores << "x" << cfg.threads_per_block << std::endl;

  // **************
  // Step 7: Run simulation
  // **************
  const int max_cycles = static_cast<int>(steps);
  sgpu::DebuggerState dbg(gpu, pmem, dmem);
  if (max_cycles > 0) {
    sgpu::auto_run(dbg, max_cycles);
  } else {
    sgpu::run_debugger(dbg, std::cin);
  }

  if ((int)dump_count > 0) {
    dump_data(dmem, (uint32_t)(int)dump_addr, (uint32_t)(int)dump_count);
  }

  // **************
  // Step 8A: Kernel completed
  // **************
  if (dbg.kernel_done) {
    sgpu::print_stats(gpu);
    if (using_builtin && (int)threads < 0) {
      check_output(rig, builtin);
      std::cout << builtin.name << ": output OK" << std::endl;
    }
    return 0;
  }

  if (dbg.user_quit) {
    return 0;
  }

  // **************
  // Step 8B: Ran out of cycles: post-mortem
  // **************
  sgpu::verify_and_report_postmortem(gpu, dmem, dbg.cycle);
  return 0;
}
