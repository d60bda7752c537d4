// **********************************************************************
// sgpu/src/Debugger.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "Debugger.hpp"
#include "Diagnostics.hpp"

#include <cascade/SimGlobals.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sgpu {
namespace {

struct CycleInfo {
  int core = -1;
  uint32_t pc = 0;
  uint16_t instruction = 0;
  bool executed = false;
  bool user_breakpoint_hit = false;
  bool new_fault = false;
  bool kernel_done = false;
};

static constexpr const char* COLOR_RESET = "\033[0m";
static constexpr const char* COLOR_BP    = "\033[33m";
static constexpr const char* COLOR_EXIT  = "\033[32m";
static constexpr const char* COLOR_ERR   = "\033[31m";
static constexpr const char* COLOR_HINT  = "\033[36m";

static std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

static bool parse_u32(const std::string& text, uint32_t* value) {
  try {
    size_t idx = 0;
    const unsigned long parsed = std::stoul(text, &idx, 0);
    if (idx != text.size() || parsed > std::numeric_limits<uint32_t>::max()) {
      return false;
    }
    *value = static_cast<uint32_t>(parsed);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static std::string hex(uint32_t value, int width) {
  std::ostringstream oss;
  oss << std::hex << std::setw(width) << std::setfill('0') << value;
  return oss.str();
}

static const char* state_tag(SimdCore::State s) {
  switch (s) {
    case SimdCore::State::Idle:      return "I";
    case SimdCore::State::Fetching:  return "F";
    case SimdCore::State::Executing: return "E";
  }
  return "?";
}

static void print_cycle_trace(DebuggerState& state) {
  std::cout << "cycle " << state.cycle << ":";
  for (unsigned i = 0; i < state.gpu.num_cores(); ++i) {
    const SimdCore& c = state.gpu.core(i);
    std::cout << " [C" << i << " " << state_tag(c.state());
    if (c.busy()) {
      std::cout << " b" << unsigned(c.block_id()) << " pc=0x" << hex(c.pc(), 2);
      if (c.state() == SimdCore::State::Executing) {
        std::cout << " " << opcode_name(c.instr() >> 12);
      }
    }
    std::cout << "]";
  }
  std::cout << std::endl;
}

static void print_fault(const SimdCore& core) {
  const SimdCore::FaultRecord& f = core.fault_log().back();
  std::cout << COLOR_ERR
            << "[FAULT][C" << core.id() << "] " << fault_name(f.cause)
            << " block=" << unsigned(f.block_id)
            << " pc=0x" << hex(f.pc, 2)
            << " instr=0x" << hex(f.instr, 4)
            << COLOR_RESET << std::endl;
}

static void print_lane(const SimdCore& core, unsigned lane) {
  std::cout << "  t" << lane << (core.lane_active(lane) ? "  " : "* ")
            << "nzp=" << ((core.nzp(lane) & Instruction::NZP_N) ? 'n' : '-')
            << ((core.nzp(lane) & Instruction::NZP_Z) ? 'z' : '-')
            << ((core.nzp(lane) & Instruction::NZP_P) ? 'p' : '-');
  for (uint32_t r = 0; r < RegisterFile::NUM_REGS; ++r) {
    std::cout << " r" << r << "=" << hex(core.read_reg(lane, r), 2);
  }
  std::cout << std::endl;
}

static void print_core(const SimdCore& core) {
  std::cout << "[C" << core.id() << "] state=" << state_tag(core.state())
            << " done=" << (core.done() ? "yes" : "no")
            << " block=" << unsigned(core.block_id())
            << " threads=" << unsigned(core.thread_count())
            << " pc=0x" << hex(core.pc(), 2)
            << " instr=0x" << hex(core.instr(), 4) << std::endl;
  for (unsigned t = 0; t < core.num_lanes(); ++t) {
    print_lane(core, t);
  }
}

static void print_registers(DebuggerState& state) {
  for (unsigned i = 0; i < state.gpu.num_cores(); ++i) {
    print_core(state.gpu.core(i));
  }
  std::cout << "  (* = inactive lane)" << std::endl;
}

static void dump_data(MemoryPort& mem, uint32_t addr, std::size_t count) {
  for (std::size_t i = 0; i < count; i += 8) {
    std::cout << "  [0x" << hex(addr + static_cast<uint32_t>(i), 2) << "]";
    for (std::size_t k = i; k < count && k < i + 8; ++k) {
      std::cout << " " << hex(mem.read(addr + static_cast<uint32_t>(k)), 2);
    }
    std::cout << std::endl;
  }
}

static void dump_program(MemoryPort& mem, uint32_t addr, std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    const uint32_t current = addr + static_cast<uint32_t>(i);
    const uint32_t word = mem.read(current);
    std::cout << "  [0x" << hex(current, 2) << "] = 0x" << hex(word, 4)
              << "  " << opcode_name(word >> 12) << std::endl;
  }
}

// Breakpoints are checked before the clock edge: a core sitting in EXECUTING at a
// breakpoint PC has fetched that instruction but not yet retired it.
static CycleInfo execute_cycle(DebuggerState& state, bool honor_breakpoints) {
  CycleInfo info;
  if (state.kernel_done) {
    return info;
  }

  if (honor_breakpoints && !state.breakpoints.empty()) {
    for (unsigned i = 0; i < state.gpu.num_cores(); ++i) {
      const SimdCore& c = state.gpu.core(i);
      if (c.state() != SimdCore::State::Executing || c.inst_count() == state.break_inst[i]) continue;
      if (std::find(state.breakpoints.begin(), state.breakpoints.end(), c.pc()) == state.breakpoints.end()) continue;
      state.break_inst[i] = c.inst_count(); // stop once per visit
      info.core = static_cast<int>(i);
      info.pc = c.pc();
      info.instruction = c.instr();
      info.user_breakpoint_hit = true;
      return info;
    }
  }

  Sim::run(); // <--------------------------- EXECUTE 1 CYCLE
  state.cycle++;
  info.executed = true;

  if (state.gpu.fault_count() > state.faults_seen) {
    for (unsigned i = 0; i < state.gpu.num_cores(); ++i) {
      const SimdCore& c = state.gpu.core(i);
      if (c.done() && c.fault() != SimdCore::Fault::None && !c.fault_log().empty()) {
        print_fault(c);
      }
    }
    state.faults_seen = state.gpu.fault_count();
    info.new_fault = true;
  }

  if (state.gpu.done()) {
    state.kernel_done = true;
    info.kernel_done = true;
    std::cout << COLOR_EXIT
              << "[DONE] Kernel finished after " << state.cycle << " cycles"
              << COLOR_RESET << std::endl;
  }
  return info;
}

} // namespace

DebuggerState::DebuggerState(Gpu& g, MemoryPort& p, MemoryPort& d)
  : gpu(g), prog_mem(p), data_mem(d) {
  reset();
}

void DebuggerState::reset() {
  kernel_done = false;
  user_quit = false;
  cycle = 0;
  trace_enabled = false;
  breakpoints.clear();
  break_inst.assign(gpu.num_cores(), std::numeric_limits<uint64_t>::max());
  faults_seen = gpu.fault_count();
}

void auto_run(DebuggerState& state, int max_cycles) {
  for (int i = 0; i < max_cycles; ++i) {
    CycleInfo info = execute_cycle(state, false);
    if (!info.executed || info.kernel_done) {
      break;
    }
  }
}

namespace {

// Reads an address/count operand; prints why and returns false when it is missing or bad.
static bool operand(std::istringstream& args, uint32_t* value, const char* what, const char* usage) {
  std::string token;
  if (!(args >> token)) {
    std::cout << "Usage: " << usage << std::endl;
    return false;
  }
  if (!parse_u32(token, value)) {
    std::cout << COLOR_ERR << "Invalid " << what << COLOR_RESET << std::endl;
    return false;
  }
  return true;
}

static void cmd_step(DebuggerState& state, std::istringstream& args) {
  uint32_t count = 1;
  std::string token;
  if ((args >> token) && (!parse_u32(token, &count) || count == 0)) {
    std::cout << COLOR_ERR << "Invalid step count" << COLOR_RESET << std::endl;
    return;
  }
  while (count--) {
    const CycleInfo info = execute_cycle(state, false);
    if (!info.executed) {
      std::cout << "Kernel already done." << std::endl;
      return;
    }
    print_cycle_trace(state);
    if (info.kernel_done) return;
  }
}

static void cmd_cont(DebuggerState& state) {
  for (;;) {
    const CycleInfo info = execute_cycle(state, true);
    if (info.user_breakpoint_hit) {
      std::cout << COLOR_BP << "[BP][C" << info.core << "] pc=0x" << hex(info.pc, 2)
                << " " << opcode_name(info.instruction >> 12)
                << " (0x" << hex(info.instruction, 4) << ")" << COLOR_RESET << std::endl;
      print_core(state.gpu.core(static_cast<unsigned>(info.core)));
      return;
    }
    if (!info.executed || info.kernel_done) return;
    if (state.trace_enabled) print_cycle_trace(state);
  }
}

static void cmd_break(DebuggerState& state, std::istringstream& args, bool add) {
  std::vector<uint32_t>& bps = state.breakpoints;
  std::string token;
  if (!(args >> token)) {
    if (!add) {
      std::cout << "Usage: delete <pc>" << std::endl;
      return;
    }
    std::cout << (bps.empty() ? "No breakpoints set" : "Breakpoints:") << std::endl;
    for (uint32_t pc : bps) std::cout << "  0x" << hex(pc, 2) << std::endl;
    return;
  }
  uint32_t pc = 0;
  if (!parse_u32(token, &pc)) {
    std::cout << COLOR_ERR << "Invalid address" << COLOR_RESET << std::endl;
    return;
  }
  auto it = std::find(bps.begin(), bps.end(), pc);
  const bool present = (it != bps.end());
  if (add && !present) bps.push_back(pc);
  if (!add && present) bps.erase(it);
  if (add) {
    std::cout << "Breakpoint at 0x" << hex(pc, 2) << (present ? " already set" : " set") << std::endl;
  } else {
    std::cout << (present ? "Removed" : "No") << " breakpoint at 0x" << hex(pc, 2) << std::endl;
  }
}

static void cmd_regs(DebuggerState& state, std::istringstream& args) {
  std::string token;
  if (!(args >> token)) {
    print_registers(state);
    return;
  }
  const std::size_t colon = token.find(':');
  uint32_t c = 0, t = 0;
  if (!parse_u32(token.substr(0, colon), &c) || c >= state.gpu.num_cores()) {
    std::cout << COLOR_ERR << "Invalid core index" << COLOR_RESET << std::endl;
    return;
  }
  const SimdCore& core = state.gpu.core(c);
  if (colon == std::string::npos) {
    print_core(core);
  } else if (!parse_u32(token.substr(colon + 1), &t) || t >= core.num_lanes()) {
    std::cout << COLOR_ERR << "Invalid lane index" << COLOR_RESET << std::endl;
  } else {
    print_lane(core, t);
  }
}

// mem/prog <addr> [count]
static void cmd_dump(DebuggerState& state, std::istringstream& args, bool program) {
  const char* usage = program ? "prog <addr> [count]" : "mem <addr> [count]";
  uint32_t addr = 0;
  if (!operand(args, &addr, "address", usage)) return;
  uint32_t count = program ? 8 : 16;
  std::string token;
  if ((args >> token) && (!parse_u32(token, &count) || count == 0)) {
    std::cout << COLOR_ERR << "Invalid count" << COLOR_RESET << std::endl;
    return;
  }
  if (program) {
    dump_program(state.prog_mem, addr, count);
  } else {
    dump_data(state.data_mem, addr, count);
  }
}

static void cmd_trace(DebuggerState& state, std::istringstream& args) {
  std::string mode;
  if (!(args >> mode)) {
    state.trace_enabled = !state.trace_enabled;
  } else if (to_lower(mode) == "on" || to_lower(mode) == "off") {
    state.trace_enabled = (to_lower(mode) == "on");
  } else {
    std::cout << "Usage: trace [on|off]" << std::endl;
    return;
  }
  std::cout << "Trace " << (state.trace_enabled ? "on" : "off") << std::endl;
}

static void cmd_help() {
  std::cout << COLOR_HINT << "Commands:" << COLOR_RESET << "\n"
            << "  s|step [N]          advance N cycles (default 1)\n"
            << "  c|cont              run to a breakpoint or kernel done\n"
            << "  br|break [pc]       list breakpoints, or stop when a core is about to execute pc\n"
            << "  del|delete <pc>     remove a breakpoint\n"
            << "  clear               remove all breakpoints\n"
            << "  regs [c[:t]]        lanes of every core, core c, or lane t of core c\n"
            << "  mem <addr> [n]      data memory bytes\n"
            << "  prog <addr> [n]     program memory words\n"
            << "  trace [on|off]      per-cycle core summary during cont\n"
            << "  stats               core and controller counters\n"
            << "  q|quit              leave the debugger\n";
}

} // namespace

bool run_command(DebuggerState& state, const std::string& line) {
  std::istringstream args(line);
  std::string word;
  if (!(args >> word)) return !state.kernel_done;

  const std::string cmd = to_lower(word);
  if (cmd == "s" || cmd == "step")                             cmd_step(state, args);
  else if (cmd == "c" || cmd == "cont" || cmd == "continue")   cmd_cont(state);
  else if (cmd == "br" || cmd == "break")                      cmd_break(state, args, true);
  else if (cmd == "del" || cmd == "delete")                    cmd_break(state, args, false);
  else if (cmd == "clear")                                     { state.breakpoints.clear(); std::cout << "Breakpoints cleared" << std::endl; }
  else if (cmd == "regs")                                      cmd_regs(state, args);
  else if (cmd == "mem" || cmd == "prog")                      cmd_dump(state, args, cmd == "prog");
  else if (cmd == "trace")                                     cmd_trace(state, args);
  else if (cmd == "stats")                                     print_stats(state.gpu);
  else if (cmd == "help")                                      cmd_help();
  else if (cmd == "q" || cmd == "quit")                        state.user_quit = true;
  else std::cout << "Unknown command: " << word << " (try 'help')" << std::endl;

  return !state.user_quit && !state.kernel_done;
}

void run_debugger(DebuggerState& state, std::istream& in) {
  std::cout << "GPU debugger, 'help' lists commands." << std::endl;
  std::string line;
  do {
    std::cout << "sgpu> " << std::flush;
    if (!std::getline(in, line)) {
      state.user_quit = true;
      return;
    }
  } while (run_command(state, line));
}

} // namespace sgpu
