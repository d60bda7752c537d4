// **********************************************************************
// score/src/tb_score.cpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Testbench for the SIMD core and its memory plumbing: decoder, ALU, register file,
round-robin controller, and one core running small programs against SimMemory.
Pick what to run with -suite=<name> (default: all).  Every check is an
assert_always, so a failing suite aborts with its message.
*/

#include <descore/Parameter.hpp>
#include "Alu.hpp"
#include "Instruction.hpp"
#include "MemCtrl.hpp"
#include "RegisterFile.hpp"
#include "SimMemory.hpp"
#include "SimdCore.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// **************
// Parameters (CLI flags): name, default value, help text
// **************
StringParameter(suite, "all", "Suite: decode|decode_sweep|alu|alu_sweep|regfile|arbiter_rr|arbiter_ro|"
                              "arbiter_multi|arbiter_rw|arbiter_random|core_const|core_wrap|core_div0|core_branch|core_identity|core_inactive|"
                              "core_invalid|core_diverge|core_ldst|all");
IntParameter(mem_latency, 1, "Data memory latency (cycles) for the core_* suites");
IntParameter(rng_seed, 42, "Random seed for arbiter_random");
IntParameter(rounds, 500, "Cycles per controller in arbiter_random");
BoolParameter(showcontexts, false, "List component instance names (contexts) and exit");

using Op = Instruction::Opcode;

namespace {

// One core with its own program and data buses: 4 lanes, 8b PC, one channel each side.
struct CoreRig {
  SimdCore  core;
  MemCtrl   pctrl;
  MemCtrl   dctrl;
  SimMemory pmem;
  SimMemory dmem;
  int       cycle = 0;

  CoreRig()
    : core("core0", 0, 4, 8),
      pctrl("pctrl", 1, 1, /*write_enable*/ false),
      dctrl("dctrl", 4, 1, /*write_enable*/ true),
      pmem(8, 16, 1),
      dmem(8, 8, 1) {
    pctrl.attach_memory(&pmem);
    dctrl.attach_memory(&dmem);
    core.attach_program_port(&pctrl.port(0));
    for (unsigned t = 0; t < 4; ++t) core.attach_data_port(t, &dctrl.port(t));
  }

  // fresh block: program loaded at 0, data memory cleared
  void launch(const std::vector<uint16_t>& prog, uint8_t block_id, uint8_t thread_count) {
    core.reset(); pctrl.reset(); dctrl.reset();
    pmem.clear(); pmem.reset();
    dmem.clear(); dmem.reset();
    dmem.set_latency(static_cast<unsigned>((int)mem_latency));
    for (size_t i = 0; i < prog.size(); ++i) pmem.write(static_cast<uint32_t>(i), prog[i]);
    cycle = 0;
    core.start(block_id, thread_count);
  }

  void step() {
    core.cycle();
    pctrl.cycle();
    dctrl.cycle();
    pmem.cycle();
    dmem.cycle();
    ++cycle;
  }

  void run(int max_cycles, const char* what) {
    while (!core.done() && cycle < max_cycles) step();
    assert_always(core.done(), what);
  }
};

// -------------------- leaf units --------------------

void suite_decode() {
  const Instruction add(0x3123);
  assert_always(add.category == Instruction::Category::ALU && add.op() == Op::ADD, "decode: ADD category");
  assert_always(add.rd == 1 && add.rs == 2 && add.rt == 3, "decode: ADD fields");

  const Instruction br(0x140C);
  assert_always(br.category == Instruction::Category::BRANCH, "decode: BRNZP category");
  assert_always(br.cond == Instruction::NZP_N && br.imm8 == 0x0C, "decode: BRNZP cond/imm");

  const Instruction cst(0x9A7F);
  assert_always(cst.category == Instruction::Category::CONST && cst.rd == 0xA && cst.imm8 == 0x7F, "decode: CONST");

  const Instruction cmp(0x2045);
  assert_always(cmp.category == Instruction::Category::CMP && cmp.rs == 4 && cmp.rt == 5, "decode: CMP");

  const Instruction ldr(0x7230);
  assert_always(ldr.category == Instruction::Category::LOAD && ldr.rd == 2 && ldr.rs == 3 && ldr.is_mem(), "decode: LDR");

  const Instruction str(0x8045);
  assert_always(str.category == Instruction::Category::STORE && str.rs == 4 && str.rt == 5 && str.is_mem(), "decode: STR");

  assert_always(Instruction(0xF000).category == Instruction::Category::HALT, "decode: HALT");
  assert_always(Instruction(0x0000).category == Instruction::Category::NOP, "decode: NOP");

  for (uint32_t opc = 0xA; opc <= 0xE; ++opc) {
    const Instruction bad(static_cast<uint16_t>((opc << 12) | 0x0123u));
    assert_always(!bad.valid() && bad.category == Instruction::Category::Unknown, "decode: reserved opcode not flagged");
    assert_always(bad.opcode == opc, "decode: reserved opcode not kept");
    assert_always(bad.rd == 0 && bad.rs == 0 && bad.rt == 0 && bad.imm8 == 0 && bad.cond == 0,
                  "decode: reserved opcode fields not cleared");
  }

  assert_always(Instruction::rrr(Op::SUB, 1, 2, 3) == 0x4123, "encode: SUB");
  assert_always(Instruction::brnzp(Instruction::NZP_N, 12) == 0x140C, "encode: BRNZP");
  assert_always(Instruction::constant(5, 0xFF) == 0x95FF, "encode: CONST");
  assert_always(Instruction::str(7, 6) == 0x8076, "encode: STR");
}

// every 16b word against the field table: [15:12] op, [11:8] Rd/cond, [7:4] Rs, [3:0] Rt, [7:0] IMM8
void suite_decode_sweep() {
  using Cat = Instruction::Category;
  for (uint32_t w = 0; w <= 0xFFFFu; ++w) {
    const uint32_t op = w >> 12;
    const uint32_t hi = (w >> 8) & 0xF, mid = (w >> 4) & 0xF, lo = w & 0xF, imm = w & 0xFF;
    uint32_t rd = 0, rs = 0, rt = 0, imm8 = 0, cond = 0;
    Cat cat = Cat::Unknown;
    switch (op) {
      case 0x0: cat = Cat::NOP; break;
      case 0x1: cat = Cat::BRANCH; cond = hi; imm8 = imm; break;
      case 0x2: cat = Cat::CMP; rs = mid; rt = lo; break;
      case 0x3: case 0x4: case 0x5: case 0x6:
                cat = Cat::ALU; rd = hi; rs = mid; rt = lo; break;
      case 0x7: cat = Cat::LOAD; rd = hi; rs = mid; break;
      case 0x8: cat = Cat::STORE; rs = mid; rt = lo; break;
      case 0x9: cat = Cat::CONST; rd = hi; imm8 = imm; break;
      case 0xF: cat = Cat::HALT; break;
      default:  break;
    }
    const Instruction d(static_cast<uint16_t>(w));
    const bool ok = d.raw == w && d.opcode == op && d.category == cat && d.rd == rd && d.rs == rs &&
                    d.rt == rt && d.imm8 == imm8 && d.cond == cond;
    if (!ok) std::cout << "decode_sweep: mismatch at 0x" << std::hex << w << std::dec << std::endl;
    assert_always(ok, "decode_sweep: decoded fields differ from the field table");
    assert_always(d.valid() == (cat != Cat::Unknown), "decode_sweep: valid() disagrees with category");
  }
}

void suite_alu() {
  const uint32_t ADD = static_cast<uint32_t>(Op::ADD);
  const uint32_t SUB = static_cast<uint32_t>(Op::SUB);
  const uint32_t MUL = static_cast<uint32_t>(Op::MUL);
  const uint32_t DIV = static_cast<uint32_t>(Op::DIV);
  const uint32_t CMP = static_cast<uint32_t>(Op::CMP);

  assert_always(alu_execute(ADD, 250, 10).result == 4, "alu: ADD must wrap");
  assert_always(alu_execute(SUB, 3, 5).result == 254, "alu: SUB must wrap");
  assert_always(alu_execute(MUL, 16, 17).result == 16, "alu: MUL keeps low 8b");
  assert_always(alu_execute(DIV, 7, 2).result == 3, "alu: DIV");
  assert_always(alu_execute(DIV, 200, 3).result == 66, "alu: DIV is unsigned");
  assert_always(alu_execute(DIV, 9, 0).result == 0, "alu: DIV by zero yields 0");

  assert_always(alu_execute(CMP, 5, 3).nzp == Instruction::NZP_P, "alu: CMP 5,3 -> P");
  assert_always(alu_execute(CMP, 3, 5).nzp == Instruction::NZP_N, "alu: CMP 3,5 -> N");
  assert_always(alu_execute(CMP, 4, 4).nzp == Instruction::NZP_Z, "alu: CMP 4,4 -> Z");
  assert_always(alu_execute(CMP, 0xFF, 1).nzp == Instruction::NZP_N, "alu: CMP is signed");
  assert_always(alu_execute(ADD, 1, 1).nzp == 0, "alu: arithmetic leaves flags alone");

  const AluResult bad = alu_execute(0xA, 1, 2);
  assert_always(bad.result == 0 && bad.nzp == 0, "alu: reserved opcode yields 0");
}

// all 256x256 operand pairs for CMP, ADD, SUB, MUL, DIV and one opcode the ALU does not know
void suite_alu_sweep() {
  const uint32_t ops[] = {0x2, 0x3, 0x4, 0x5, 0x6, 0xF};
  for (uint32_t op : ops) {
    for (int a = 0; a < 256; ++a) {
      for (int b = 0; b < 256; ++b) {
        int result = 0;
        uint8_t nzp = 0;
        switch (op) {
          case 0x3: result = (a + b) & 0xFF; break;
          case 0x4: result = (a - b) & 0xFF; break;
          case 0x5: result = (a * b) & 0xFF; break;
          case 0x6: result = b ? (a / b) & 0xFF : 0; break;
          case 0x2: {
            const int sa = a < 128 ? a : a - 256;
            const int sb = b < 128 ? b : b - 256;
            nzp = sa < sb ? Instruction::NZP_N : (sa == sb ? Instruction::NZP_Z : Instruction::NZP_P);
            break;
          }
          default: break;
        }
        const AluResult got = alu_execute(op, static_cast<uint8_t>(a), static_cast<uint8_t>(b));
        const bool ok = got.result == result && got.nzp == nzp;
        if (!ok) std::cout << "alu_sweep: op=" << op << " a=" << a << " b=" << b
                           << " got " << unsigned(got.result) << "/" << unsigned(got.nzp)
                           << " want " << result << "/" << unsigned(nzp) << std::endl;
        assert_always(ok, "alu_sweep: result or flags wrong");
      }
    }
  }
}

void suite_regfile() {
  RegisterFile rf;
  rf.reset(7, 4, 2);
  assert_always(rf.read(RegisterFile::REG_BLOCK_ID) == 7, "regfile: R13 block_id");
  assert_always(rf.read(RegisterFile::REG_BLOCK_DIM) == 4, "regfile: R14 block dim");
  assert_always(rf.read(RegisterFile::REG_THREAD_ID) == 2, "regfile: R15 thread index");
  for (uint32_t r = 0; r < RegisterFile::FIRST_READ_ONLY; ++r) {
    assert_always(rf.read(r) == 0, "regfile: GPRs cleared");
  }
  assert_always(!rf.write(13, 99) && rf.read(13) == 7, "regfile: R13 write must be dropped");
  assert_always(!rf.write(15, 99) && rf.read(15) == 2, "regfile: R15 write must be dropped");
  assert_always(rf.write(12, 9) && rf.read(12) == 9, "regfile: R12 writable");
  assert_always(rf.read(16) == 0, "regfile: out of range reads 0");
}

// -------------------- memory controller --------------------

// 4 requesters re-issue as soon as they consume; completions must rotate 0,1,2,3,0,...
void suite_arbiter_rr(MemCtrl& ctrl, SimMemory& mem) {
  ctrl.reset(); mem.reset(); mem.set_latency(0);
  for (uint32_t j = 0; j < 4; ++j) mem.write(j, 0x40 + j);

  std::vector<unsigned> order;
  for (int cyc = 0; cyc < 64 && order.size() < 16; ++cyc) {
    for (unsigned j = 0; j < 4; ++j) {
      MemClientPort& p = ctrl.port(j);
      if (p.resp_valid()) {
        assert_always(p.resp().rdata == 0x40 + j, "arbiter_rr: response delivered to wrong consumer");
        p.resp_consume();
        order.push_back(j);
      }
      if (p.can_request()) {
        MemReq r{}; r.addr = j; r.write = false;
        p.request(r);
      }
    }
    ctrl.cycle();
    mem.cycle();
  }
  assert_always(order.size() == 16, "arbiter_rr: too few completions");
  for (size_t k = 0; k < order.size(); ++k) {
    assert_always(order[k] == k % 4, "arbiter_rr: completions not round-robin");
  }
  for (unsigned j = 1; j < 4; ++j) {
    const uint64_t a = ctrl.served(0), b = ctrl.served(j);
    assert_always((a > b ? a - b : b - a) <= 1, "arbiter_rr: unfair service counts");
  }
}

// program bus: a write must never reach memory, reads keep flowing
void suite_arbiter_ro(MemCtrl& ctrl, SimMemory& mem) {
  ctrl.reset(); mem.reset(); mem.clear(); mem.set_latency(0);
  mem.write(0x10, 0x1234);

  MemReq w{}; w.addr = 0x10; w.write = true; w.wdata = 0xBEEF;
  ctrl.port(0).request(w);
  int reads = 0;
  for (int cyc = 0; cyc < 20; ++cyc) {
    MemClientPort& p = ctrl.port(1);
    if (p.resp_valid()) {
      assert_always(p.resp().rdata == 0x1234, "arbiter_ro: bad read data");
      p.resp_consume();
      ++reads;
    }
    if (p.can_request()) {
      MemReq r{}; r.addr = 0x10; r.write = false;
      p.request(r);
    }
    ctrl.cycle();
    mem.cycle();
  }
  assert_always(reads >= 5, "arbiter_ro: reader starved");
  assert_always(!ctrl.port(0).resp_valid(), "arbiter_ro: write was answered");
  assert_always(mem.channel_writes() == 0, "arbiter_ro: write forwarded to memory");
  assert_always(mem.read(0x10) == 0x1234, "arbiter_ro: memory modified");
  assert_always(ctrl.refused_writes() == 1, "arbiter_ro: refused write counted once");
  assert_always(ctrl.served(0) == 0, "arbiter_ro: writer served");
}

// 4 requesters, 2 channels, slow memory: no requester may hold both channels
void suite_arbiter_multi(MemCtrl& ctrl, SimMemory& mem) {
  ctrl.reset(); mem.reset(); mem.set_latency(2);
  for (uint32_t j = 0; j < 4; ++j) mem.write(j, 0x10 + j);

  std::vector<int> done(4, 0);
  for (int cyc = 0; cyc < 200; ++cyc) {
    for (unsigned j = 0; j < 4; ++j) {
      MemClientPort& p = ctrl.port(j);
      if (p.resp_valid()) {
        assert_always(p.resp().rdata == 0x10 + j, "arbiter_multi: response delivered to wrong consumer");
        p.resp_consume();
        ++done[j];
      }
      if (p.can_request() && done[j] < 5) {
        MemReq r{}; r.addr = j; r.write = false;
        p.request(r);
      }
    }
    ctrl.cycle();
    const int a = ctrl.channel_consumer(0);
    const int b = ctrl.channel_consumer(1);
    assert_always(a < 0 || a != b, "arbiter_multi: consumer bound to two channels");
    mem.cycle();
  }
  for (unsigned j = 0; j < 4; ++j) {
    assert_always(done[j] == 5, "arbiter_multi: consumer not fully served");
  }
  assert_always(ctrl.idle(), "arbiter_multi: channel left bound");
  assert_always(mem.channel_reads() == 20, "arbiter_multi: request serviced twice");
}

// consumer 0 reads while consumer 1 writes: both bind in the same round, one per channel
void suite_arbiter_rw(MemCtrl& ctrl, SimMemory& mem) {
  ctrl.reset(); mem.reset(); mem.clear(); mem.set_latency(2);
  mem.write(0x05, 0x77);

  MemReq r{}; r.addr = 0x05; r.write = false;
  MemReq w{}; w.addr = 0x09; w.write = true; w.wdata = 0x3C;
  ctrl.port(0).request(r);
  ctrl.port(1).request(w);

  ctrl.cycle();
  assert_always(ctrl.channel_consumer(0) == 0, "arbiter_rw: read not bound to ch0");
  assert_always(ctrl.channel_consumer(1) == 1, "arbiter_rw: write not bound to ch1");
  assert_always(ctrl.grants() == 2, "arbiter_rw: read and write not granted together");

  bool got_read = false, got_write = false;
  for (int cyc = 0; cyc < 10 && !(got_read && got_write); ++cyc) {
    mem.cycle();
    ctrl.cycle();
    if (!got_read && ctrl.port(0).resp_valid()) {
      assert_always(!ctrl.port(0).resp().write && ctrl.port(0).resp().rdata == 0x77, "arbiter_rw: read data");
      ctrl.port(0).resp_consume();
      got_read = true;
    }
    if (!got_write && ctrl.port(1).resp_valid()) {
      assert_always(ctrl.port(1).resp().write, "arbiter_rw: write ack");
      ctrl.port(1).resp_consume();
      got_write = true;
      assert_always(got_read, "arbiter_rw: write finished before the read it started with");
    }
  }
  assert_always(got_read && got_write, "arbiter_rw: transaction lost");
  assert_always(mem.read(0x09) == 0x3C, "arbiter_rw: write not performed");
  assert_always(mem.channel_reads() == 1 && mem.channel_writes() == 1, "arbiter_rw: memory access count");
}

// Random traffic: each consumer drops a request in with p=1/2 per cycle (read or write
// with p=1/2) and the memory latency is redrawn from 1..5 for every request.  Consumer j
// only touches its own 32-word slice, so a per-consumer shadow predicts every read.
// On a read-only bus a write is never answered; the consumer withdraws it after a few
// cycles, as a requester that gave up would.
void run_random_traffic(MemCtrl& ctrl, SimMemory& mem, std::mt19937& rng, const char* tag) {
  ctrl.reset(); mem.reset(); mem.clear();
  const unsigned n = ctrl.num_consumers();
  const unsigned nch = ctrl.num_channels();
  const uint32_t slice = 256 / n;
  std::vector<uint32_t> shadow(256, 0);
  std::vector<uint64_t> issued(n, 0), answered(n, 0), withdrawn(n, 0);
  std::vector<int> write_age(n, 0);
  std::uniform_int_distribution<int> coin(0, 1), lat(1, 5), val(0, 255);
  std::uniform_int_distribution<uint32_t> offset(0, slice - 1);

  for (int cyc = 0; cyc < (int)rounds; ++cyc) {
    for (unsigned j = 0; j < n; ++j) {
      MemClientPort& p = ctrl.port(j);
      if (p.resp_valid()) {
        const MemReq& q = p.req();
        if (q.write) {
          assert_always(ctrl.write_enable(), "arbiter_random: read-only bus acknowledged a write");
          assert_always(p.resp().write, "arbiter_random: write answered as a read");
          shadow[q.addr] = q.wdata;
        } else {
          assert_always(!p.resp().write && p.resp().rdata == shadow[q.addr], "arbiter_random: stale or misrouted read");
        }
        p.resp_consume();
        ++answered[j];
      } else if (p.valid() && p.req().write && !ctrl.write_enable() && ++write_age[j] > 4) {
        p.reset();
        ++withdrawn[j];
      }
      if (p.can_request() && coin(rng)) {
        MemReq r{};
        r.addr  = j * slice + offset(rng);
        r.write = coin(rng) == 1;
        r.wdata = static_cast<uint32_t>(val(rng));
        p.request(r);
        write_age[j] = 0;
        ++issued[j];
      }
    }
    mem.set_latency(static_cast<unsigned>(lat(rng)));
    ctrl.cycle();
    for (unsigned a = 0; a < nch; ++a) {
      for (unsigned b = a + 1; b < nch; ++b) {
        const int ca = ctrl.channel_consumer(a);
        assert_always(ca < 0 || ca != ctrl.channel_consumer(b), "arbiter_random: consumer bound to two channels");
      }
    }
    mem.cycle();
  }

  // drain: stop issuing and let every forwarded request come back
  for (int cyc = 0; cyc < 1000 && !ctrl.idle(); ++cyc) {
    ctrl.cycle();
    mem.cycle();
  }
  assert_always(ctrl.idle(), "arbiter_random: channel stuck");

  uint64_t lo = ~0ull, hi = 0;
  for (unsigned j = 0; j < n; ++j) {
    assert_always(ctrl.served(j) >= answered[j], "arbiter_random: answer without service");
    assert_always(issued[j] - answered[j] - withdrawn[j] <= 1, "arbiter_random: request lost");
    lo = std::min(lo, ctrl.served(j));
    hi = std::max(hi, ctrl.served(j));
  }
  assert_always(lo > 0, "arbiter_random: a consumer was never served");
  if (!ctrl.write_enable()) {
    assert_always(mem.channel_writes() == 0, "arbiter_random: write reached read-only memory");
    assert_always(ctrl.refused_writes() > 0, "arbiter_random: no write was refused");
  }
  std::cout << tag << ": grants=" << ctrl.grants() << " served min=" << lo << " max=" << hi
            << " refused=" << ctrl.refused_writes() << std::endl;
}

void suite_arbiter_random(MemCtrl& data_ctrl, SimMemory& data_mem, MemCtrl& prog_ctrl, SimMemory& prog_mem) {
  std::mt19937 rng(static_cast<unsigned>((int)rng_seed));
  run_random_traffic(data_ctrl, data_mem, rng, "arbiter_random(rw)");
  run_random_traffic(prog_ctrl, prog_mem, rng, "arbiter_random(ro)");
}

// -------------------- one core --------------------

void suite_core_const(CoreRig& rig) {
  rig.launch({Instruction::constant(0, 5), Instruction::halt()}, 0, 1);
  while (!(rig.core.state() == SimdCore::State::Executing && rig.core.instr() == Instruction::halt())) {
    assert_always(rig.cycle < 50, "core_const: HALT never fetched");
    assert_always(!rig.core.done(), "core_const: done before HALT");
    rig.step();
  }
  assert_always(!rig.core.done(), "core_const: done raised on fetch");
  rig.step();
  assert_always(rig.core.done() && !rig.core.busy(), "core_const: done not raised the cycle after HALT");
  assert_always(rig.core.read_reg(0, 0) == 5, "core_const: R0 != 5");
  assert_always(rig.core.inst_count() == 2, "core_const: instruction count");
  rig.core.release();
  assert_always(!rig.core.done(), "core_const: release did not clear done");
}

void suite_core_wrap(CoreRig& rig) {
  rig.launch({Instruction::constant(1, 250), Instruction::constant(2, 10),
              Instruction::rrr(Op::ADD, 0, 1, 2), Instruction::halt()}, 0, 1);
  rig.run(100, "core_wrap: no halt");
  assert_always(rig.core.read_reg(0, 0) == 4, "core_wrap: 250+10 != 4");
}

void suite_core_div0(CoreRig& rig) {
  rig.launch({Instruction::constant(0, 0x55), Instruction::constant(1, 9), Instruction::constant(2, 0),
              Instruction::rrr(Op::DIV, 0, 1, 2), Instruction::halt()}, 0, 1);
  rig.run(100, "core_div0: no halt");
  assert_always(rig.core.read_reg(0, 0) == 0, "core_div0: 9/0 != 0");
  assert_always(rig.core.fault() == SimdCore::Fault::None, "core_div0: divide by zero faulted");
}

void suite_core_branch(CoreRig& rig) {
  rig.launch({Instruction::constant(1, 5),          // 0
              Instruction::constant(2, 3),          // 1
              Instruction::cmp(1, 2),               // 2  -> P
              Instruction::brnzp(Instruction::NZP_N, 6), // 3  not taken
              Instruction::brnzp(Instruction::NZP_P, 7), // 4  taken
              Instruction::constant(3, 1),          // 5  skipped
              Instruction::constant(4, 1),          // 6  skipped
              Instruction::halt()}, 0, 4);          // 7
  rig.run(200, "core_branch: no halt");
  for (unsigned t = 0; t < 4; ++t) {
    assert_always(rig.core.nzp(t) == Instruction::NZP_P, "core_branch: CMP 5,3 did not set P");
    assert_always(rig.core.read_reg(t, 3) == 0 && rig.core.read_reg(t, 4) == 0, "core_branch: wrong path executed");
  }
  assert_always(rig.core.pc() == 7, "core_branch: halted at wrong pc");
  assert_always(rig.core.branch_count() == 2 && rig.core.branch_taken_count() == 1, "core_branch: branch counters");
}

void suite_core_identity(CoreRig& rig) {
  rig.launch({Instruction::constant(13, 99), Instruction::rrr(Op::ADD, 14, 0, 0),
              Instruction::rrr(Op::ADD, 0, 13, 15), Instruction::halt()}, 5, 3);
  rig.run(100, "core_identity: no halt");
  for (unsigned t = 0; t < 3; ++t) {
    assert_always(rig.core.read_reg(t, 13) == 5, "core_identity: R13 overwritten");
    assert_always(rig.core.read_reg(t, 14) == 3, "core_identity: R14 overwritten");
    assert_always(rig.core.read_reg(t, 15) == t, "core_identity: R15 wrong");
    assert_always(rig.core.read_reg(t, 0) == 5 + t, "core_identity: R0 != block_id + lane");
  }
}

// 2 of 4 lanes active: lanes 2 and 3 must not change and must not touch the data bus
void suite_core_inactive(CoreRig& rig) {
  rig.launch({Instruction::constant(0, 0x20), Instruction::rrr(Op::ADD, 0, 0, 15),
              Instruction::constant(1, 7), Instruction::str(0, 1), Instruction::halt()}, 0, 2);
  rig.run(200, "core_inactive: no halt");
  assert_always(rig.dmem.read(0x20) == 7 && rig.dmem.read(0x21) == 7, "core_inactive: active lane store missing");
  assert_always(rig.dmem.read(0x22) == 0 && rig.dmem.read(0x23) == 0, "core_inactive: inactive lane stored");
  assert_always(rig.dmem.channel_writes() == 2, "core_inactive: write count != active lanes");
  for (unsigned t = 2; t < 4; ++t) {
    assert_always(!rig.core.lane_active(t), "core_inactive: lane marked active");
    assert_always(rig.core.read_reg(t, 0) == 0 && rig.core.read_reg(t, 1) == 0, "core_inactive: inactive lane registers changed");
    assert_always(rig.dctrl.served(t) == 0, "core_inactive: inactive lane used the bus");
  }
  assert_always(rig.core.store_count() == 2, "core_inactive: store count");
}

void suite_core_invalid(CoreRig& rig) {
  rig.launch({Instruction::constant(0, 1), 0xA000, Instruction::constant(0, 2), Instruction::halt()}, 3, 1);
  rig.run(100, "core_invalid: reserved opcode did not halt the core");
  assert_always(rig.core.fault() == SimdCore::Fault::InvalidOpcode, "core_invalid: wrong fault");
  assert_always(rig.core.fault_log().size() == 1, "core_invalid: fault not logged");
  const SimdCore::FaultRecord& f = rig.core.fault_log().front();
  assert_always(f.pc == 1 && f.instr == 0xA000 && f.block_id == 3, "core_invalid: fault record");
  assert_always(rig.core.read_reg(0, 0) == 1, "core_invalid: executed past the fault");
}

void suite_core_diverge(CoreRig& rig) {
  rig.launch({Instruction::constant(1, 1),
              Instruction::cmp(15, 1),                   // lane0 N, lane1 Z, lanes 2-3 P
              Instruction::brnzp(Instruction::NZP_P, 4),
              Instruction::halt(),
              Instruction::halt()}, 0, 4);
  rig.run(100, "core_diverge: no halt");
  assert_always(rig.core.fault() == SimdCore::Fault::BranchDivergence, "core_diverge: divergence not reported");
  assert_always(rig.core.fault_log().back().pc == 2, "core_diverge: fault pc");
}

// LDR/STR barrier with a slow single-channel data bus
void suite_core_ldst(CoreRig& rig) {
  rig.launch({Instruction::constant(0, 0x10), Instruction::rrr(Op::ADD, 0, 0, 15),
              Instruction::ldr(1, 0),
              Instruction::constant(2, 2), Instruction::rrr(Op::MUL, 1, 1, 2),
              Instruction::constant(3, 0x20), Instruction::rrr(Op::ADD, 3, 3, 15),
              Instruction::str(3, 1), Instruction::halt()}, 0, 4);
  for (uint32_t t = 0; t < 4; ++t) rig.dmem.write(0x10 + t, 3 * t + 1);
  rig.run(400, "core_ldst: no halt");
  for (uint32_t t = 0; t < 4; ++t) {
    assert_always(rig.core.read_reg(t, 1) == 2 * (3 * t + 1), "core_ldst: loaded value");
    assert_always(rig.dmem.read(0x20 + t) == 2 * (3 * t + 1), "core_ldst: stored value");
  }
  assert_always(rig.core.load_count() == 4 && rig.core.store_count() == 4, "core_ldst: ld/st counters");
  assert_always(rig.core.mem_stalls() > 0, "core_ldst: barrier never waited");
  assert_always(rig.dctrl.idle(), "core_ldst: data bus left bound");
}

} // namespace

int main(int argc, char *argv[])
{
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  // **************
  // Step 2: Create components (all of them, before Sim::init)
  // **************
  CoreRig rig;
  MemCtrl rr_ctrl("rr_ctrl", 4, 1, true);
  MemCtrl ro_ctrl("ro_ctrl", 2, 1, false);
  MemCtrl mc_ctrl("mc_ctrl", 4, 2, true);
  MemCtrl rw_ctrl("rw_ctrl", 2, 2, true);
  MemCtrl rnd_dctrl("rnd_dctrl", 8, 3, true);
  MemCtrl rnd_pctrl("rnd_pctrl", 8, 3, false);
  SimMemory rr_mem(8, 16, 1), ro_mem(8, 16, 1), mc_mem(8, 16, 2), rw_mem(8, 8, 2);
  SimMemory rnd_dmem(8, 8, 3), rnd_pmem(8, 8, 3);
  rr_ctrl.attach_memory(&rr_mem);
  ro_ctrl.attach_memory(&ro_mem);
  mc_ctrl.attach_memory(&mc_mem);
  rw_ctrl.attach_memory(&rw_mem);
  rnd_dctrl.attach_memory(&rnd_dmem);
  rnd_pctrl.attach_memory(&rnd_pmem);

  if (showcontexts) { Sim::dumpComponentNames(); return 0; }

  // **************
  // Step 3: Hook clock and initialize simulator
  // **************
  Clock clk;
  rig.core.clk << clk; rig.pctrl.clk << clk; rig.dctrl.clk << clk;
  rr_ctrl.clk << clk; ro_ctrl.clk << clk; mc_ctrl.clk << clk;
  rw_ctrl.clk << clk; rnd_dctrl.clk << clk; rnd_pctrl.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  // **************
  // Step 4: Run suites (each steps its parts by hand, in bus order)
  // **************
  const std::string S = std::string(suite);
  const bool all = (S == "all");
  int ran = 0;
  auto want = [&](const char* name) { return all || S == name; };
  auto pass = [&](const char* name) { std::cout << "suite " << name << ": PASS" << std::endl; ++ran; };

  if (want("decode"))        { suite_decode();                       pass("decode"); }
  if (want("decode_sweep"))  { suite_decode_sweep();                 pass("decode_sweep"); }
  if (want("alu"))           { suite_alu();                          pass("alu"); }
  if (want("alu_sweep"))     { suite_alu_sweep();                    pass("alu_sweep"); }
  if (want("regfile"))       { suite_regfile();                      pass("regfile"); }
  if (want("arbiter_rr"))    { suite_arbiter_rr(rr_ctrl, rr_mem);    pass("arbiter_rr"); }
  if (want("arbiter_ro"))    { suite_arbiter_ro(ro_ctrl, ro_mem);    pass("arbiter_ro"); }
  if (want("arbiter_multi")) { suite_arbiter_multi(mc_ctrl, mc_mem); pass("arbiter_multi"); }
  if (want("arbiter_rw"))    { suite_arbiter_rw(rw_ctrl, rw_mem);    pass("arbiter_rw"); }
  if (want("arbiter_random")) {
    suite_arbiter_random(rnd_dctrl, rnd_dmem, rnd_pctrl, rnd_pmem);
    pass("arbiter_random");
  }
  if (want("core_const"))    { suite_core_const(rig);                pass("core_const"); }
  if (want("core_wrap"))     { suite_core_wrap(rig);                 pass("core_wrap"); }
  if (want("core_div0"))     { suite_core_div0(rig);                 pass("core_div0"); }
  if (want("core_branch"))   { suite_core_branch(rig);               pass("core_branch"); }
  if (want("core_identity")) { suite_core_identity(rig);             pass("core_identity"); }
  if (want("core_inactive")) { suite_core_inactive(rig);             pass("core_inactive"); }
  if (want("core_invalid"))  { suite_core_invalid(rig);              pass("core_invalid"); }
  if (want("core_diverge"))  { suite_core_diverge(rig);              pass("core_diverge"); }
  if (want("core_ldst"))     { suite_core_ldst(rig);                 pass("core_ldst"); }

  assert_always(ran > 0, "unknown -suite");
  log("\n");
  return 0;
}
