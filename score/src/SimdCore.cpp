// **********************************************************************
// score/src/SimdCore.cpp
// **********************************************************************
// sgpu Oct 19 2026
/*
How the core sequences fetch/decode/execute for its thread block and talks to the
program and data buses.
*/
#include "SimdCore.hpp"
#include "Core_exec.hpp"

#include <cstdint>

using namespace Cascade;

SimdCore::SimdCore(std::string /*name*/, unsigned core_id, unsigned threads_per_block, unsigned pc_bits, IMPL_CTOR)
  : id_(core_id)
{
  assert_always(threads_per_block > 0, "SimdCore: threads_per_block must be > 0");
  assert_always(pc_bits > 0 && pc_bits <= 16, "SimdCore: pc_bits must be 1..16");
  pc_mask_ = (1u << pc_bits) - 1u;
  lanes_.resize(threads_per_block);
}

void SimdCore::attach_data_port(unsigned lane, MemClientPort* port) {
  assert_always(lane < lanes_.size(), "SimdCore: data port lane out of range");
  lanes_[lane].lsu.attach_port(port);
}

// Default update function is unused; the GPU steps cores via cycle()
void SimdCore::update() {}

void SimdCore::reset() {
  fetcher_.reset();
  for (Lane& lane : lanes_) {
    lane.regs.reset(0, 0, 0);
    lane.nzp    = 0;
    lane.active = false;
    lane.lsu.reset();
  }
  state_        = State::Idle;
  done_         = false;
  pc_           = 0;
  instr_        = 0;
  block_id_     = 0;
  thread_count_ = 0;
  fault_        = Fault::None;
  fault_log_.clear();
  inst_count_         = 0;
  load_count_         = 0;
  store_count_        = 0;
  branch_count_       = 0;
  branch_taken_count_ = 0;
  busy_cycles_        = 0;
  fetch_stalls_       = 0;
  mem_stalls_         = 0;
}

void SimdCore::start(uint8_t block_id, uint8_t thread_count) {
  assert_always(state_ == State::Idle && !done_, "SimdCore: start on a busy core");
  assert_always(thread_count <= lanes_.size(), "SimdCore: block larger than the core");
  for (unsigned t = 0; t < lanes_.size(); ++t) {
    Lane& lane = lanes_[t];
    lane.regs.reset(block_id, thread_count, static_cast<uint8_t>(t));
    lane.nzp    = 0;
    lane.active = t < thread_count; // active mask recomputed per block
    lane.lsu.reset();
  }
  fetcher_.reset();
  block_id_     = block_id;
  thread_count_ = thread_count;
  pc_           = 0;
  instr_        = 0;
  fault_        = Fault::None;
  state_        = State::Fetching;
  trace("core%u: start block=%u threads=%u\n", id_, block_id, thread_count);
}

void SimdCore::release() {
  done_ = false;
}

// Core's per-clock sequence
void SimdCore::cycle() {
  if (state_ == State::Idle) return;
  ++busy_cycles_;
  if (state_ == State::Fetching) {
    fetch();
  } else {
    execute();
  }
}

// ******************
// FETCH
// ******************
void SimdCore::fetch() {
  if (fetcher_.state() != FetchUnit::State::Fetching) {
    if (!fetcher_.request(pc_)) { // program port still held
      ++fetch_stalls_;
      return;
    }
  }
  if (!fetcher_.poll()) {
    ++fetch_stalls_;
    return;
  }
  instr_ = fetcher_.instruction();
  trace("core%u: pc=0x%02x instr=0x%04x\n", id_, pc_, instr_);
  state_ = State::Executing;
}

// ******************
// DECODE + EXECUTE
// ******************
void SimdCore::execute() {
  const Instruction decoded(instr_);
  uint32_t next_pc = (pc_ + 1u) & pc_mask_;

  switch (decoded.category) {
    case Instruction::Category::NOP:
      break;
    case Instruction::Category::BRANCH: {
      bool diverged = false;
      const bool taken = exec_brnzp(*this, decoded, &diverged);
      ++branch_count_;
      if (diverged) {
        raise_fault(Fault::BranchDivergence);
        return;
      }
      if (taken) {
        ++branch_taken_count_;
        next_pc = branch_target(decoded.imm8);
      }
      trace("core%u: brnzp cond=0x%x %s\n", id_, decoded.cond, taken ? "taken" : "not taken");
      break;
    }
    case Instruction::Category::CMP:
      exec_cmp(*this, decoded);
      break;
    case Instruction::Category::ALU:
      exec_alu(*this, decoded);
      break;
    case Instruction::Category::CONST:
      exec_const(*this, decoded);
      break;
    case Instruction::Category::LOAD:
      if (!exec_ldr(*this, decoded)) { // barrier: wait for every active lane
        ++mem_stalls_;
        return;
      }
      load_count_ += thread_count_;
      break;
    case Instruction::Category::STORE:
      if (!exec_str(*this, decoded)) {
        ++mem_stalls_;
        return;
      }
      store_count_ += thread_count_;
      break;
    case Instruction::Category::HALT:
      finish();
      return;
    case Instruction::Category::Unknown:
    default:
      raise_fault(Fault::InvalidOpcode); // fail-safe halt, never a silent NOP
      return;
  }

  ++inst_count_;
  pc_    = next_pc;
  state_ = State::Fetching;
}

void SimdCore::finish() {
  ++inst_count_;
  done_  = true;
  state_ = State::Idle;
  trace("core%u: halt block=%u\n", id_, block_id_);
}

void SimdCore::raise_fault(Fault cause) {
  FaultRecord rec;
  rec.block_id = block_id_;
  rec.pc       = pc_;
  rec.instr    = instr_;
  rec.cause    = cause;
  fault_log_.push_back(rec);
  fault_ = cause;
  done_  = true;
  state_ = State::Idle;
  trace("core%u: fault %s block=%u pc=0x%02x instr=0x%04x\n", id_, fault_name(cause), block_id_, pc_, instr_);
}

void SimdCore::write_reg(unsigned lane, uint32_t idx, uint8_t value) {
  if (!lane_active(lane)) return;
  if (lanes_[lane].regs.write(idx, value)) {
    trace("core%u: t%u r%u <= 0x%02x\n", id_, lane, idx, value);
  }
}

void SimdCore::set_nzp(unsigned lane, uint8_t flags) {
  if (!lane_active(lane)) return;
  lanes_[lane].nzp = flags;
}

uint32_t SimdCore::branch_target(uint32_t imm8) const {
  const int32_t target = static_cast<int8_t>(static_cast<uint8_t>(imm8)); // sign-extend
  return static_cast<uint32_t>(target) & pc_mask_;
}

const char* fault_name(SimdCore::Fault cause) {
  switch (cause) {
    case SimdCore::Fault::None:             return "none";
    case SimdCore::Fault::InvalidOpcode:    return "invalid-opcode";
    case SimdCore::Fault::BranchDivergence: return "branch-divergence";
  }
  return "unknown";
}
