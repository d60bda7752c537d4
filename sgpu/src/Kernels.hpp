// **********************************************************************
// sgpu/src/Kernels.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Built-in demo kernels: a program image, its input data, and the output expected
once it completes.  Used by tb_sgpu when no -prog file is given.
*/
#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Kernel {
  std::string           name;
  std::vector<uint16_t> program;       // loaded at program address 0
  std::vector<uint8_t>  data;          // loaded at data address 0
  unsigned              thread_count = 0;
  uint32_t              out_addr     = 0;
  std::vector<uint8_t>  expected;      // data[out_addr ..] after the kernel
};

// C[i] = A[i] + B[i], 8 elements, A at 0, B at 8, C at 16
Kernel kernel_matadd();

// C = A x B for 2x2 matrices, A at 0, B at 4, C at 8
Kernel kernel_matmul();

// false for an unknown name
bool find_kernel(const std::string& name, Kernel* out);
