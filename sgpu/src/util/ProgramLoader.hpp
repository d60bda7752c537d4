// **********************************************************************
// sgpu/src/util/ProgramLoader.hpp
// **********************************************************************
// sgpu Oct 19 2026
/*
Loads program/data images into a MemoryPort through its untimed write() path.

  *.hex / *.txt : one hex value per line (0x prefix optional), '#' starts a comment
  *.bin         : flat little-endian words of word_bytes each (2 for program, 1 for data)

All loaders return false (and say why on stderr) on a missing or malformed file.
*/
#pragma once

#include "MemoryPort.hpp"

#include <cstdint>
#include <string>

bool load_hex_words(const std::string& path, MemoryPort* mem, uint32_t base, uint32_t* nwords);
bool load_flat_bin(const std::string& path, MemoryPort* mem, uint32_t base, unsigned word_bytes, uint32_t* nwords);

// picks one of the above from the file extension
bool load_image(const std::string& path, MemoryPort* mem, uint32_t base, unsigned word_bytes, uint32_t* nwords);
