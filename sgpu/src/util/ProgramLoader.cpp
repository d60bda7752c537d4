// **********************************************************************
// sgpu/src/util/ProgramLoader.cpp
// **********************************************************************
// sgpu Oct 19 2026

#include "util/ProgramLoader.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

static std::string strip(const std::string& line) {
  std::string s = line.substr(0, line.find('#'));
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool load_hex_words(const std::string& path, MemoryPort* mem, uint32_t base, uint32_t* nwords) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "load_hex_words: cannot open " << path << std::endl;
    return false;
  }
  uint32_t addr = base;
  uint32_t count = 0;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const std::string text = strip(line);
    if (text.empty()) continue;
    unsigned long value = 0;
    try {
      size_t idx = 0;
      value = std::stoul(text, &idx, 16); // accepts an optional 0x prefix
      if (idx != text.size() || value > std::numeric_limits<uint32_t>::max()) {
        std::cerr << path << ":" << lineno << ": malformed hex value '" << text << "'" << std::endl;
        return false;
      }
    } catch (const std::exception&) {
      std::cerr << path << ":" << lineno << ": malformed hex value '" << text << "'" << std::endl;
      return false;
    }
    mem->write(addr++, static_cast<uint32_t>(value));
    ++count;
  }
  if (nwords) *nwords = count;
  return true;
}

bool load_flat_bin(const std::string& path, MemoryPort* mem, uint32_t base, unsigned word_bytes, uint32_t* nwords) {
  if (word_bytes == 0 || word_bytes > 4) {
    std::cerr << "load_flat_bin: word size must be 1..4 bytes" << std::endl;
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "load_flat_bin: cannot open " << path << std::endl;
    return false;
  }
  std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (bytes.size() % word_bytes != 0) {
    std::cerr << "load_flat_bin: " << path << " is " << bytes.size()
              << " bytes, not a multiple of " << word_bytes << std::endl;
    return false;
  }
  uint32_t count = 0;
  for (size_t i = 0; i < bytes.size(); i += word_bytes) {
    uint32_t value = 0;
    for (unsigned b = 0; b < word_bytes; ++b) {
      value |= static_cast<uint32_t>(bytes[i + b]) << (8u * b); // little-endian
    }
    mem->write(base + count, value);
    ++count;
  }
  if (nwords) *nwords = count;
  return true;
}

bool load_image(const std::string& path, MemoryPort* mem, uint32_t base, unsigned word_bytes, uint32_t* nwords) {
  const size_t dot = path.rfind('.');
  const std::string ext = dot == std::string::npos ? std::string() : path.substr(dot);
  if (ext == ".bin") {
    return load_flat_bin(path, mem, base, word_bytes, nwords);
  }
  return load_hex_words(path, mem, base, nwords);
}
