#include "Random.hh"

#include <ctype.h>

#include "Errors.hh"

using namespace std;

namespace NeutopiaRando {

RandomGenerator::RandomGenerator(uint64_t seed)
    : initial_seed(seed) {}

size_t RandomGenerator::next_index(size_t count) {
  if (count == 0) {
    throw logic_error("cannot choose from an empty set");
  }
  return this->next() % count;
}

static constexpr uint64_t PCG_MULTIPLIER = 6364136223846793005ULL;
static constexpr uint64_t PCG_INCREMENT = 1442695040888963407ULL;

Pcg32Generator::Pcg32Generator(uint64_t seed)
    : RandomGenerator(seed),
      state(0),
      increment(PCG_INCREMENT) {
  this->next();
  this->state += seed;
  this->next();
}

uint32_t Pcg32Generator::next() {
  uint64_t old_state = this->state;
  this->state = old_state * PCG_MULTIPLIER + this->increment;
  uint32_t xorshifted = ((old_state >> 18) ^ old_state) >> 27;
  uint32_t rot = old_state >> 59;
  return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
}

uint64_t parse_base36_seed(const string& s) {
  if (s.empty()) {
    throw invalid_seed(s);
  }
  uint64_t ret = 0;
  for (char ch : s) {
    uint64_t digit;
    if (ch >= '0' && ch <= '9') {
      digit = ch - '0';
    } else if (isalpha(static_cast<unsigned char>(ch)) && (tolower(ch) <= 'z')) {
      digit = tolower(ch) - 'a' + 10;
    } else {
      throw invalid_seed(s);
    }
    if (ret > (UINT64_MAX - digit) / 36) {
      throw invalid_seed(s);
    }
    ret = ret * 36 + digit;
  }
  return ret;
}

string format_base36_seed(uint64_t seed) {
  static const char* digits = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
  if (seed == 0) {
    return "0";
  }
  string ret;
  while (seed) {
    ret.push_back(digits[seed % 36]);
    seed /= 36;
  }
  return string(ret.rbegin(), ret.rend());
}

} // namespace NeutopiaRando
