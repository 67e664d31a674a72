#pragma once

#include <stddef.h>
#include <stdint.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace NeutopiaRando {

class RandomGenerator {
public:
  virtual ~RandomGenerator() = default;
  virtual uint32_t next() = 0;

  inline uint64_t seed() const {
    return this->initial_seed;
  }

  // Returns a value in [0, count). Throws logic_error if count is zero.
  size_t next_index(size_t count);

protected:
  uint64_t initial_seed;
  explicit RandomGenerator(uint64_t seed);
};

// PCG32 (XSH-RR output on a 64-bit LCG). Every seed produces the same
// sequence on every platform.
class Pcg32Generator : public RandomGenerator {
public:
  explicit Pcg32Generator(uint64_t seed);
  virtual ~Pcg32Generator() = default;

  virtual uint32_t next();

private:
  uint64_t state;
  uint64_t increment;
};

template <typename T>
void shuffle(std::vector<T>& items, RandomGenerator& rand) {
  for (size_t z = 1; z < items.size(); z++) {
    size_t other_z = rand.next() % (z + 1);
    std::swap(items[z], items[other_z]);
  }
}

template <typename T>
const T& choose(const std::vector<T>& items, RandomGenerator& rand) {
  return items.at(rand.next_index(items.size()));
}

// Case-insensitive. Throws invalid_seed if the string is empty, contains a
// non-base-36 character, or doesn't fit in 64 bits.
uint64_t parse_base36_seed(const std::string& s);
// Lowercase, no leading zeroes.
std::string format_base36_seed(uint64_t seed);

} // namespace NeutopiaRando
