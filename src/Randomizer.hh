#pragma once

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

#include "Checks.hh"
#include "IPSPatch.hh"
#include "Random.hh"
#include "RomMap.hh"

namespace NeutopiaRando {

enum class RandoType {
  LOCAL = 0, // Shuffle chests within each crypt
  GLOBAL, // Gated placement across crypts and the overworld
  NONE, // Verify and patch only
};

const char* name_for_rando_type(RandoType type);
RandoType rando_type_for_name(const std::string& name);

// Crypts whose chests are shuffled by the local randomizer
constexpr uint8_t LOCAL_RANDO_FIRST_AREA = 0x04;
constexpr uint8_t LOCAL_RANDO_LAST_AREA = 0x0B;

struct RandomizerConfig {
  RandoType type = RandoType::LOCAL;
  std::string seed; // Base 36; if empty, a random seed is used
  CheckCatalog checks; // Required for GLOBAL
  std::vector<NamedPatch> patches; // Applied in order
  RomMap map;
  RelocationOptions relocation;
  // If not set, these items stay where they are in the unmodified game
  std::optional<LocationId> book_location;
  std::optional<LocationId> moss_location;
};

struct RandomizedGame {
  std::string seed;
  std::string data;
};

// Verifies the ROM (only the NA release is accepted), applies the patches,
// then randomizes. The same seed, config and input always produce the same
// output.
RandomizedGame randomize(const RandomizerConfig& config, const std::string& data);

// These take an unheadered, already-patched image.
std::string local_rando(RandomGenerator& rand, const std::string& data, const RandomizerConfig& config);
std::string global_rando(RandomGenerator& rand, const std::string& data, const RandomizerConfig& config);

std::string default_output_filename(const std::string& seed);

} // namespace NeutopiaRando
