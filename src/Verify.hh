#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace NeutopiaRando {

enum class Region {
  NA = 0,
  JP,
  UNKNOWN,
};

const char* name_for_region(Region region);

struct RomInfo {
  bool headered;
  std::string md5_hash; // Of the unheadered image, in lowercase hex
  bool known;
  std::string description;
  Region region;
};

// Identifies a ROM image by its MD5 hash. Unknown images are not an error
// here (known will be false); throws invalid_rom_size if the image is neither
// the headered nor the unheadered size.
RomInfo verify(const std::string& data);

// Returns the unheadered image. Throws unrecognized_rom or
// unsupported_region unless the image is a known NA release.
std::string verify_rom(const std::string& data);

} // namespace NeutopiaRando
