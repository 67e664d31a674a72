#include "Verify.hh"

#include <phosg/Hash.hh>
#include <phosg/Strings.hh>
#include <unordered_map>

#include "Errors.hh"
#include "RomMap.hh"

using namespace std;

namespace NeutopiaRando {

struct KnownRom {
  const char* description;
  Region region;
};

static const unordered_map<string, KnownRom> known_roms({
    {"eb0789088fc70be42b2f994c1b66be21", {"Neutopia (U)", Region::NA}},
    {"08ae173878d8a3783fa35e80c99a5dc4", {"Neutopia (J)", Region::JP}},
});

const char* name_for_region(Region region) {
  switch (region) {
    case Region::NA:
      return "NA";
    case Region::JP:
      return "JP";
    default:
      return "Unknown";
  }
}

RomInfo verify(const string& data) {
  RomInfo ret;
  if (data.size() == ROM_SIZE) {
    ret.headered = false;
  } else if (data.size() == ROM_SIZE + ROM_HEADER_SIZE) {
    ret.headered = true;
  } else {
    throw invalid_rom_size(data.size());
  }

  size_t header_size = ret.headered ? ROM_HEADER_SIZE : 0;
  ret.md5_hash = phosg::MD5(data.data() + header_size, data.size() - header_size).hex();

  try {
    const auto& known = known_roms.at(ret.md5_hash);
    ret.known = true;
    ret.description = known.description;
    ret.region = known.region;
  } catch (const out_of_range&) {
    ret.known = false;
    ret.description = "Unrecognized ROM";
    ret.region = Region::UNKNOWN;
  }
  return ret;
}

string verify_rom(const string& data) {
  auto info = verify(data);
  if (!info.known) {
    throw unrecognized_rom(info.md5_hash);
  }
  if (info.region != Region::NA) {
    throw unsupported_region(name_for_region(info.region));
  }
  return info.headered ? data.substr(ROM_HEADER_SIZE) : data;
}

} // namespace NeutopiaRando
