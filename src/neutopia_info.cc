#include <stdio.h>

#include <phosg/Arguments.hh>
#include <phosg/Filesystem.hh>
#include <phosg/JSON.hh>
#include <phosg/Strings.hh>
#include <string>

#include "Loggers.hh"
#include "NeutopiaRom.hh"
#include "RomMap.hh"
#include "Verify.hh"

using namespace std;
using namespace NeutopiaRando;

int main(int argc, char** argv) {
  try {
    phosg::Arguments args(&argv[1], argc - 1);
    if (args.get<bool>("help") || argc <= 1) {
      phosg::fwrite_fmt(stderr, "\
Usage: neutopia_info [options] ROM-FILE\n\
\n\
Identifies a ROM image and optionally describes its level data layout.\n\
\n\
Options:\n\
  --layout: Print the byte ranges claimed by each area's room data, and each\n\
      area's chest table.\n\
  --rooms: With --layout, also print every room's tables.\n\
  --rom-map=FILE: Load table locations from this JSON file instead of using\n\
      the built-in NA layout.\n\
  --dump-rom-map: Print the table locations in use as JSON, in the format\n\
      --rom-map accepts.\n\
  --log-level=LEVEL: Show log messages at or above this level.\n\
\n");
      return 0;
    }

    string log_level = args.get<string>("log-level", false);
    if (!log_level.empty()) {
      set_all_log_levels(log_level);
    }

    string data = phosg::load_file(args.get<string>(0, true));
    auto info = verify(data);
    phosg::fwrite_fmt(stdout, "Headered:    {}\n", info.headered ? "yes" : "no");
    phosg::fwrite_fmt(stdout, "MD5:         {}\n", info.md5_hash);
    phosg::fwrite_fmt(stdout, "Known:       {}\n", info.known ? "yes" : "no");
    phosg::fwrite_fmt(stdout, "Description: {}\n", info.description);
    phosg::fwrite_fmt(stdout, "Region:      {}\n", name_for_region(info.region));

    RomMap map;
    string rom_map_filename = args.get<string>("rom-map", false);
    if (!rom_map_filename.empty()) {
      map = RomMap::from_json(phosg::JSON::parse(phosg::load_file(rom_map_filename)));
    }
    if (args.get<bool>("dump-rom-map")) {
      phosg::fwrite_fmt(stdout, "\n{}\n", map.json().serialize(phosg::JSON::SerializeOption::FORMAT));
    }

    if (args.get<bool>("layout")) {
      if (info.headered) {
        data = data.substr(ROM_HEADER_SIZE);
      }
      NeutopiaRom rom(data, map);
      fputc('\n', stdout);
      rom.print(stdout, args.get<bool>("rooms"));
    }
    return 0;

  } catch (const exception& e) {
    phosg::fwrite_fmt(stderr, "Error: {}\n", e.what());
    return 1;
  }
}
