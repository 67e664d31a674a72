#include <stdio.h>

#include <phosg/Arguments.hh>
#include <phosg/Filesystem.hh>
#include <phosg/JSON.hh>
#include <phosg/Strings.hh>
#include <string>

#include "Checks.hh"
#include "Loggers.hh"
#include "Neutopia.hh"
#include "RomMap.hh"
#include "Verify.hh"

using namespace std;
using namespace NeutopiaRando;

int main(int argc, char** argv) {
  try {
    phosg::Arguments args(&argv[1], argc - 1);
    if (args.get<bool>("help") || argc <= 1) {
      phosg::fwrite_fmt(stderr, "\
Usage: neutopia_checks [options] ROM-FILE [OUTPUT-FILE]\n\
\n\
Writes a check catalog with one gateless check for each chest that isn't a\n\
medallion, outside the end-game area. Gates must be added by hand before the\n\
catalog is useful to the global randomizer. If OUTPUT-FILE is not given or is\n\
-, the catalog is written to stdout.\n\
\n\
Options:\n\
  --rom-map=FILE: Load table locations from this JSON file instead of using\n\
      the built-in NA layout.\n\
\n");
      return 0;
    }

    RomMap map;
    string rom_map_filename = args.get<string>("rom-map", false);
    if (!rom_map_filename.empty()) {
      map = RomMap::from_json(phosg::JSON::parse(phosg::load_file(rom_map_filename)));
    }

    string data = phosg::load_file(args.get<string>(0, true));
    if (verify(data).headered) {
      data = data.substr(ROM_HEADER_SIZE);
    }
    Neutopia game(data, map);
    auto checks = generate_check_catalog(game);
    string json_data = check_catalog_json(checks).serialize(phosg::JSON::SerializeOption::FORMAT);
    json_data.push_back('\n');

    string out_filename = args.get<string>(1, false);
    if (out_filename.empty() || (out_filename == "-")) {
      phosg::fwritex(stdout, json_data);
    } else {
      phosg::save_file(out_filename, json_data);
      phosg::fwrite_fmt(stderr, "{} checks written to {}\n", checks.size(), out_filename);
    }
    return 0;

  } catch (const exception& e) {
    phosg::fwrite_fmt(stderr, "Error: {}\n", e.what());
    return 1;
  }
}
