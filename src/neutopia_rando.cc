#include <stdio.h>
#include <stdlib.h>

#include <phosg/Arguments.hh>
#include <phosg/Filesystem.hh>
#include <phosg/JSON.hh>
#include <phosg/Strings.hh>
#include <string>

#include "Checks.hh"
#include "IPSPatch.hh"
#include "Loggers.hh"
#include "Randomizer.hh"
#include "RomMap.hh"

using namespace std;
using namespace NeutopiaRando;

static void print_usage() {
  phosg::fwrite_fmt(stderr, "\
Usage: neutopia_rando [options]\n\
\n\
Verifies and patches a Neutopia (U) ROM image, then shuffles the contents of\n\
its chests.\n\
\n\
Options:\n\
  --rom=FILE: Read the ROM image from this file. Headered and unheadered\n\
      images are both accepted. Default is \"Neutopia (USA).pce\".\n\
  --out=FILE: Write the randomized image here. Default is\n\
      neutopia-randomizer-SEED.pce.\n\
  --seed=SEED: Use this seed (a base-36 number). If not given, a random seed\n\
      is used; either way, the seed appears in the default output filename.\n\
  --type=TYPE: Randomizer type. Types are:\n\
      local: Shuffle chests within each crypt (default).\n\
      global: Shuffle chests across crypts and the overworld, respecting the\n\
          progression gates in the check catalog.\n\
      none: Only verify and patch.\n\
  --checks=FILE: Load the check catalog (JSON) from this file. Required for\n\
      --type=global. neutopia_checks can generate a gateless catalog.\n\
  --patch-dir=DIR: Apply the standard gameplay patches from DIR/NAME.ips\n\
      before randomizing. If not given, no patches are applied.\n\
  --rom-map=FILE: Load table locations from this JSON file instead of using\n\
      the built-in NA layout. A \"Relocation\" key may also give the\n\
      relocation range and mirrored areas.\n\
  --first-area=N, --last-area=N: Re-serialize room data for this range of\n\
      areas (inclusive, hex). Default is 04-0F.\n\
  --book=AA:RR:I, --moss=AA:RR:I: Place the book of revival or moonbeam moss\n\
      at this location (global only). Default is the vanilla location.\n\
  --log-level=LEVEL: Show log messages at or above this level (debug, info,\n\
      warning, error).\n\
\n");
}

int main(int argc, char** argv) {
  try {
    phosg::Arguments args(&argv[1], argc - 1);
    if (args.get<bool>("help")) {
      print_usage();
      return 0;
    }

    string log_level = args.get<string>("log-level", false);
    if (!log_level.empty()) {
      set_all_log_levels(log_level);
    }

    RandomizerConfig config;
    string type_name = args.get<string>("type", false);
    if (!type_name.empty()) {
      config.type = rando_type_for_name(type_name);
    }
    config.seed = args.get<string>("seed", false);

    string rom_map_filename = args.get<string>("rom-map", false);
    if (!rom_map_filename.empty()) {
      auto json = phosg::JSON::parse(phosg::load_file(rom_map_filename));
      config.map = RomMap::from_json(json);
      const phosg::JSON* relocation_json = nullptr;
      try {
        relocation_json = &json.at("Relocation");
      } catch (const out_of_range&) {
      }
      if (relocation_json) {
        config.relocation = RelocationOptions::from_json(*relocation_json);
      }
    }
    config.relocation.set_range(
        args.get<uint64_t>("first-area", config.relocation.first_area, phosg::Arguments::IntFormat::HEX),
        args.get<uint64_t>("last-area", config.relocation.last_area, phosg::Arguments::IntFormat::HEX));

    string checks_filename = args.get<string>("checks", false);
    if (!checks_filename.empty()) {
      config.checks = load_check_catalog_file(checks_filename);
    } else if (config.type == RandoType::GLOBAL) {
      throw invalid_argument("--checks is required for the global randomizer");
    }

    string book = args.get<string>("book", false);
    if (!book.empty()) {
      config.book_location = LocationId::parse(book);
    }
    string moss = args.get<string>("moss", false);
    if (!moss.empty()) {
      config.moss_location = LocationId::parse(moss);
    }

    string patch_dir = args.get<string>("patch-dir", false);
    if (!patch_dir.empty()) {
      config.patches = load_standard_patches(patch_dir);
    } else {
      rando_log.warning_f("No --patch-dir given; the gameplay patches will not be applied");
    }

    string rom_filename = args.get<string>("rom", false);
    if (rom_filename.empty()) {
      rom_filename = "Neutopia (USA).pce";
    }
    auto result = randomize(config, phosg::load_file(rom_filename));

    string out_filename = args.get<string>("out", false);
    if (out_filename.empty()) {
      out_filename = default_output_filename(result.seed);
    }
    phosg::save_file(out_filename, result.data);
    phosg::fwrite_fmt(stderr, "Seed {} written to {}\n", result.seed, out_filename);
    return 0;

  } catch (const exception& e) {
    phosg::fwrite_fmt(stderr, "Error: {}\n", e.what());
    return 1;
  }
}
