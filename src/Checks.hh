#pragma once

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <phosg/JSON.hh>
#include <string>
#include <vector>

#include "Neutopia.hh"

namespace NeutopiaRando {

// Progression gates, cleared when the corresponding item is placed anywhere.
enum class Gate {
  RAINBOW_DROP = 0,
  FALCON_SHOES,
  FIRE_WAND,
  BELL,
};

// Names are the catalog's spelling ("rainbow-drop", etc.)
const char* name_for_gate(Gate gate);
Gate gate_for_name(const std::string& name);

struct LocationId {
  uint8_t area;
  uint8_t room;
  uint8_t index;

  bool operator==(const LocationId& other) const;
  bool operator<(const LocationId& other) const;
  std::string str() const;
  // Parses the str() format (AA:RR:I, area and room in hex). Throws
  // invalid_argument if the string isn't in that format.
  static LocationId parse(const std::string& s);
};

struct Check {
  std::string name;
  uint8_t area;
  uint8_t room;
  uint8_t index;
  std::vector<Gate> gates;

  LocationId loc() const;

  static Check from_json(const phosg::JSON& json);
  phosg::JSON json() const;
};

using CheckCatalog = std::map<LocationId, Check>;

// The catalog is a list of check dicts. Throws duplicate_location if two
// checks share a location.
CheckCatalog load_check_catalog(const phosg::JSON& json);
CheckCatalog load_check_catalog_file(const std::string& filename);

// One gateless check per non-medallion chest outside the end-game area.
std::vector<Check> generate_check_catalog(const Neutopia& game);
phosg::JSON check_catalog_json(const std::vector<Check>& checks);

} // namespace NeutopiaRando
