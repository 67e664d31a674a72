#include "Checks.hh"

#include <format>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Errors.hh"

using namespace std;

namespace NeutopiaRando {

const char* name_for_gate(Gate gate) {
  switch (gate) {
    case Gate::RAINBOW_DROP:
      return "rainbow-drop";
    case Gate::FALCON_SHOES:
      return "falcon-shoes";
    case Gate::FIRE_WAND:
      return "fire-wand";
    case Gate::BELL:
      return "bell";
    default:
      throw logic_error("invalid gate");
  }
}

Gate gate_for_name(const string& name) {
  if (name == "rainbow-drop") {
    return Gate::RAINBOW_DROP;
  } else if (name == "falcon-shoes") {
    return Gate::FALCON_SHOES;
  } else if (name == "fire-wand") {
    return Gate::FIRE_WAND;
  } else if (name == "bell") {
    return Gate::BELL;
  } else {
    throw invalid_argument(std::format("unknown gate: {}", name));
  }
}

bool LocationId::operator==(const LocationId& other) const {
  return (this->area == other.area) && (this->room == other.room) && (this->index == other.index);
}

bool LocationId::operator<(const LocationId& other) const {
  if (this->area != other.area) {
    return this->area < other.area;
  }
  if (this->room != other.room) {
    return this->room < other.room;
  }
  return this->index < other.index;
}

string LocationId::str() const {
  return std::format("{:02X}:{:02X}:{}", this->area, this->room, this->index);
}

LocationId LocationId::parse(const string& s) {
  auto tokens = phosg::split(s, ':');
  if (tokens.size() != 3) {
    throw invalid_argument(std::format("location \"{}\" is not of the form AA:RR:I", s));
  }
  size_t values[3];
  for (size_t z = 0; z < 3; z++) {
    size_t end_pos = 0;
    try {
      values[z] = stoul(tokens[z], &end_pos, (z < 2) ? 16 : 10);
    } catch (const logic_error&) {
      end_pos = 0;
    }
    if (tokens[z].empty() || (end_pos != tokens[z].size()) || (values[z] > 0xFF)) {
      throw invalid_argument(std::format("location \"{}\" is not of the form AA:RR:I", s));
    }
  }
  return LocationId{static_cast<uint8_t>(values[0]), static_cast<uint8_t>(values[1]), static_cast<uint8_t>(values[2])};
}

LocationId Check::loc() const {
  return LocationId{this->area, this->room, this->index};
}

Check Check::from_json(const phosg::JSON& json) {
  Check ret;
  ret.name = json.get_string("name");
  ret.area = json.get_int("area");
  ret.room = json.get_int("room");
  ret.index = json.get_int("index", 0);
  for (const auto& it : json.get_list("gates")) {
    ret.gates.emplace_back(gate_for_name(it->as_string()));
  }
  return ret;
}

phosg::JSON Check::json() const {
  auto gates_json = phosg::JSON::list();
  for (Gate gate : this->gates) {
    gates_json.emplace_back(name_for_gate(gate));
  }
  return phosg::JSON::dict({
      {"name", this->name},
      {"area", static_cast<int64_t>(this->area)},
      {"room", static_cast<int64_t>(this->room)},
      {"index", static_cast<int64_t>(this->index)},
      {"gates", std::move(gates_json)},
  });
}

CheckCatalog load_check_catalog(const phosg::JSON& json) {
  CheckCatalog ret;
  for (const auto& it : json.as_list()) {
    Check check;
    try {
      check = Check::from_json(*it);
    } catch (const exception& e) {
      throw runtime_error(std::format("invalid check {}: {}", it->serialize(), e.what()));
    }
    LocationId loc = check.loc();
    if (!ret.emplace(loc, check).second) {
      throw duplicate_location(std::format("duplicate location {} for check {} (already used by {})",
          loc.str(), check.name, ret.at(loc).name));
    }
  }
  return ret;
}

CheckCatalog load_check_catalog_file(const string& filename) {
  return load_check_catalog(phosg::JSON::parse(phosg::load_file(filename)));
}

vector<Check> generate_check_catalog(const Neutopia& game) {
  uint8_t end_game_area = game.get_map().end_game_area;
  auto chests = game.filter_chests([&](const ChestRef& chest) -> bool {
    return (chest.area < end_game_area) && !chest.info.is_medallion();
  });

  vector<Check> ret;
  for (const auto& chest : chests) {
    auto& check = ret.emplace_back();
    check.name = std::format("{} - {}", area_name(chest.area), chest.info.name());
    check.area = chest.area;
    check.room = chest.room;
    check.index = chest.index;
  }
  return ret;
}

phosg::JSON check_catalog_json(const vector<Check>& checks) {
  auto ret = phosg::JSON::list();
  for (const auto& check : checks) {
    ret.emplace_back(check.json());
  }
  return ret;
}

} // namespace NeutopiaRando
