#include "Randomizer.hh"

#include <format>
#include <phosg/Random.hh>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Errors.hh"
#include "Loggers.hh"
#include "Neutopia.hh"
#include "PlacementState.hh"
#include "Verify.hh"

using namespace std;

namespace NeutopiaRando {

const char* name_for_rando_type(RandoType type) {
  switch (type) {
    case RandoType::LOCAL:
      return "local";
    case RandoType::GLOBAL:
      return "global";
    case RandoType::NONE:
      return "none";
    default:
      throw logic_error("invalid randomizer type");
  }
}

RandoType rando_type_for_name(const string& name) {
  if (name == "local") {
    return RandoType::LOCAL;
  } else if (name == "global") {
    return RandoType::GLOBAL;
  } else if (name == "none") {
    return RandoType::NONE;
  } else {
    throw invalid_argument(std::format("unknown randomizer type: {} (expected local, global or none)", name));
  }
}

string local_rando(RandomGenerator& rand, const string& data, const RandomizerConfig& config) {
  Neutopia game(data, config.map, config.relocation);

  for (uint8_t area = LOCAL_RANDO_FIRST_AREA; area <= LOCAL_RANDO_LAST_AREA; area++) {
    auto chests = game.filter_chests([&](const ChestRef& chest) -> bool {
      return (chest.area == area) && !chest.info.is_medallion();
    });

    vector<Chest> contents;
    for (const auto& chest : chests) {
      contents.emplace_back(chest.info);
    }
    shuffle(contents, rand);
    for (size_t z = 0; z < chests.size(); z++) {
      chests[z].info = contents[z];
      rando_log.debug_f("{} now holds {}", area_name(area), chests[z].str());
    }

    game.update_chests(chests);
  }

  return game.write();
}

static LocationId vanilla_location(const Neutopia& game, uint8_t item_id) {
  uint8_t end_game_area = game.get_map().end_game_area;
  auto chests = game.filter_chests([&](const ChestRef& chest) -> bool {
    return (chest.area < end_game_area) && (chest.info.item_id == item_id);
  });
  if (chests.empty()) {
    throw unknown_item(std::format("item {:02X} does not appear in the game", item_id));
  }
  return LocationId{chests[0].area, chests[0].room, chests[0].index};
}

static void place_in_random_check(
    PlacementState& state, RandomGenerator& rand, const Item& item, const vector<Check>& candidates) {
  if (candidates.empty()) {
    throw placement_stalled(std::format("no open check is available for {}", item.str()));
  }
  const auto& check = choose(candidates, rand);
  state.place_item_by_loc(item, check.loc());
}

string global_rando(RandomGenerator& rand, const string& data, const RandomizerConfig& config) {
  Neutopia game(data, config.map, config.relocation);

  LocationId book_location = config.book_location.has_value()
      ? *config.book_location
      : vanilla_location(game, BOOK_OF_REVIVAL);
  LocationId moss_location = config.moss_location.has_value()
      ? *config.moss_location
      : vanilla_location(game, MOONBEAM_MOSS);

  CheckCatalog checks = config.checks;
  PlacementState state(std::move(game), std::move(checks));

  // Pinned items go first, so nothing else can take their checks
  state.place_item_by_loc(state.get_item_by_id(BOOK_OF_REVIVAL), book_location);
  state.place_item_by_loc(state.get_item_by_id(MOONBEAM_MOSS), moss_location);

  // Area-locked items ignore gates; they must stay in their own area
  auto locked_items = state.filter_items([](const Item& item) -> bool {
    return item.area_lock.has_value();
  });
  for (const auto& item : locked_items) {
    uint8_t area = *item.area_lock;
    place_in_random_check(state, rand, item, state.filter_checks_gateless([&](const Check& check) -> bool {
      return check.area == area;
    }));
  }

  auto all_checks = [](const Check&) -> bool { return true; };

  auto gate_items = state.filter_items([](const Item& item) -> bool {
    return PlacementState::gate_for_item(item).has_value();
  });
  shuffle(gate_items, rand);
  for (const auto& item : gate_items) {
    place_in_random_check(state, rand, item, state.filter_checks(all_checks));
  }

  // Placing a gate item can open more checks, so the open set is recomputed
  // after every placement
  auto remaining_items = state.filter_items([](const Item&) -> bool { return true; });
  shuffle(remaining_items, rand);
  for (const auto& item : remaining_items) {
    place_in_random_check(state, rand, item, state.filter_checks(all_checks));
  }

  if (!state.is_complete()) {
    throw placement_stalled(std::format("{} checks were left empty", state.unassigned_check_count()));
  }
  return state.finalize().write();
}

RandomizedGame randomize(const RandomizerConfig& config, const string& data) {
  uint64_t seed = config.seed.empty() ? phosg::random_object<uint64_t>() : parse_base36_seed(config.seed);
  Pcg32Generator rand(seed);

  RandomizedGame ret;
  ret.seed = format_base36_seed(seed);
  rando_log.info_f("Randomizing with type {} and seed {}", name_for_rando_type(config.type), ret.seed);

  string buffer = verify_rom(data);
  apply_patches(buffer, config.patches);

  switch (config.type) {
    case RandoType::LOCAL:
      ret.data = local_rando(rand, buffer, config);
      break;
    case RandoType::GLOBAL:
      ret.data = global_rando(rand, buffer, config);
      break;
    case RandoType::NONE:
      ret.data = std::move(buffer);
      break;
    default:
      throw logic_error("invalid randomizer type");
  }
  return ret;
}

string default_output_filename(const string& seed) {
  return std::format("neutopia-randomizer-{}.pce", seed);
}

} // namespace NeutopiaRando
