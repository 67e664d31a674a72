#include "PlacementState.hh"

#include <format>
#include <stdexcept>

#include "Errors.hh"
#include "Loggers.hh"

using namespace std;

namespace NeutopiaRando {

bool Item::operator==(const Item& other) const {
  return (this->info == other.info) && (this->area_lock == other.area_lock);
}

bool Item::operator<(const Item& other) const {
  if (this->info != other.info) {
    return this->info < other.info;
  }
  return this->area_lock < other.area_lock;
}

string Item::str() const {
  if (this->area_lock.has_value()) {
    return std::format("{} (locked to area {:02X})", this->info.str(), *this->area_lock);
  }
  return this->info.str();
}

PlacementState::PlacementState(Neutopia&& game, CheckCatalog&& checks)
    : game(std::move(game)),
      unassigned_checks(std::move(checks)),
      finalized(false) {
  uint8_t end_game_area = this->game.get_map().end_game_area;
  auto chests = this->game.filter_chests([&](const ChestRef& chest) -> bool {
    return (chest.area < end_game_area) && !chest.info.is_medallion();
  });
  for (const auto& chest : chests) {
    Item item;
    item.info = chest.info;
    if ((chest.info.item_id == CRYSTAL_BALL) || (chest.info.item_id == CRYPT_KEY)) {
      item.area_lock = chest.area;
    }
    this->unplaced_items.emplace(std::move(item));
  }

  rando_log.info_f("{} items to place in {} checks",
      this->unplaced_items.size(), this->unassigned_checks.size());
  this->check_counts();
}

void PlacementState::check_counts() const {
  if (this->unassigned_checks.size() != this->unplaced_items.size()) {
    throw placement_stalled(std::format("{} checks are unassigned but {} items are unplaced",
        this->unassigned_checks.size(), this->unplaced_items.size()));
  }
}

optional<Gate> PlacementState::gate_for_item(const Item& item) {
  switch (item.info.item_id) {
    case FIRE_WAND:
      return Gate::FIRE_WAND;
    case SKY_BELL:
      return Gate::BELL;
    case FALCON_SHOES:
      return Gate::FALCON_SHOES;
    case RAINBOW_DROP:
      return Gate::RAINBOW_DROP;
    default:
      return nullopt;
  }
}

void PlacementState::place_item(const Item& item, uint8_t area, uint8_t room, uint8_t index) {
  this->place_item_by_loc(item, LocationId{area, room, index});
}

void PlacementState::place_item_by_loc(const Item& item, const LocationId& loc) {
  if (this->finalized) {
    throw logic_error("placement state has already been finalized");
  }
  if (item.area_lock.has_value() && (*item.area_lock != loc.area)) {
    throw area_lock_violation(std::format("attempting to place area locked item {} in area {:02X}",
        item.str(), loc.area));
  }

  auto check_it = this->unassigned_checks.find(loc);
  if (check_it == this->unassigned_checks.end()) {
    throw unknown_location(std::format("can't place item at unknown location {}", loc.str()));
  }
  auto item_it = this->unplaced_items.find(item);
  if (item_it == this->unplaced_items.end()) {
    throw unknown_item(std::format("can't place unknown item {}", item.str()));
  }

  Check check = std::move(check_it->second);
  this->unassigned_checks.erase(check_it);
  this->unplaced_items.erase(item_it);

  auto gate = gate_for_item(item);
  if (gate.has_value()) {
    this->cleared_gates.emplace(*gate);
  }
  this->assigned_chests.emplace_back(ChestRef{item.info, check.area, check.room, check.index});
  rando_log.debug_f("Placed {} at {} ({})", item.info.name(), check.name, loc.str());

  this->check_counts();
}

vector<Item> PlacementState::filter_items(function<bool(const Item&)> pred) const {
  vector<Item> ret;
  for (const auto& item : this->unplaced_items) {
    if (pred(item)) {
      ret.emplace_back(item);
    }
  }
  return ret;
}

Item PlacementState::get_item_by_id(uint8_t item_id) const {
  auto items = this->filter_items([&](const Item& item) -> bool {
    return item.info.item_id == item_id;
  });
  if (items.size() != 1) {
    throw out_of_range(std::format("found {} items with ID {:02X}", items.size(), item_id));
  }
  return items[0];
}

bool PlacementState::is_gate_cleared(Gate gate) const {
  return this->cleared_gates.count(gate);
}

vector<Check> PlacementState::filter_checks(function<bool(const Check&)> pred) const {
  vector<Check> ret;
  for (const auto& [loc, check] : this->unassigned_checks) {
    bool open = true;
    for (Gate gate : check.gates) {
      if (!this->cleared_gates.count(gate)) {
        open = false;
        break;
      }
    }
    if (open && pred(check)) {
      ret.emplace_back(check);
    }
  }
  return ret;
}

vector<Check> PlacementState::filter_checks_gateless(function<bool(const Check&)> pred) const {
  vector<Check> ret;
  for (const auto& [loc, check] : this->unassigned_checks) {
    if (pred(check)) {
      ret.emplace_back(check);
    }
  }
  return ret;
}

bool PlacementState::is_complete() const {
  this->check_counts();
  return this->unassigned_checks.empty();
}

Neutopia PlacementState::finalize() {
  if (this->finalized) {
    throw logic_error("placement state has already been finalized");
  }
  this->finalized = true;
  this->game.update_chests(this->assigned_chests);
  return std::move(this->game);
}

} // namespace NeutopiaRando
