#pragma once

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Checks.hh"
#include "Neutopia.hh"

namespace NeutopiaRando {

struct Item {
  Chest info;
  std::optional<uint8_t> area_lock;

  bool operator==(const Item& other) const;
  bool operator<(const Item& other) const;
  std::string str() const;
};

// Tracks which items still need a home and which checks are still empty.
// Every successful placement removes one of each, so the two pools always
// have the same size; any mutation that would break this throws
// placement_stalled.
class PlacementState {
public:
  // Items are the non-medallion chests outside the end-game area. Crystal
  // balls and crypt keys are locked to the area they were found in.
  PlacementState(Neutopia&& game, CheckCatalog&& checks);
  ~PlacementState() = default;

  // Throws area_lock_violation, unknown_location or unknown_item (checked in
  // that order). Nothing changes if any of these are thrown.
  void place_item(const Item& item, uint8_t area, uint8_t room, uint8_t index);
  void place_item_by_loc(const Item& item, const LocationId& loc);

  std::vector<Item> filter_items(std::function<bool(const Item&)> pred) const;
  // Throws out_of_range unless exactly one pending item has this ID.
  Item get_item_by_id(uint8_t item_id) const;

  // Returns pending checks whose gates have all been cleared.
  std::vector<Check> filter_checks(std::function<bool(const Check&)> pred) const;
  // Returns pending checks regardless of gates.
  std::vector<Check> filter_checks_gateless(std::function<bool(const Check&)> pred) const;

  bool is_complete() const;
  bool is_gate_cleared(Gate gate) const;

  inline size_t unplaced_item_count() const {
    return this->unplaced_items.size();
  }
  inline size_t unassigned_check_count() const {
    return this->unassigned_checks.size();
  }
  inline const std::vector<ChestRef>& get_assignments() const {
    return this->assigned_chests;
  }

  // Writes every assignment into the game and returns it. The state can't be
  // used afterward.
  Neutopia finalize();

  static std::optional<Gate> gate_for_item(const Item& item);

private:
  Neutopia game;
  CheckCatalog unassigned_checks;
  std::multiset<Item> unplaced_items;
  std::set<Gate> cleared_gates;
  std::vector<ChestRef> assigned_chests;
  bool finalized;

  void check_counts() const;
};

} // namespace NeutopiaRando
