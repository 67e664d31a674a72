#pragma once

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Chest.hh"
#include "NeutopiaRom.hh"
#include "ObjectTable.hh"
#include "RomMap.hh"
#include "RomWriter.hh"

namespace NeutopiaRando {

// A chest as seen from the room that holds it. index is the ordinal of the
// chest object among the chest objects in that room, not the chest table slot.
struct ChestRef {
  Chest info;
  uint8_t area;
  uint8_t room;
  uint8_t index;

  std::string str() const;
};

// Two object table records that follow a chest object and depend on what the
// chest holds. They travel with the chest's contents, not with the room.
struct Conditional {
  std::vector<TableEntry> entries;
};

// Mutable view of the game built on top of NeutopiaRom. Chest contents change
// through update_chests; write() produces a new ROM image and may only be
// called once.
class Neutopia {
public:
  explicit Neutopia(
      const std::string& data,
      const RomMap& map = RomMap(),
      const RelocationOptions& relocation = RelocationOptions());
  ~Neutopia() = default;

  std::vector<ChestRef> filter_chests(std::function<bool(const ChestRef&)> pred) const;

  // Throws incoherent_chest if a ref doesn't name a chest object that exists,
  // or if that object's chest slot is outside the area's chest table.
  void update_chests(const std::vector<ChestRef>& refs);

  std::string write();

  inline const std::vector<Area>& get_areas() const {
    return this->areas;
  }
  inline const std::unordered_map<Chest, Conditional, ChestHash>& get_conditionals() const {
    return this->conditionals;
  }
  inline const RomMap& get_map() const {
    return this->map;
  }
  inline const RelocationOptions& get_relocation() const {
    return this->relocation;
  }

private:
  std::string data;
  RomMap map;
  RelocationOptions relocation;
  std::vector<uint32_t> area_pointers;
  std::vector<Area> areas;
  std::unordered_map<Chest, Conditional, ChestHash> conditionals;
  bool written;

  void extract_conditionals(uint8_t area_index);
  std::vector<TableEntry> object_table_with_conditionals(uint8_t area_index, uint8_t room_index) const;
  const Chest* chest_for_entry(uint8_t area_index, const TableEntry& entry) const;
  // Returns the offset just past the area's room data
  uint32_t write_area(RomWriter& w, uint8_t area_index, uint32_t start_offset);
  // Mirrors areas outside the relocation range that alias a relocated area,
  // and throws format_error if the rewritten range covers any other area's
  // room data
  void check_unrelocated_areas(
      RomWriter& w,
      const std::vector<uint32_t>& original_area_pointers,
      uint32_t start_offset,
      uint32_t end_offset);
};

} // namespace NeutopiaRando
