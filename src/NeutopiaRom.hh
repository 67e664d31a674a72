#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include <string>
#include <vector>

#include "Chest.hh"
#include "IntervalStore.hh"
#include "ObjectTable.hh"
#include "RomMap.hh"

namespace NeutopiaRando {

struct Room {
  // Where the room's three table pointers are stored, and where they point.
  // These record where the data came from; nothing looks rooms up by them.
  uint32_t base_offset;
  uint32_t warp_table_offset;
  uint32_t enemy_table_offset;
  uint32_t object_table_offset;

  std::string warp_table;
  std::string enemy_table; // Without the 0xFF terminator
  std::vector<TableEntry> object_table; // Without the 0xFF terminator
};

struct Area {
  uint32_t room_pointer_table_offset;
  std::vector<Room> rooms;

  // Empty for areas that have no chest table (the end-game area)
  bool has_chest_table;
  uint32_t chest_table_offset;
  std::vector<Chest> chest_table;

  // Empty for areas that have no room order table
  bool has_room_order_table;
  uint32_t room_order_table_offset;
  std::string room_order_table;

  // Every byte range claimed by this area's room pointers and room data
  IntervalStore<size_t> room_data_intervals;
};

// Structured, read-only view of the level data in an unheadered ROM image.
class NeutopiaRom {
public:
  // Throws format_error subclasses. Errors within a room's data are annotated
  // with the area and room indexes.
  explicit NeutopiaRom(const std::string& data, const RomMap& map = RomMap());
  ~NeutopiaRom() = default;

  inline const RomMap& get_map() const {
    return this->map;
  }

  std::vector<uint32_t> area_pointers;
  std::vector<uint32_t> room_order_pointers;
  std::vector<uint32_t> chest_table_pointers;
  std::vector<Area> areas;

  void print(FILE* stream, bool print_rooms = false) const;

private:
  RomMap map;

  void parse_area(const std::string& data, uint8_t area_index);
  Room parse_room(const std::string& data, Area& area, uint32_t descriptor_offset);
};

} // namespace NeutopiaRando
