#pragma once

#include <stddef.h>
#include <stdint.h>

#include <phosg/JSON.hh>
#include <utility>
#include <vector>

namespace NeutopiaRando {

constexpr size_t ROM_SIZE = 384 * 1024;
constexpr size_t ROM_HEADER_SIZE = 0x200;

// Locations and sizes of the top-level tables. The defaults describe the NA
// release; tests use smaller synthetic layouts.
struct RomMap {
  uint32_t area_table_offset = 0x1C8B0;
  size_t area_count = 0x11; // 16 regular areas plus the end-game area
  uint32_t room_order_table_offset = 0x1C8E3;
  size_t room_order_count = 0x10;
  uint32_t chest_table_offset = 0x1C913;
  size_t chest_table_count = 0x10;

  size_t rooms_per_area = 0x40;
  size_t chests_per_table = 8;
  size_t room_order_table_size = 0x40;

  // Unused space where rewritten chest tables go. Area N's table is written
  // at chest_free_space_offset + N * chest_free_space_stride.
  uint32_t chest_free_space_offset = 0x4FE00;
  uint32_t chest_free_space_stride = 0x20;

  // Areas at or above this index are never randomized
  uint8_t end_game_area = 0x10;

  // Any key not present in the dict keeps its default value.
  static RomMap from_json(const phosg::JSON& json);
  phosg::JSON json() const;
};

// Controls which areas write() re-serializes.
struct RelocationOptions {
  uint8_t first_area = 0x04;
  uint8_t last_area = 0x0F; // Inclusive
  // After relocation, area_table[first] is set to area_table[second] for
  // each pair here
  std::vector<std::pair<uint8_t, uint8_t>> mirrored_areas;

  inline bool relocates(uint8_t area) const {
    return (area >= this->first_area) && (area <= this->last_area);
  }

  // Throws invalid_argument if either end isn't an area number or the range
  // is empty
  void set_range(uint64_t first, uint64_t last);

  static RelocationOptions from_json(const phosg::JSON& json);
};

} // namespace NeutopiaRando
