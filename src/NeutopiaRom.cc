#include "NeutopiaRom.hh"

#include <stdio.h>
#include <string.h>

#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Strings.hh>

#include "Errors.hh"
#include "Loggers.hh"
#include "Pointers.hh"

using namespace std;

namespace NeutopiaRando {

NeutopiaRom::NeutopiaRom(const string& data, const RomMap& map)
    : map(map) {
  try {
    this->area_pointers = decode_pointer_table(data, map.area_table_offset, map.area_count);
  } catch (format_error& e) {
    e.add_context("area table");
    throw;
  }
  try {
    this->room_order_pointers = decode_pointer_table(data, map.room_order_table_offset, map.room_order_count);
  } catch (format_error& e) {
    e.add_context("room order table");
    throw;
  }
  try {
    this->chest_table_pointers = decode_pointer_table(data, map.chest_table_offset, map.chest_table_count);
  } catch (format_error& e) {
    e.add_context("chest table");
    throw;
  }

  for (size_t area_index = 0; area_index < map.area_count; area_index++) {
    this->parse_area(data, area_index);
  }
}

void NeutopiaRom::parse_area(const string& data, uint8_t area_index) {
  auto& area = this->areas.emplace_back();
  area.room_pointer_table_offset = this->area_pointers[area_index];
  area.room_data_intervals.add(
      area.room_pointer_table_offset,
      area.room_pointer_table_offset + this->map.rooms_per_area * POINTER_SIZE);

  for (size_t room_index = 0; room_index < this->map.rooms_per_area; room_index++) {
    try {
      uint32_t descriptor_offset = decode_pointer(
          data, area.room_pointer_table_offset + room_index * POINTER_SIZE);
      area.rooms.emplace_back(this->parse_room(data, area, descriptor_offset));
    } catch (format_error& e) {
      e.add_context(std::format("area {:02X} room {:02X}", area_index, room_index));
      throw;
    }
  }

  area.has_chest_table = (area_index < this->map.chest_table_count);
  area.chest_table_offset = 0;
  if (area.has_chest_table) {
    area.chest_table_offset = this->chest_table_pointers[area_index];
    try {
      area.chest_table = parse_chest_table(data, area.chest_table_offset, this->map.chests_per_table);
    } catch (format_error& e) {
      e.add_context(std::format("area {:02X} chest table", area_index));
      throw;
    }
  }

  area.has_room_order_table = (area_index < this->map.room_order_count);
  area.room_order_table_offset = 0;
  if (area.has_room_order_table) {
    area.room_order_table_offset = this->room_order_pointers[area_index];
    if (area.room_order_table_offset + this->map.room_order_table_size > data.size()) {
      auto e = truncated_rom(area.room_order_table_offset + this->map.room_order_table_size, data.size());
      e.add_context(std::format("area {:02X} room order table", area_index));
      throw e;
    }
    area.room_order_table = data.substr(area.room_order_table_offset, this->map.room_order_table_size);
  }

  auto intervals = area.room_data_intervals.get_intervals();
  rom_log.debug_f("Area {:02X}: {} rooms in {} intervals ({} overlapping claims)",
      area_index, area.rooms.size(), intervals.size(), area.room_data_intervals.overlap_count());
}

Room NeutopiaRom::parse_room(const string& data, Area& area, uint32_t descriptor_offset) {
  auto table_ptrs = decode_pointer_table(data, descriptor_offset, 3);

  Room room;
  room.base_offset = descriptor_offset;
  room.warp_table_offset = table_ptrs[0];
  room.enemy_table_offset = table_ptrs[1];
  room.object_table_offset = table_ptrs[2];

  // The warp table has no terminator; it ends where the enemy table begins
  if (room.enemy_table_offset < room.warp_table_offset) {
    throw format_error(std::format("enemy table ({:X}) precedes warp table ({:X})",
        room.enemy_table_offset, room.warp_table_offset));
  }
  if (room.enemy_table_offset > data.size()) {
    throw truncated_rom(room.enemy_table_offset, data.size());
  }
  room.warp_table = data.substr(room.warp_table_offset, room.enemy_table_offset - room.warp_table_offset);

  const void* enemy_data = data.data() + room.enemy_table_offset;
  const void* enemy_end = memchr(enemy_data, TABLE_TERMINATOR, data.size() - room.enemy_table_offset);
  if (!enemy_end) {
    throw truncated_rom(data.size(), data.size());
  }
  room.enemy_table = data.substr(room.enemy_table_offset,
      reinterpret_cast<const char*>(enemy_end) - reinterpret_cast<const char*>(enemy_data));

  if (room.object_table_offset > data.size()) {
    throw truncated_rom(room.object_table_offset, data.size());
  }
  size_t object_table_size = object_table_length(
      data.data() + room.object_table_offset, data.size() - room.object_table_offset);
  room.object_table = parse_object_table(data.data() + room.object_table_offset, object_table_size);

  area.room_data_intervals.add(descriptor_offset, descriptor_offset + 3 * POINTER_SIZE);
  area.room_data_intervals.add(room.warp_table_offset, room.warp_table_offset + room.warp_table.size());
  area.room_data_intervals.add(room.enemy_table_offset, room.enemy_table_offset + room.enemy_table.size() + 1);
  area.room_data_intervals.add(room.object_table_offset, room.object_table_offset + object_table_size + 1);

  return room;
}

void NeutopiaRom::print(FILE* stream, bool print_rooms) const {
  for (size_t area_index = 0; area_index < this->areas.size(); area_index++) {
    const auto& area = this->areas[area_index];
    phosg::fwrite_fmt(stream, "[Area {:02X}: {}]\n", area_index, area_name(area_index));
    phosg::fwrite_fmt(stream, "  room pointer table: {:05X}\n", area.room_pointer_table_offset);
    if (area.has_room_order_table) {
      phosg::fwrite_fmt(stream, "  room order table: {:05X}\n", area.room_order_table_offset);
    }
    for (const auto& interval : area.room_data_intervals.get_intervals()) {
      phosg::fwrite_fmt(stream, "  room data: {:05X}-{:05X}\n", interval.start, interval.end);
    }
    for (const auto& gap : area.room_data_intervals.get_gaps()) {
      phosg::fwrite_fmt(stream, "  unclaimed: {:05X}-{:05X}\n", gap.start, gap.end);
    }
    if (area.room_data_intervals.overlap_count()) {
      phosg::fwrite_fmt(stream, "  overlapping claims: {}\n", area.room_data_intervals.overlap_count());
    }

    if (area.has_chest_table) {
      phosg::fwrite_fmt(stream, "  chest table: {:05X}\n", area.chest_table_offset);
      for (size_t z = 0; z < area.chest_table.size(); z++) {
        phosg::fwrite_fmt(stream, "    {}: {}\n", z, area.chest_table[z].str());
      }
    }

    if (print_rooms) {
      for (size_t room_index = 0; room_index < area.rooms.size(); room_index++) {
        const auto& room = area.rooms[room_index];
        phosg::fwrite_fmt(stream, "  room {:02X} ({}, {}) @ {:05X}: warp {:05X} enemy {:05X} object {:05X}\n",
            room_index, room_index / 8, room_index % 8, room.base_offset,
            room.warp_table_offset, room.enemy_table_offset, room.object_table_offset);
        if (!room.warp_table.empty()) {
          phosg::fwrite_fmt(stream, "    warps: {}\n", phosg::format_data_string(room.warp_table));
        }
        if (!room.enemy_table.empty()) {
          phosg::fwrite_fmt(stream, "    enemies: {}\n", phosg::format_data_string(room.enemy_table));
        }
        for (const auto& entry : room.object_table) {
          phosg::fwrite_fmt(stream, "    - {}\n", entry.str());
        }
      }
    }
    fputc('\n', stream);
  }
}

} // namespace NeutopiaRando
