#include "Neutopia.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Errors.hh"
#include "Loggers.hh"
#include "Pointers.hh"

using namespace std;

namespace NeutopiaRando {

string ChestRef::str() const {
  return std::format("{} at {:02X}:{:02X}:{}", this->info.name(), this->area, this->room, this->index);
}

Neutopia::Neutopia(const string& data, const RomMap& map, const RelocationOptions& relocation)
    : data(data),
      map(map),
      relocation(relocation),
      written(false) {
  if (this->relocation.last_area >= this->map.area_count) {
    throw invalid_argument(std::format("relocation range ends at area {:02X}, but there are only {} areas",
        this->relocation.last_area, this->map.area_count));
  }
  for (const auto& [dest, source] : this->relocation.mirrored_areas) {
    if ((dest >= this->map.area_count) || (source >= this->map.area_count)) {
      throw invalid_argument(std::format("mirrored area {:02X} -> {:02X} is out of range", source, dest));
    }
  }

  NeutopiaRom rom(data, map);
  this->area_pointers = std::move(rom.area_pointers);
  this->areas = std::move(rom.areas);

  // Rooms outside the relocation range are never rewritten, so their
  // conditionals stay where they are
  for (size_t area_index = this->relocation.first_area; area_index <= this->relocation.last_area; area_index++) {
    this->extract_conditionals(area_index);
  }
}

const Chest* Neutopia::chest_for_entry(uint8_t area_index, const TableEntry& entry) const {
  int slot = entry.chest_index();
  if (slot < 0) {
    return nullptr;
  }
  const auto& chest_table = this->areas.at(area_index).chest_table;
  if (static_cast<size_t>(slot) >= chest_table.size()) {
    return nullptr;
  }
  return &chest_table[slot];
}

void Neutopia::extract_conditionals(uint8_t area_index) {
  auto& area = this->areas.at(area_index);
  for (size_t room_index = 0; room_index < area.rooms.size(); room_index++) {
    auto& object_table = area.rooms[room_index].object_table;
    if (object_table.size() <= 2) {
      continue;
    }
    // Only the first conditional in each room is extracted
    for (size_t z = 0; z < object_table.size() - 2; z++) {
      const Chest* chest = this->chest_for_entry(area_index, object_table[z]);
      if (!chest || !object_table[z + 1].is_conditional()) {
        continue;
      }

      Conditional cond;
      cond.entries.emplace_back(std::move(object_table[z + 1]));
      cond.entries.emplace_back(std::move(object_table[z + 2]));
      object_table.erase(object_table.begin() + z + 1, object_table.begin() + z + 3);

      rom_log.debug_f("Extracted conditional for {} from area {:02X} room {:02X}",
          chest->name(), area_index, room_index);
      if (!this->conditionals.emplace(*chest, std::move(cond)).second) {
        rom_log.warning_f("Area {:02X} room {:02X} has a second conditional for {}; keeping the first",
            area_index, room_index, chest->str());
      }
      break;
    }
  }
}

vector<ChestRef> Neutopia::filter_chests(function<bool(const ChestRef&)> pred) const {
  vector<ChestRef> ret;
  for (size_t area_index = 0; area_index < this->areas.size(); area_index++) {
    const auto& area = this->areas[area_index];
    for (size_t room_index = 0; room_index < area.rooms.size(); room_index++) {
      uint8_t index = 0;
      for (const auto& entry : area.rooms[room_index].object_table) {
        if (entry.chest_index() < 0) {
          continue;
        }
        const Chest* chest = this->chest_for_entry(area_index, entry);
        if (chest) {
          ChestRef ref{*chest, static_cast<uint8_t>(area_index), static_cast<uint8_t>(room_index), index};
          if (pred(ref)) {
            ret.emplace_back(std::move(ref));
          }
        }
        index++;
      }
    }
  }
  return ret;
}

void Neutopia::update_chests(const vector<ChestRef>& refs) {
  for (const auto& ref : refs) {
    if (ref.area >= this->areas.size()) {
      throw incoherent_chest(ref.area, ref.room, ref.index);
    }
    auto& area = this->areas[ref.area];
    if (ref.room >= area.rooms.size()) {
      throw incoherent_chest(ref.area, ref.room, ref.index);
    }

    int slot = -1;
    uint8_t index = 0;
    for (const auto& entry : area.rooms[ref.room].object_table) {
      int entry_slot = entry.chest_index();
      if (entry_slot < 0) {
        continue;
      }
      if (index == ref.index) {
        slot = entry_slot;
        break;
      }
      index++;
    }
    if ((slot < 0) || (static_cast<size_t>(slot) >= area.chest_table.size())) {
      throw incoherent_chest(ref.area, ref.room, ref.index);
    }
    area.chest_table[slot] = ref.info;
  }
}

vector<TableEntry> Neutopia::object_table_with_conditionals(uint8_t area_index, uint8_t room_index) const {
  vector<TableEntry> ret = this->areas.at(area_index).rooms.at(room_index).object_table;
  for (size_t z = 0; z < ret.size(); z++) {
    const Chest* chest = this->chest_for_entry(area_index, ret[z]);
    if (!chest) {
      continue;
    }
    auto cond_it = this->conditionals.find(*chest);
    if (cond_it == this->conditionals.end()) {
      continue;
    }

    ObjectInfo loc = ret[z].object_info();
    vector<TableEntry> entries = cond_it->second.entries;
    for (auto& entry : entries) {
      if (entry.has_object_info()) {
        ObjectInfo info = entry.object_info();
        info.x = loc.x;
        info.y = loc.y;
        entry.set_object_info(info);
      }
    }
    ret.insert(ret.begin() + z + 1, entries.begin(), entries.end());
    z += entries.size();
  }
  return ret;
}

uint32_t Neutopia::write_area(RomWriter& w, uint8_t area_index, uint32_t start_offset) {
  const auto& area = this->areas.at(area_index);
  uint32_t room_pointer_table_offset = start_offset;

  // The room pointer table comes first; room data follows it
  w.go(room_pointer_table_offset + area.rooms.size() * POINTER_SIZE);
  vector<uint32_t> room_offsets;
  for (size_t room_index = 0; room_index < area.rooms.size(); room_index++) {
    const auto& room = area.rooms[room_index];
    auto object_table = this->object_table_with_conditionals(area_index, room_index);

    uint32_t descriptor_offset = w.where();
    room_offsets.emplace_back(descriptor_offset);
    w.write(string(3 * POINTER_SIZE, '\0'));

    uint32_t warp_offset = w.where();
    w.write(room.warp_table);
    uint32_t enemy_offset = w.where();
    w.write(room.enemy_table);
    w.put_u8(TABLE_TERMINATOR);
    uint32_t object_offset = w.where();
    w.write(serialize_object_table(object_table));
    w.put_u8(TABLE_TERMINATOR);

    w.patch_pointer(descriptor_offset, warp_offset);
    w.patch_pointer(descriptor_offset + POINTER_SIZE, enemy_offset);
    w.patch_pointer(descriptor_offset + 2 * POINTER_SIZE, object_offset);
  }
  uint32_t end_offset = w.where();

  for (size_t z = 0; z < room_offsets.size(); z++) {
    w.patch_pointer(room_pointer_table_offset + z * POINTER_SIZE, room_offsets[z]);
  }
  w.patch_pointer(this->map.area_table_offset + area_index * POINTER_SIZE, room_pointer_table_offset);
  this->area_pointers[area_index] = room_pointer_table_offset;

  rom_log.debug_f("Area {:02X} ({}) relocated to {:05X}-{:05X}",
      area_index, area_name(area_index), start_offset, end_offset);
  return end_offset;
}

void Neutopia::check_unrelocated_areas(
    RomWriter& w, const vector<uint32_t>& original_area_pointers, uint32_t start_offset, uint32_t end_offset) {
  IntervalStore<size_t>::Interval rewritten{start_offset, end_offset};
  for (size_t area_index = 0; area_index < this->areas.size(); area_index++) {
    if (this->relocation.relocates(area_index)) {
      continue;
    }
    bool is_mirror_dest = false;
    for (const auto& it : this->relocation.mirrored_areas) {
      is_mirror_dest |= (it.first == area_index);
    }
    if (is_mirror_dest) {
      continue;
    }

    // An area that shares a relocated area's data follows it to its new place
    uint32_t original_pointer = original_area_pointers[area_index];
    bool mirrored = false;
    for (size_t source = this->relocation.first_area; source <= this->relocation.last_area; source++) {
      if (original_area_pointers[source] == original_pointer) {
        this->area_pointers[area_index] = this->area_pointers[source];
        w.patch_pointer(this->map.area_table_offset + area_index * POINTER_SIZE, this->area_pointers[source]);
        rom_log.info_f("Area {:02X} ({}) shares data with area {:02X}; mirroring it",
            area_index, area_name(area_index), source);
        mirrored = true;
        break;
      }
    }
    if (mirrored) {
      continue;
    }

    for (const auto& interval : this->areas[area_index].room_data_intervals.get_intervals()) {
      if (interval.overlaps(rewritten)) {
        throw format_error(std::format(
            "relocated room data ({:05X}-{:05X}) overwrites area {:02X} room data ({:05X}-{:05X})",
            start_offset, end_offset, area_index, interval.start, interval.end));
      }
    }
  }
}

string Neutopia::write() {
  if (this->written) {
    throw logic_error("game has already been written");
  }
  this->written = true;

  RomWriter w(std::move(this->data));

  vector<uint32_t> original_area_pointers = this->area_pointers;
  uint32_t room_data_start = this->area_pointers.at(this->relocation.first_area);
  uint32_t offset = room_data_start;
  for (size_t area_index = this->relocation.first_area; area_index <= this->relocation.last_area; area_index++) {
    offset = this->write_area(w, area_index, offset);
  }
  this->check_unrelocated_areas(w, original_area_pointers, room_data_start, offset);

  uint32_t chest_space_start = this->map.chest_free_space_offset;
  uint32_t chest_space_end = chest_space_start + this->map.chest_table_count * this->map.chest_free_space_stride;
  if ((room_data_start < chest_space_end) && (chest_space_start < offset)) {
    throw format_error(std::format(
        "relocated room data ({:05X}-{:05X}) overlaps the chest table space ({:05X}-{:05X})",
        room_data_start, offset, chest_space_start, chest_space_end));
  }

  for (size_t area_index = 0; area_index < this->areas.size(); area_index++) {
    const auto& area = this->areas[area_index];
    if (!area.has_chest_table) {
      continue;
    }
    uint32_t table_offset = chest_space_start + area_index * this->map.chest_free_space_stride;
    w.go(table_offset);
    w.write(serialize_chest_table(area.chest_table));
    w.patch_pointer(this->map.chest_table_offset + area_index * POINTER_SIZE, table_offset);
  }

  for (const auto& [dest, source] : this->relocation.mirrored_areas) {
    this->area_pointers[dest] = this->area_pointers[source];
    w.patch_pointer(this->map.area_table_offset + dest * POINTER_SIZE, this->area_pointers[source]);
  }

  return w.release();
}

} // namespace NeutopiaRando
