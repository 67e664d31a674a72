#include "RomMap.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

using namespace std;

namespace NeutopiaRando {

RomMap RomMap::from_json(const phosg::JSON& json) {
  RomMap ret;
  ret.area_table_offset = json.get_int("AreaTableOffset", ret.area_table_offset);
  ret.area_count = json.get_int("AreaCount", ret.area_count);
  ret.room_order_table_offset = json.get_int("RoomOrderTableOffset", ret.room_order_table_offset);
  ret.room_order_count = json.get_int("RoomOrderCount", ret.room_order_count);
  ret.chest_table_offset = json.get_int("ChestTableOffset", ret.chest_table_offset);
  ret.chest_table_count = json.get_int("ChestTableCount", ret.chest_table_count);
  ret.rooms_per_area = json.get_int("RoomsPerArea", ret.rooms_per_area);
  ret.chests_per_table = json.get_int("ChestsPerTable", ret.chests_per_table);
  ret.room_order_table_size = json.get_int("RoomOrderTableSize", ret.room_order_table_size);
  ret.chest_free_space_offset = json.get_int("ChestFreeSpaceOffset", ret.chest_free_space_offset);
  ret.chest_free_space_stride = json.get_int("ChestFreeSpaceStride", ret.chest_free_space_stride);
  ret.end_game_area = json.get_int("EndGameArea", ret.end_game_area);

  if (ret.chest_table_count > ret.area_count) {
    throw invalid_argument(std::format("chest table count ({}) exceeds area count ({})",
        ret.chest_table_count, ret.area_count));
  }
  if (ret.chest_free_space_stride < ret.chests_per_table * 4) {
    throw invalid_argument("chest free space stride is too small to hold a chest table");
  }
  return ret;
}

phosg::JSON RomMap::json() const {
  return phosg::JSON::dict({
      {"AreaTableOffset", static_cast<int64_t>(this->area_table_offset)},
      {"AreaCount", static_cast<int64_t>(this->area_count)},
      {"RoomOrderTableOffset", static_cast<int64_t>(this->room_order_table_offset)},
      {"RoomOrderCount", static_cast<int64_t>(this->room_order_count)},
      {"ChestTableOffset", static_cast<int64_t>(this->chest_table_offset)},
      {"ChestTableCount", static_cast<int64_t>(this->chest_table_count)},
      {"RoomsPerArea", static_cast<int64_t>(this->rooms_per_area)},
      {"ChestsPerTable", static_cast<int64_t>(this->chests_per_table)},
      {"RoomOrderTableSize", static_cast<int64_t>(this->room_order_table_size)},
      {"ChestFreeSpaceOffset", static_cast<int64_t>(this->chest_free_space_offset)},
      {"ChestFreeSpaceStride", static_cast<int64_t>(this->chest_free_space_stride)},
      {"EndGameArea", static_cast<int64_t>(this->end_game_area)},
  });
}

void RelocationOptions::set_range(uint64_t first, uint64_t last) {
  if ((first > 0xFF) || (last > 0xFF)) {
    throw invalid_argument(std::format("relocation range {:X}-{:X} is out of range", first, last));
  }
  if (first > last) {
    throw invalid_argument(std::format("relocation range {:02X}-{:02X} is empty", first, last));
  }
  this->first_area = first;
  this->last_area = last;
}

RelocationOptions RelocationOptions::from_json(const phosg::JSON& json) {
  RelocationOptions ret;
  ret.set_range(json.get_int("FirstArea", ret.first_area), json.get_int("LastArea", ret.last_area));
  const phosg::JSON* mirrors_json = nullptr;
  try {
    mirrors_json = &json.at("MirroredAreas");
  } catch (const out_of_range&) {
  }
  if (mirrors_json) {
    for (const auto& it : mirrors_json->as_list()) {
      if (it->as_list().size() != 2) {
        throw invalid_argument("each mirrored area must be a [dest, source] pair");
      }
      int64_t dest = it->at(0).as_int();
      int64_t source = it->at(1).as_int();
      if ((dest < 0) || (dest > 0xFF) || (source < 0) || (source > 0xFF)) {
        throw invalid_argument(std::format("mirrored area {} -> {} is out of range", source, dest));
      }
      ret.mirrored_areas.emplace_back(dest, source);
    }
  }
  return ret;
}

} // namespace NeutopiaRando
