#include "Chest.hh"

#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;

namespace NeutopiaRando {

bool Chest::is_medallion() const {
  return (this->item_id >= MEDALLION_BASE) && (this->item_id < MEDALLION_BASE + NUM_MEDALLIONS);
}

static const char* equipment_tier_name(uint8_t arg) {
  switch (arg) {
    case 1:
      return "Starter";
    case 2:
      return "Bronze";
    case 3:
      return "Steel";
    case 4:
      return "Strongest";
    default:
      return "Unknown";
  }
}

string Chest::name() const {
  switch (this->item_id) {
    case BOMBS:
      return std::format("Bombs x{}", this->arg);
    case MEDICINE:
      return "Medicine";
    case FIRE_WAND:
      return "Fire Wand";
    case SKY_BELL:
      return "Sky Bell";
    case WINGS:
      return "Wings";
    case MOONBEAM_MOSS:
      return "Moonbeam Moss";
    case MAGIC_RING:
      return "Magic Ring";
    case SWORD:
      return std::format("{} Sword", equipment_tier_name(this->arg));
    case ARMOR:
      return std::format("{} Armor", equipment_tier_name(this->arg));
    case SHIELD:
      return std::format("{} Shield", equipment_tier_name(this->arg));
    case FALCON_SHOES:
      return "Falcon Shoes";
    case RAINBOW_DROP:
      return "Rainbow Drop";
    case BOOK_OF_REVIVAL:
      return "Book of Revival";
    case CRYSTAL_BALL:
      return "Crystal Ball";
    case CRYPT_KEY:
      return "Crypt Key";
    case 0x07:
    case 0x0E:
    case 0x0F:
    case 0x1A:
      return "Placeholder";
    default:
      if (this->is_medallion()) {
        return std::format("Crypt {} Medallion", this->item_id - MEDALLION_BASE + 1);
      }
      return "Unknown";
  }
}

string Chest::str() const {
  return std::format("{} ({:02X} {:02X} {:02X} {:02X})",
      this->name(), this->item_id, this->arg, this->text, this->unknown);
}

bool Chest::operator==(const Chest& other) const {
  return (this->item_id == other.item_id) &&
      (this->arg == other.arg) &&
      (this->text == other.text) &&
      (this->unknown == other.unknown);
}

bool Chest::operator!=(const Chest& other) const {
  return !this->operator==(other);
}

bool Chest::operator<(const Chest& other) const {
  if (this->item_id != other.item_id) {
    return this->item_id < other.item_id;
  }
  if (this->arg != other.arg) {
    return this->arg < other.arg;
  }
  if (this->text != other.text) {
    return this->text < other.text;
  }
  return this->unknown < other.unknown;
}

size_t ChestHash::operator()(const Chest& chest) const {
  return hash<uint32_t>()((chest.item_id << 24) | (chest.arg << 16) | (chest.text << 8) | chest.unknown);
}

const char* area_name(uint8_t area) {
  static const char* const names[0x11] = {
      "Land Sphere",
      "Subterranean Sphere",
      "Sea Sphere",
      "Sky Sphere",
      "Crypt 1",
      "Crypt 2",
      "Crypt 3",
      "Crypt 4",
      "Crypt 5",
      "Crypt 6",
      "Crypt 7",
      "Crypt 8",
      "Land Sphere Rooms",
      "Subterranean Sphere Rooms",
      "Sea Sphere Rooms",
      "Sky Sphere Rooms",
      "Dirth's Lair",
  };
  return (area < 0x11) ? names[area] : "Unknown Area";
}

vector<Chest> parse_chest_table(const string& data, size_t offset, size_t count) {
  size_t available = (offset < data.size()) ? (data.size() - offset) : 0;
  if (available < count * CHEST_SIZE) {
    throw short_table(offset, count, available);
  }

  phosg::StringReader r(data.data() + offset, count * CHEST_SIZE);
  vector<Chest> ret;
  while (!r.eof()) {
    auto& chest = ret.emplace_back();
    chest.item_id = r.get_u8();
    chest.arg = r.get_u8();
    chest.text = r.get_u8();
    chest.unknown = r.get_u8();
  }
  return ret;
}

string serialize_chest_table(const vector<Chest>& chests) {
  phosg::StringWriter w;
  for (const auto& chest : chests) {
    w.put_u8(chest.item_id);
    w.put_u8(chest.arg);
    w.put_u8(chest.text);
    w.put_u8(chest.unknown);
  }
  return std::move(w.str());
}

} // namespace NeutopiaRando
