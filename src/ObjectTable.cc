#include "ObjectTable.hh"

#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Errors.hh"

using namespace std;

namespace NeutopiaRando {

bool ObjectInfo::operator==(const ObjectInfo& other) const {
  return (this->x == other.x) && (this->y == other.y) && (this->id == other.id);
}

string ObjectInfo::str() const {
  return std::format("{:02X} @ ({},{})", this->id, this->x, this->y);
}

using Type = TableEntry::Type;
using PayloadKind = TableEntry::PayloadKind;

static const vector<TableEntry::TypeInfo> TYPE_INFOS = {
    {Type::OBJECT, PayloadKind::OBJECT, 2, "object"},
    {Type::OPEN_DOOR, PayloadKind::BYTE, 1, "open door"},
    {Type::PUSH_BLOCK_GATED_DOOR, PayloadKind::BYTE, 1, "push block gated door"},
    {Type::ENEMY_GATED_DOOR, PayloadKind::BYTE, 1, "enemy gated door"},
    {Type::BOMBABLE_DOOR, PayloadKind::BYTE, 1, "bombable door"},
    {Type::PUSH_BLOCK_GATED_OBJECT, PayloadKind::OBJECT, 2, "push block gated object"},
    {Type::ENEMY_GATED_OBJECT, PayloadKind::OBJECT, 2, "enemy gated object"},
    {Type::BELL_GATED_OBJECT, PayloadKind::OBJECT, 2, "bell gated object"},
    {Type::DARK_ROOM, PayloadKind::NONE, 0, "dark room"},
    {Type::BOSS_DOOR, PayloadKind::BYTE, 1, "boss door"},
    {Type::UNKNOWN_0B, PayloadKind::RAW, 3, "unknown object 0B"},
    {Type::BURNABLE, PayloadKind::OBJECT, 2, "burnable"},
    {Type::HIDDEN_ROOM, PayloadKind::RAW, 3, "hidden room"},
    {Type::FALCON_BOOTS_NEEDED, PayloadKind::NONE, 0, "falcon boots needed"},
    {Type::NPC, PayloadKind::RAW, 5, "npc"},
    {Type::OUCH_ROPE, PayloadKind::OBJECT, 2, "ouch rope segment"},
    {Type::ARROW_LAUNCHER, PayloadKind::OBJECT, 2, "arrow launcher"},
    {Type::SWORDS, PayloadKind::OBJECT, 2, "swords"},
    {Type::GHOST_SPAWNER, PayloadKind::OBJECT, 2, "ghost spawner"},
    {Type::FIREBALL_SPAWNER, PayloadKind::OBJECT, 2, "fireball spawner"},
    {Type::SHOP_ITEM, PayloadKind::RAW, 7, "shop item"},
    {Type::UNKNOWN_E1, PayloadKind::RAW, 9, "unknown object E1"},
    {Type::UNKNOWN_F4, PayloadKind::RAW, 5, "unknown object F4"},
};

static const vector<const TableEntry::TypeInfo*>& type_infos_by_tag() {
  static const vector<const TableEntry::TypeInfo*> ret = []() {
    vector<const TableEntry::TypeInfo*> ret(0x100, nullptr);
    for (const auto& info : TYPE_INFOS) {
      ret[static_cast<uint8_t>(info.type)] = &info;
    }
    return ret;
  }();
  return ret;
}

const TableEntry::TypeInfo* TableEntry::info_for_tag(uint8_t tag) {
  return type_infos_by_tag()[tag];
}

const TableEntry::TypeInfo& TableEntry::info_for_type(Type type) {
  const auto* info = type_infos_by_tag()[static_cast<uint8_t>(type)];
  if (!info) {
    throw logic_error(std::format("no type info for table entry type {:02X}", static_cast<uint8_t>(type)));
  }
  return *info;
}

const vector<TableEntry::TypeInfo>& TableEntry::all_types() {
  return TYPE_INFOS;
}

TableEntry TableEntry::make(Type type) {
  const auto& info = info_for_type(type);
  return TableEntry{type, string(info.payload_size, '\0')};
}

TableEntry TableEntry::make(Type type, uint8_t arg) {
  const auto& info = info_for_type(type);
  if (info.kind != PayloadKind::BYTE) {
    throw logic_error(std::format("{} does not take a byte argument", info.name));
  }
  return TableEntry{type, string(1, static_cast<char>(arg))};
}

TableEntry TableEntry::make(Type type, const ObjectInfo& object) {
  TableEntry ret = TableEntry::make(type);
  ret.set_object_info(object);
  return ret;
}

TableEntry TableEntry::make(Type type, const string& raw_payload) {
  const auto& info = info_for_type(type);
  if (raw_payload.size() != info.payload_size) {
    throw logic_error(std::format("{} payload must be {} bytes; got {}",
        info.name, info.payload_size, raw_payload.size()));
  }
  return TableEntry{type, raw_payload};
}

const TableEntry::TypeInfo& TableEntry::info() const {
  return info_for_type(this->type);
}

bool TableEntry::has_object_info() const {
  return this->info().kind == PayloadKind::OBJECT;
}

ObjectInfo TableEntry::object_info() const {
  if (!this->has_object_info()) {
    throw logic_error(std::format("{} has no object info", this->info().name));
  }
  uint8_t loc = this->payload.at(0);
  return ObjectInfo{
      .x = static_cast<uint8_t>(loc & 0x0F),
      .y = static_cast<uint8_t>(loc >> 4),
      .id = static_cast<uint8_t>(this->payload.at(1))};
}

void TableEntry::set_object_info(const ObjectInfo& object) {
  if (!this->has_object_info()) {
    throw logic_error(std::format("{} has no object info", this->info().name));
  }
  this->payload.resize(2);
  this->payload[0] = static_cast<char>((object.x & 0x0F) | ((object.y & 0x0F) << 4));
  this->payload[1] = static_cast<char>(object.id);
}

uint8_t TableEntry::arg() const {
  if (this->info().kind != PayloadKind::BYTE) {
    throw logic_error(std::format("{} has no argument byte", this->info().name));
  }
  return this->payload.at(0);
}

int TableEntry::chest_index() const {
  if (this->type != Type::OBJECT) {
    return -1;
  }
  uint8_t id = this->payload.at(1);
  if ((id < CHEST_OBJECT_ID_BASE) || (id >= CHEST_OBJECT_ID_BASE + 8)) {
    return -1;
  }
  return id - CHEST_OBJECT_ID_BASE;
}

bool TableEntry::is_conditional() const {
  return this->type == Type::UNKNOWN_0B;
}

size_t TableEntry::size() const {
  return 1 + this->payload.size();
}

string TableEntry::str() const {
  const auto& info = this->info();
  switch (info.kind) {
    case PayloadKind::NONE:
      return info.name;
    case PayloadKind::BYTE:
      return std::format("{} {:02X}", info.name, this->arg());
    case PayloadKind::OBJECT:
      return std::format("{} {}", info.name, this->object_info().str());
    case PayloadKind::RAW:
      return std::format("{} [{}]", info.name, phosg::format_data_string(this->payload));
  }
  throw logic_error("invalid payload kind");
}

bool TableEntry::operator==(const TableEntry& other) const {
  return (this->type == other.type) && (this->payload == other.payload);
}

bool TableEntry::operator!=(const TableEntry& other) const {
  return !this->operator==(other);
}

pair<TableEntry, size_t> parse_table_entry(const void* data, size_t size) {
  phosg::StringReader r(data, size);
  if (r.eof()) {
    throw short_read(0, 1, 0);
  }
  uint8_t tag = r.get_u8();
  const auto* info = TableEntry::info_for_tag(tag);
  if (!info) {
    throw unknown_tag(tag);
  }
  if (r.remaining() < info->payload_size) {
    throw short_read(1, info->payload_size, r.remaining());
  }
  TableEntry entry{info->type, r.read(info->payload_size)};
  return make_pair(std::move(entry), r.where());
}

pair<TableEntry, size_t> parse_table_entry(const string& data) {
  return parse_table_entry(data.data(), data.size());
}

// Parses as many records as possible, stopping at the first byte that isn't a
// known tag or at a record that would run past the end of the data. Returns
// the number of bytes consumed.
static size_t parse_records(vector<TableEntry>* entries, const void* data, size_t size) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data);
  size_t offset = 0;
  while (offset < size) {
    const auto* info = TableEntry::info_for_tag(bytes[offset]);
    if (!info || (size - offset - 1 < info->payload_size)) {
      break;
    }
    if (entries) {
      entries->emplace_back(TableEntry{info->type,
          string(reinterpret_cast<const char*>(bytes + offset + 1), info->payload_size)});
    }
    offset += 1 + info->payload_size;
  }
  return offset;
}

static string describe_remainder(const void* data, size_t size, size_t offset) {
  size_t count = min<size_t>(size - offset, 0x10);
  return string(reinterpret_cast<const char*>(data) + offset, count);
}

vector<TableEntry> parse_object_table(const void* data, size_t size) {
  vector<TableEntry> ret;
  size_t consumed = parse_records(&ret, data, size);
  if (consumed != size) {
    throw trailing_bytes(describe_remainder(data, size, consumed));
  }
  return ret;
}

vector<TableEntry> parse_object_table(const string& data) {
  return parse_object_table(data.data(), data.size());
}

size_t object_table_length(const void* data, size_t size) {
  size_t consumed = parse_records(nullptr, data, size);
  if ((consumed != size) && (reinterpret_cast<const uint8_t*>(data)[consumed] != TABLE_TERMINATOR)) {
    throw trailing_bytes(describe_remainder(data, size, consumed));
  }
  return consumed;
}

size_t object_table_length(const string& data) {
  return object_table_length(data.data(), data.size());
}

string serialize_table_entry(const TableEntry& entry) {
  const auto& info = entry.info();
  if (entry.payload.size() != info.payload_size) {
    throw logic_error(std::format("{} has a {}-byte payload; expected {} bytes",
        info.name, entry.payload.size(), info.payload_size));
  }
  phosg::StringWriter w;
  w.put_u8(static_cast<uint8_t>(entry.type));
  w.write(entry.payload);
  return std::move(w.str());
}

string serialize_object_table(const vector<TableEntry>& entries) {
  phosg::StringWriter w;
  for (const auto& entry : entries) {
    w.write(serialize_table_entry(entry));
  }
  return std::move(w.str());
}

} // namespace NeutopiaRando
