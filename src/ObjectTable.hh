#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

namespace NeutopiaRando {

// Location and ID of something placed in a room. On disk this is two bytes:
// the location (x in the low nybble, y in the high nybble), then the ID.
struct ObjectInfo {
  uint8_t x;
  uint8_t y;
  uint8_t id;

  bool operator==(const ObjectInfo& other) const;
  std::string str() const;
};

// One record in a room's object table. Every record is a one-byte tag followed
// by a payload whose size depends only on the tag. The payload kinds are:
// - NONE: no payload
// - BYTE: one argument byte (usually a door direction)
// - OBJECT: an ObjectInfo
// - RAW: a fixed number of bytes we don't understand yet
struct TableEntry {
  enum class Type : uint8_t {
    OBJECT = 0x00,
    OPEN_DOOR = 0x01,
    PUSH_BLOCK_GATED_DOOR = 0x02,
    ENEMY_GATED_DOOR = 0x03,
    BOMBABLE_DOOR = 0x05,
    PUSH_BLOCK_GATED_OBJECT = 0x06,
    ENEMY_GATED_OBJECT = 0x07,
    BELL_GATED_OBJECT = 0x08,
    DARK_ROOM = 0x09,
    BOSS_DOOR = 0x0A,
    UNKNOWN_0B = 0x0B, // Marks the following record as conditional
    BURNABLE = 0x0C,
    HIDDEN_ROOM = 0x0D,
    FALCON_BOOTS_NEEDED = 0x81,
    NPC = 0x9A,
    OUCH_ROPE = 0xBD,
    ARROW_LAUNCHER = 0xBF,
    SWORDS = 0xC0,
    GHOST_SPAWNER = 0xC1,
    FIREBALL_SPAWNER = 0xC6,
    SHOP_ITEM = 0xDA,
    UNKNOWN_E1 = 0xE1,
    UNKNOWN_F4 = 0xF4,
  };

  enum class PayloadKind {
    NONE = 0,
    BYTE,
    OBJECT,
    RAW,
  };

  struct TypeInfo {
    Type type;
    PayloadKind kind;
    size_t payload_size;
    const char* name;
  };

  // Returns nullptr if the tag isn't a known record type.
  static const TypeInfo* info_for_tag(uint8_t tag);
  static const TypeInfo& info_for_type(Type type);
  static const std::vector<TypeInfo>& all_types();

  Type type;
  std::string payload;

  static TableEntry make(Type type);
  static TableEntry make(Type type, uint8_t arg);
  static TableEntry make(Type type, const ObjectInfo& info);
  static TableEntry make(Type type, const std::string& raw_payload);

  const TypeInfo& info() const;
  bool has_object_info() const;
  ObjectInfo object_info() const;
  void set_object_info(const ObjectInfo& info);
  uint8_t arg() const;

  // Returns the chest table slot this record refers to, or -1 if this isn't
  // a plain object whose ID is one of the chest IDs (0x4C-0x53).
  int chest_index() const;
  // True if this record marks the next record as depending on game state.
  bool is_conditional() const;

  size_t size() const;
  std::string str() const;

  bool operator==(const TableEntry& other) const;
  bool operator!=(const TableEntry& other) const;
};

constexpr uint8_t CHEST_OBJECT_ID_BASE = 0x4C;
constexpr uint8_t TABLE_TERMINATOR = 0xFF;

// Parses one record from the front of the data. Throws unknown_tag if the tag
// isn't recognized, or short_read if the payload is truncated. Returns the
// record and the number of bytes consumed.
std::pair<TableEntry, size_t> parse_table_entry(const void* data, size_t size);
std::pair<TableEntry, size_t> parse_table_entry(const std::string& data);

// Parses records until the input is exhausted. Throws trailing_bytes if
// anything (including a terminator) is left that doesn't parse.
std::vector<TableEntry> parse_object_table(const void* data, size_t size);
std::vector<TableEntry> parse_object_table(const std::string& data);

// Returns the number of bytes occupied by the records at the front of the
// data, not including the terminator. The records must be followed by either
// the end of the data or a 0xFF byte; anything else throws trailing_bytes.
size_t object_table_length(const void* data, size_t size);
size_t object_table_length(const std::string& data);

// Neither of these appends a terminator.
std::string serialize_table_entry(const TableEntry& entry);
std::string serialize_object_table(const std::vector<TableEntry>& entries);

} // namespace NeutopiaRando
