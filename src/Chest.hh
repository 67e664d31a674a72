#pragma once

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <string>
#include <vector>

namespace NeutopiaRando {

enum ItemID : uint8_t {
  BOMBS = 0x00,
  MEDICINE = 0x01,
  FIRE_WAND = 0x02,
  SKY_BELL = 0x03,
  WINGS = 0x04,
  MOONBEAM_MOSS = 0x05,
  MAGIC_RING = 0x06,
  SWORD = 0x08,
  ARMOR = 0x09,
  SHIELD = 0x0A,
  FALCON_SHOES = 0x0B,
  RAINBOW_DROP = 0x0C,
  BOOK_OF_REVIVAL = 0x0D,
  CRYSTAL_BALL = 0x10,
  CRYPT_KEY = 0x11,
  MEDALLION_BASE = 0x12, // Crypt N's medallion is MEDALLION_BASE + N - 1
};

constexpr size_t NUM_MEDALLIONS = 8;
constexpr size_t CHEST_SIZE = 4;

struct Chest {
  uint8_t item_id;
  uint8_t arg; // Bomb count or equipment tier
  uint8_t text;
  uint8_t unknown;

  bool is_medallion() const;
  std::string name() const;
  std::string str() const;

  bool operator==(const Chest& other) const;
  bool operator!=(const Chest& other) const;
  bool operator<(const Chest& other) const;
};

struct ChestHash {
  size_t operator()(const Chest& chest) const;
};

const char* area_name(uint8_t area);

// Parses exactly `count` chests. Throws short_table if there isn't enough
// data for all of them.
std::vector<Chest> parse_chest_table(const std::string& data, size_t offset, size_t count);
std::string serialize_chest_table(const std::vector<Chest>& chests);

} // namespace NeutopiaRando
