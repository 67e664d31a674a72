#pragma once

#include <stddef.h>
#include <stdint.h>

#include <stdexcept>
#include <string>

namespace NeutopiaRando {

// Raised when ROM bytes don't match the layout we expect. The context string
// grows as the exception propagates outward (e.g. the room coordinates are
// appended by the code that walks the room tables).
class format_error : public std::runtime_error {
public:
  explicit format_error(const std::string& message);
  ~format_error() = default;

  void add_context(const std::string& context);
  virtual const char* what() const noexcept;

  inline const std::string& message() const {
    return this->base_message;
  }

private:
  std::string base_message;
  std::string full_message;
};

class invalid_pointer : public format_error {
public:
  explicit invalid_pointer(uint32_t raw_value);
  uint32_t raw_value;
};

class short_read : public format_error {
public:
  short_read(size_t offset, size_t needed, size_t available);
};

class unknown_tag : public format_error {
public:
  unknown_tag(uint8_t tag);
  uint8_t tag;
};

class trailing_bytes : public format_error {
public:
  explicit trailing_bytes(const std::string& remainder);
};

class truncated_rom : public format_error {
public:
  truncated_rom(size_t offset, size_t size);
};

class short_table : public format_error {
public:
  short_table(size_t offset, size_t expected_entries, size_t available_bytes);
};

class invalid_patch : public format_error {
public:
  explicit invalid_patch(const std::string& message);
};

// Raised when the caller's (or the catalog's) view of the game disagrees
// with itself. These indicate bugs, not bad input.
class consistency_error : public std::logic_error {
public:
  explicit consistency_error(const std::string& message);
};

class incoherent_chest : public consistency_error {
public:
  incoherent_chest(uint8_t area, uint8_t room, uint8_t index);
};

class duplicate_location : public consistency_error {
public:
  explicit duplicate_location(const std::string& message);
};

class unknown_location : public consistency_error {
public:
  explicit unknown_location(const std::string& message);
};

class unknown_item : public consistency_error {
public:
  explicit unknown_item(const std::string& message);
};

class area_lock_violation : public consistency_error {
public:
  explicit area_lock_violation(const std::string& message);
};

class placement_stalled : public consistency_error {
public:
  explicit placement_stalled(const std::string& message);
};

// Raised when the user gave us something we refuse to work with. The message
// should tell them what to supply instead.
class policy_error : public std::invalid_argument {
public:
  explicit policy_error(const std::string& message);
};

class invalid_rom_size : public policy_error {
public:
  explicit invalid_rom_size(size_t size);
};

class unrecognized_rom : public policy_error {
public:
  explicit unrecognized_rom(const std::string& md5_hash);
};

class unsupported_region : public policy_error {
public:
  explicit unsupported_region(const std::string& region_name);
};

class invalid_seed : public policy_error {
public:
  explicit invalid_seed(const std::string& seed);
};

} // namespace NeutopiaRando
