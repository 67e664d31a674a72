#include "Errors.hh"

#include <format>
#include <phosg/Strings.hh>

using namespace std;

namespace NeutopiaRando {

format_error::format_error(const string& message)
    : runtime_error(message),
      base_message(message),
      full_message(message) {}

void format_error::add_context(const string& context) {
  this->full_message = context + ": " + this->full_message;
}

const char* format_error::what() const noexcept {
  return this->full_message.c_str();
}

invalid_pointer::invalid_pointer(uint32_t raw_value)
    : format_error(std::format("pointer value {:05X} is below the mapped bank window", raw_value)),
      raw_value(raw_value) {}

short_read::short_read(size_t offset, size_t needed, size_t available)
    : format_error(std::format("short read at {:X}: needed {:X} bytes but only {:X} are available",
          offset, needed, available)) {}

unknown_tag::unknown_tag(uint8_t tag)
    : format_error(std::format("unknown object table tag {:02X}", tag)),
      tag(tag) {}

trailing_bytes::trailing_bytes(const string& remainder)
    : format_error("unparsed input: " + phosg::format_data_string(remainder)) {}

truncated_rom::truncated_rom(size_t offset, size_t size)
    : format_error(std::format("offset {:X} is beyond the end of the ROM ({:X} bytes)", offset, size)) {}

short_table::short_table(size_t offset, size_t expected_entries, size_t available_bytes)
    : format_error(std::format("table at {:X} should have {} entries but only {:X} bytes remain",
          offset, expected_entries, available_bytes)) {}

invalid_patch::invalid_patch(const string& message)
    : format_error("invalid IPS patch: " + message) {}

consistency_error::consistency_error(const string& message)
    : logic_error(message) {}

incoherent_chest::incoherent_chest(uint8_t area, uint8_t room, uint8_t index)
    : consistency_error(std::format(
          "can't find chest {} in area {:02X} room {:02X}", index, area, room)) {}

duplicate_location::duplicate_location(const string& message)
    : consistency_error(message) {}

unknown_location::unknown_location(const string& message)
    : consistency_error(message) {}

unknown_item::unknown_item(const string& message)
    : consistency_error(message) {}

area_lock_violation::area_lock_violation(const string& message)
    : consistency_error(message) {}

placement_stalled::placement_stalled(const string& message)
    : consistency_error(message) {}

policy_error::policy_error(const string& message)
    : invalid_argument(message) {}

invalid_rom_size::invalid_rom_size(size_t size)
    : policy_error(std::format(
          "ROM size ({}) is neither the expected size of the headered ({}) nor the unheadered ({}) ROM",
          size, 384 * 1024 + 0x200, 384 * 1024)) {}

unrecognized_rom::unrecognized_rom(const string& md5_hash)
    : policy_error(std::format(
          "ROM with MD5 hash {} is unrecognized; please supply an unmodified Neutopia (U) image", md5_hash)) {}

unsupported_region::unsupported_region(const string& region_name)
    : policy_error(std::format("{} region ROM not supported; please use the NA ROM", region_name)) {}

invalid_seed::invalid_seed(const string& seed)
    : policy_error(std::format("seed \"{}\" must be a valid base-36 64-bit number", seed)) {}

} // namespace NeutopiaRando
