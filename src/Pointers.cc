#include "Pointers.hh"

#include <string.h>

#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;

namespace NeutopiaRando {

uint32_t decode_pointer(const void* data) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data);
  uint32_t raw = (static_cast<uint32_t>(bytes[0]) << 13) |
      (static_cast<uint32_t>(bytes[2] & 0x1F) << 8) |
      static_cast<uint32_t>(bytes[1]);
  if (raw < POINTER_BASE) {
    throw invalid_pointer(raw);
  }
  return raw - POINTER_BASE;
}

uint32_t decode_pointer(const string& data, size_t offset) {
  if ((offset > data.size()) || (data.size() - offset < POINTER_SIZE)) {
    throw short_read(offset, POINTER_SIZE, (offset > data.size()) ? 0 : (data.size() - offset));
  }
  return decode_pointer(data.data() + offset);
}

void encode_pointer(void* dest, uint32_t offset) {
  uint32_t raw = offset + POINTER_BASE;
  uint8_t* bytes = reinterpret_cast<uint8_t*>(dest);
  bytes[0] = raw >> 13;
  bytes[1] = raw & 0xFF;
  bytes[2] = 0x40 | ((raw >> 8) & 0x1F);
}

string encode_pointer(uint32_t offset) {
  string ret(POINTER_SIZE, '\0');
  encode_pointer(ret.data(), offset);
  return ret;
}

vector<uint32_t> decode_pointer_table(const void* data, size_t size, size_t count) {
  if (size < count * POINTER_SIZE) {
    throw short_read(0, count * POINTER_SIZE, size);
  }

  phosg::StringReader r(data, size);
  vector<uint32_t> ret;
  ret.reserve(count);
  for (size_t z = 0; z < count; z++) {
    ret.emplace_back(decode_pointer(r.getv(POINTER_SIZE)));
  }
  return ret;
}

vector<uint32_t> decode_pointer_table(const string& data, size_t offset, size_t count) {
  if (offset > data.size()) {
    throw short_read(offset, count * POINTER_SIZE, 0);
  }
  try {
    return decode_pointer_table(data.data() + offset, data.size() - offset, count);
  } catch (format_error& e) {
    e.add_context(std::format("pointer table at {:X}", offset));
    throw;
  }
}

} // namespace NeutopiaRando
