#include "RomWriter.hh"

#include <string.h>

#include "Pointers.hh"

using namespace std;

namespace NeutopiaRando {

RomWriter::RomWriter(string&& data)
    : data(std::move(data)),
      offset(0) {}

RomWriter::RomWriter(const string& data)
    : data(data),
      offset(0) {}

void RomWriter::reserve_through(size_t end_offset) {
  if (end_offset > this->data.size()) {
    this->data.resize(end_offset, '\0');
  }
}

void RomWriter::go(size_t offset) {
  this->reserve_through(offset);
  this->offset = offset;
}

void RomWriter::write(const void* data, size_t size) {
  this->reserve_through(this->offset + size);
  memcpy(this->data.data() + this->offset, data, size);
  this->offset += size;
}

void RomWriter::write(const string& data) {
  this->write(data.data(), data.size());
}

void RomWriter::put_u8(uint8_t v) {
  this->write(&v, 1);
}

void RomWriter::patch_pointer(size_t offset, uint32_t value) {
  this->reserve_through(offset + POINTER_SIZE);
  encode_pointer(this->data.data() + offset, value);
}

string RomWriter::release() {
  string ret = std::move(this->data);
  this->data.clear();
  this->offset = 0;
  return ret;
}

} // namespace NeutopiaRando
