#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace NeutopiaRando {

// Growable output image with a single write cursor. Writing or seeking past
// the end extends the image with zeroes.
class RomWriter {
public:
  explicit RomWriter(std::string&& data);
  explicit RomWriter(const std::string& data);
  ~RomWriter() = default;

  inline size_t where() const {
    return this->offset;
  }
  inline size_t size() const {
    return this->data.size();
  }

  void go(size_t offset);
  void write(const void* data, size_t size);
  void write(const std::string& data);
  void put_u8(uint8_t v);

  // Overwrites a pointer at `offset` without moving the cursor.
  void patch_pointer(size_t offset, uint32_t value);

  // Returns the image and leaves the writer empty.
  std::string release();

private:
  std::string data;
  size_t offset;

  void reserve_through(size_t end_offset);
};

} // namespace NeutopiaRando
