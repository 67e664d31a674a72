#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

namespace NeutopiaRando {

// ROM pointers are 3 bytes: the bank number, then the low and high bytes of
// the CPU address within the bank's window. The high byte carries the window
// select bits (0x40) which we mask off when decoding and restore when
// encoding. Decoded values are file offsets into the unheadered ROM.
constexpr uint32_t POINTER_BASE = 0x40000;
constexpr size_t POINTER_SIZE = 3;

// Throws invalid_pointer if the raw value is below POINTER_BASE.
uint32_t decode_pointer(const void* data);
// Reads a pointer at `offset` within `data`. Throws short_read if fewer than
// three bytes are available there.
uint32_t decode_pointer(const std::string& data, size_t offset);

std::string encode_pointer(uint32_t offset);
void encode_pointer(void* dest, uint32_t offset);

// Throws short_read if `size` < count * 3.
std::vector<uint32_t> decode_pointer_table(const void* data, size_t size, size_t count);
std::vector<uint32_t> decode_pointer_table(const std::string& data, size_t offset, size_t count);

} // namespace NeutopiaRando
