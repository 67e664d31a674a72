#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

namespace NeutopiaRando {

struct IPSRecord {
  uint32_t offset;
  std::string data;
};

// Parses an IPS patch: "PATCH", then records of (u24be offset, u16be size,
// data), then "EOF". A record of size 0 is an RLE record: u16be count and a
// fill byte. Throws invalid_patch if the stream is malformed.
std::vector<IPSRecord> parse_ips_patch(const std::string& patch);

// Writes past the end of the buffer extend it.
void apply_ips_patch(std::string& buffer, const std::string& patch);

struct NamedPatch {
  std::string name;
  std::string data;
};

// The gameplay patches, in the order they must be applied.
const std::vector<const char*>& standard_patch_names();

// Loads <dir>/<name>.ips for each of the standard patches.
std::vector<NamedPatch> load_standard_patches(const std::string& dir);

void apply_patches(std::string& buffer, const std::vector<NamedPatch>& patches);

} // namespace NeutopiaRando
