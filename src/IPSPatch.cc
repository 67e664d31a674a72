#include "IPSPatch.hh"

#include <string.h>

#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>

#include "Errors.hh"
#include "Loggers.hh"

using namespace std;

namespace NeutopiaRando {

static constexpr uint32_t IPS_EOF_MARKER = 0x454F46; // "EOF"

vector<IPSRecord> parse_ips_patch(const string& patch) {
  if ((patch.size() < 5) || memcmp(patch.data(), "PATCH", 5)) {
    throw invalid_patch("patch does not begin with PATCH");
  }

  phosg::StringReader r(patch);
  r.skip(5);
  vector<IPSRecord> ret;
  try {
    for (;;) {
      uint32_t offset = r.get_u24b();
      if (offset == IPS_EOF_MARKER) {
        break;
      }
      auto& record = ret.emplace_back();
      record.offset = offset;
      uint16_t size = r.get_u16b();
      if (size == 0) {
        uint16_t count = r.get_u16b();
        uint8_t fill = r.get_u8();
        record.data.assign(count, static_cast<char>(fill));
      } else {
        if (r.remaining() < size) {
          throw out_of_range("record data extends beyond end of patch");
        }
        record.data = r.read(size);
      }
    }
  } catch (const out_of_range&) {
    throw invalid_patch(std::format("patch is truncated at offset {:X}", r.where()));
  }
  // Some tools append a 3-byte truncation size after the EOF marker; we don't
  // support truncation, so anything left is ignored
  if (!r.eof()) {
    rom_log.debug_f("Ignoring {} bytes after the end of the patch", r.remaining());
  }
  return ret;
}

void apply_ips_patch(string& buffer, const string& patch) {
  for (const auto& record : parse_ips_patch(patch)) {
    size_t end_offset = record.offset + record.data.size();
    if (end_offset > buffer.size()) {
      buffer.resize(end_offset, '\0');
    }
    memcpy(buffer.data() + record.offset, record.data.data(), record.data.size());
  }
}

const vector<const char*>& standard_patch_names() {
  static const vector<const char*> names({
      "expand-save-state",
      "intro-skip",
      "no-downgrade",
      "open-stairs",
      "text-speedup",
  });
  return names;
}

vector<NamedPatch> load_standard_patches(const string& dir) {
  vector<NamedPatch> ret;
  for (const char* name : standard_patch_names()) {
    auto& patch = ret.emplace_back();
    patch.name = name;
    patch.data = phosg::load_file(std::format("{}/{}.ips", dir, name));
  }
  return ret;
}

void apply_patches(string& buffer, const vector<NamedPatch>& patches) {
  for (const auto& patch : patches) {
    try {
      apply_ips_patch(buffer, patch.data);
    } catch (format_error& e) {
      e.add_context(std::format("patch {}", patch.name));
      throw;
    }
    rom_log.info_f("Applied patch {}", patch.name);
  }
}

} // namespace NeutopiaRando
