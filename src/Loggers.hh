#pragma once

#include <phosg/Strings.hh>
#include <string>

namespace NeutopiaRando {

extern phosg::PrefixedLogger rom_log;
extern phosg::PrefixedLogger rando_log;

void set_all_log_levels(phosg::LogLevel level);
// Accepts any LogLevel name (e.g. "debug" or "WARNING"); throws
// invalid_argument if the name isn't recognized.
void set_all_log_levels(const std::string& level_name);

} // namespace NeutopiaRando
