#include "Loggers.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

using namespace std;

namespace NeutopiaRando {

phosg::PrefixedLogger rom_log("[Rom] ", phosg::LogLevel::L_USE_DEFAULT);
phosg::PrefixedLogger rando_log("[Rando] ", phosg::LogLevel::L_USE_DEFAULT);

void set_all_log_levels(phosg::LogLevel level) {
  rom_log.min_level = level;
  rando_log.min_level = level;
}

void set_all_log_levels(const string& level_name) {
  phosg::LogLevel level;
  try {
    level = phosg::enum_for_name<phosg::LogLevel>(phosg::toupper(level_name).c_str());
  } catch (const exception&) {
    throw invalid_argument(std::format("unknown log level: {}", level_name));
  }
  set_all_log_levels(level);
}

} // namespace NeutopiaRando
