// Config persistence on top of QSettings.
#pragma once
#include "SessionTypes.hpp"

class QSettings;

namespace rdpvisor {

// Reads Connection/, Vault/, Client/, Picker/ and Automation/ keys. Missing
// keys keep their defaults, out-of-range values are clamped.
Config loadConfig(QSettings &s);
void saveConfig(QSettings &s, const Config &cfg);

// Application-wide settings store ("RdpVisor", "RdpVisor").
Config loadDefaultConfig();

} // namespace rdpvisor
