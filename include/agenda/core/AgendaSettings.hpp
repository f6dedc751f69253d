#pragma once

#include "agenda/layout/AgendaLayoutConfig.hpp"

class QSettings;

namespace agenda {
namespace core {

// Persists the agenda sizing and formatting knobs under the "agenda/" group.
class AgendaSettings
{
public:
    static layout::AgendaLayoutConfig load(QSettings &settings);
    static void save(QSettings &settings, const layout::AgendaLayoutConfig &config);
};

} // namespace core
} // namespace agenda
