#include "agenda/core/AgendaSettings.hpp"

#include <QSettings>
#include <QtGlobal>

#include "agenda/core/Logging.hpp"
#include "agenda/ui/AgendaLocalization.hpp"

namespace agenda {
namespace core {

namespace {
constexpr double MinItemHeight = 10.0;
constexpr double MaxItemHeight = 400.0;
constexpr double MinTextScale = 0.5;
constexpr double MaxTextScale = 3.0;
constexpr double MaxTimeLabelWidth = 200.0;
} // namespace

layout::AgendaLayoutConfig AgendaSettings::load(QSettings &settings)
{
    layout::AgendaLayoutConfig config;
    const double appointmentHeight =
        settings.value(QStringLiteral("agenda/appointmentHeight"), config.appointmentHeight).toDouble();
    config.appointmentHeight = qBound(MinItemHeight, appointmentHeight, MaxItemHeight);
    const double allDayHeight =
        settings.value(QStringLiteral("agenda/allDayAppointmentHeight"), config.allDayAppointmentHeight).toDouble();
    config.allDayAppointmentHeight = qBound(MinItemHeight, allDayHeight, MaxItemHeight);
    const double scale = settings.value(QStringLiteral("agenda/textScaleFactor"), config.textScaleFactor).toDouble();
    config.textScaleFactor = qBound(MinTextScale, scale, MaxTextScale);
    const double labelWidth = settings.value(QStringLiteral("agenda/timeLabelWidth"), config.timeLabelWidth).toDouble();
    config.timeLabelWidth = qBound(0.0, labelWidth, MaxTimeLabelWidth);
    config.timeTextFormat = settings.value(QStringLiteral("agenda/timeTextFormat")).toString();
    config.largerScheduleLayout = settings.value(QStringLiteral("agenda/largerScheduleLayout"), false).toBool();

    const QString locale = settings.value(QStringLiteral("agenda/locale"), config.localeName).toString();
    if (ui::AgendaLocalization::isSupported(locale)) {
        config.localeName = locale;
    } else {
        qCWarning(lcAgendaLocale) << "ignoring unsupported stored locale" << locale;
    }
    return config;
}

void AgendaSettings::save(QSettings &settings, const layout::AgendaLayoutConfig &config)
{
    settings.setValue(QStringLiteral("agenda/appointmentHeight"), config.appointmentHeight);
    settings.setValue(QStringLiteral("agenda/allDayAppointmentHeight"), config.allDayAppointmentHeight);
    settings.setValue(QStringLiteral("agenda/textScaleFactor"), config.textScaleFactor);
    settings.setValue(QStringLiteral("agenda/timeLabelWidth"), config.timeLabelWidth);
    settings.setValue(QStringLiteral("agenda/timeTextFormat"), config.timeTextFormat);
    settings.setValue(QStringLiteral("agenda/largerScheduleLayout"), config.largerScheduleLayout);
    settings.setValue(QStringLiteral("agenda/locale"), config.localeName);
}

} // namespace core
} // namespace agenda
