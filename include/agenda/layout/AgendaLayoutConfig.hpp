#pragma once

#include <QString>

namespace agenda {
namespace layout {

struct AgendaLayoutConfig
{
    double width = 0.0;
    double height = 0.0;
    double textScaleFactor = 1.0;
    double appointmentHeight = 60.0;
    double allDayAppointmentHeight = 50.0;
    double padding = 5.0;
    double timeLabelWidth = 60.0;
    QString timeTextFormat; // empty selects the same-day / cross-day defaults
    QString localeName = QStringLiteral("en");
    // Wide layouts give all-day and spanning items the timed height.
    bool largerScheduleLayout = false;
};

} // namespace layout
} // namespace agenda
