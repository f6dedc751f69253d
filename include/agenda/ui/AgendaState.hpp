#pragma once

#include <QColor>
#include <QDate>
#include <QFont>
#include <functional>
#include <memory>

#include "agenda/data/Appointment.hpp"
#include "agenda/layout/AgendaLayoutConfig.hpp"

class QWidget;

namespace agenda {
namespace ui {

// Builds the content shown in place of the default appointment painting.
// The returned widget is reparented to the agenda viewport, sized to the slot
// and owned by the view until the next layout pass.
using AppointmentBuilder =
    std::function<QWidget *(QWidget *parent, const QDate &selectedDate, const data::Appointment &appointment)>;

struct AgendaStyle
{
    AgendaStyle();

    QFont appointmentFont;
    QColor appointmentTextColor = Qt::white;
    QFont placeholderFont;
    QColor placeholderTextColor = Qt::gray;
    QColor backgroundColor = Qt::white;
    QFont dayFont;
    QFont dateFont;
    QColor dayTextColor = QColor(0x5f, 0x63, 0x68);
    QColor todayHighlightColor = QColor(0xee, 0x44, 0x4d);
    QColor todayTextColor = Qt::white;

    bool operator==(const AgendaStyle &other) const;
    bool operator!=(const AgendaStyle &other) const { return !(*this == other); }
};

// Snapshot of everything the agenda view renders from.
struct AgendaState
{
    QDate selectedDate;
    data::AppointmentList appointments;
    layout::AgendaLayoutConfig config;
    AgendaStyle style;
    std::shared_ptr<const AppointmentBuilder> builder;
};

enum class AgendaUpdate
{
    None,
    Repaint,
    Relayout
};

AgendaUpdate diffAgendaState(const AgendaState &previous, const AgendaState &next);

} // namespace ui
} // namespace agenda
