#pragma once

#include <QColor>
#include <QDateTime>
#include <QString>
#include <QUuid>
#include <memory>
#include <vector>

namespace agenda {
namespace data {

struct Appointment
{
    QUuid id = QUuid::createUuid();
    QString subject;
    QString notes;
    QString location;
    QDateTime start;
    QDateTime end;
    bool allDay = false;
    bool spanned = false; // set by the scheduling layer for multi-day occurrences
    QString recurrenceRule; // RFC5545 RRULE string
    QUuid recurrenceId;     // series id when this is a changed occurrence
    QColor color = QColor(0x1e, 0x90, 0xff);
};

// Null means "no data", which is distinct from an empty day.
using AppointmentList = std::shared_ptr<const std::vector<Appointment>>;

bool isSpanned(const Appointment &appointment);
bool isRecurring(const Appointment &appointment);
bool isRecurrenceInstance(const Appointment &appointment);

AppointmentList makeAppointmentList(std::vector<Appointment> appointments);

} // namespace data
} // namespace agenda
