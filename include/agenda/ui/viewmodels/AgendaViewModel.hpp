#pragma once

#include <QDate>
#include <QObject>

#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace data {
class AppointmentRepository;
}

namespace ui {

class AgendaViewModel : public QObject
{
    Q_OBJECT

public:
    AgendaViewModel(data::AppointmentRepository &repository, QObject *parent = nullptr);

    void setSelectedDate(const QDate &date);
    QDate selectedDate() const { return m_selectedDate; }
    void refresh();
    const data::AppointmentList &appointments() const;

signals:
    void appointmentsChanged(const QDate &date, const agenda::data::AppointmentList &appointments);

private:
    data::AppointmentRepository &m_repository;
    QDate m_selectedDate;
    data::AppointmentList m_appointments;
};

} // namespace ui
} // namespace agenda
