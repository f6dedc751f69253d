#include "agenda/ui/viewmodels/AgendaViewModel.hpp"

#include "agenda/data/AppointmentRepository.hpp"

namespace agenda {
namespace ui {

AgendaViewModel::AgendaViewModel(data::AppointmentRepository &repository, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
{
}

void AgendaViewModel::setSelectedDate(const QDate &date)
{
    if (date == m_selectedDate) {
        return;
    }
    m_selectedDate = date;
    refresh();
}

void AgendaViewModel::refresh()
{
    if (!m_selectedDate.isValid()) {
        m_appointments.reset();
    } else {
        m_appointments = data::makeAppointmentList(m_repository.appointmentsForDate(m_selectedDate));
    }
    emit appointmentsChanged(m_selectedDate, m_appointments);
}

const data::AppointmentList &AgendaViewModel::appointments() const
{
    return m_appointments;
}

} // namespace ui
} // namespace agenda
