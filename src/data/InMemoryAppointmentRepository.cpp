#include "agenda/data/InMemoryAppointmentRepository.hpp"

#include <algorithm>

namespace agenda {
namespace data {

InMemoryAppointmentRepository::InMemoryAppointmentRepository() = default;
InMemoryAppointmentRepository::~InMemoryAppointmentRepository() = default;

std::vector<Appointment> InMemoryAppointmentRepository::appointmentsForDate(const QDate &date) const
{
    std::vector<Appointment> appointments;
    if (!date.isValid()) {
        return appointments;
    }
    for (const auto &appointment : m_appointments) {
        if (appointment.end.date() < date || appointment.start.date() > date) {
            continue;
        }
        appointments.push_back(appointment);
    }
    return appointments;
}

std::optional<Appointment> InMemoryAppointmentRepository::findById(const QUuid &id) const
{
    const auto it = find(id);
    if (it == m_appointments.end()) {
        return std::nullopt;
    }
    return *it;
}

Appointment InMemoryAppointmentRepository::addAppointment(Appointment appointment)
{
    if (appointment.id.isNull()) {
        appointment.id = QUuid::createUuid();
    }
    if (!appointment.end.isValid() || appointment.end < appointment.start) {
        appointment.end = appointment.start.addSecs(30 * 60);
    }
    const auto it = find(appointment.id);
    if (it != m_appointments.end()) {
        *it = appointment;
    } else {
        m_appointments.push_back(appointment);
    }
    return appointment;
}

bool InMemoryAppointmentRepository::updateAppointment(const Appointment &appointment)
{
    const auto it = find(appointment.id);
    if (it == m_appointments.end()) {
        return false;
    }
    *it = appointment;
    return true;
}

bool InMemoryAppointmentRepository::removeAppointment(const QUuid &id)
{
    const auto it = find(id);
    if (it == m_appointments.end()) {
        return false;
    }
    m_appointments.erase(it);
    return true;
}

std::vector<Appointment>::iterator InMemoryAppointmentRepository::find(const QUuid &id)
{
    return std::find_if(m_appointments.begin(), m_appointments.end(), [&id](const Appointment &appointment) {
        return appointment.id == id;
    });
}

std::vector<Appointment>::const_iterator InMemoryAppointmentRepository::find(const QUuid &id) const
{
    return std::find_if(m_appointments.begin(), m_appointments.end(), [&id](const Appointment &appointment) {
        return appointment.id == id;
    });
}

} // namespace data
} // namespace agenda
