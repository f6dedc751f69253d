#pragma once

#include <QDate>
#include <optional>
#include <vector>

#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace data {

class AppointmentRepository
{
public:
    virtual ~AppointmentRepository() = default;

    // Appointments that occupy any part of the given local day.
    virtual std::vector<Appointment> appointmentsForDate(const QDate &date) const = 0;
    virtual std::optional<Appointment> findById(const QUuid &id) const = 0;
    virtual Appointment addAppointment(Appointment appointment) = 0;
    virtual bool updateAppointment(const Appointment &appointment) = 0;
    virtual bool removeAppointment(const QUuid &id) = 0;
};

} // namespace data
} // namespace agenda
