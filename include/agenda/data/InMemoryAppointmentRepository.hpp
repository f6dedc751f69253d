#pragma once

#include <vector>

#include "agenda/data/AppointmentRepository.hpp"

namespace agenda {
namespace data {

class InMemoryAppointmentRepository : public AppointmentRepository
{
public:
    InMemoryAppointmentRepository();
    ~InMemoryAppointmentRepository() override;

    std::vector<Appointment> appointmentsForDate(const QDate &date) const override;
    std::optional<Appointment> findById(const QUuid &id) const override;
    Appointment addAppointment(Appointment appointment) override;
    bool updateAppointment(const Appointment &appointment) override;
    bool removeAppointment(const QUuid &id) override;

private:
    std::vector<Appointment>::iterator find(const QUuid &id);
    std::vector<Appointment>::const_iterator find(const QUuid &id) const;

    // Insertion order is kept so equal-start appointments come back stable.
    std::vector<Appointment> m_appointments;
};

} // namespace data
} // namespace agenda
