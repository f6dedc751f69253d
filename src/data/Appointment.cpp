#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace data {

bool isSpanned(const Appointment &appointment)
{
    return appointment.spanned || appointment.end.date() != appointment.start.date();
}

bool isRecurring(const Appointment &appointment)
{
    return !appointment.recurrenceRule.isEmpty();
}

bool isRecurrenceInstance(const Appointment &appointment)
{
    return !appointment.recurrenceId.isNull();
}

AppointmentList makeAppointmentList(std::vector<Appointment> appointments)
{
    return std::make_shared<const std::vector<Appointment>>(std::move(appointments));
}

} // namespace data
} // namespace agenda
