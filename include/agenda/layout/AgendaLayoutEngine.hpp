#pragma once

#include <QDate>
#include <QPointF>
#include <cstddef>
#include <vector>

#include "agenda/data/Appointment.hpp"
#include "agenda/layout/AgendaLayoutConfig.hpp"
#include "agenda/layout/AppointmentView.hpp"

namespace agenda {
namespace layout {

class AgendaLayoutEngine
{
public:
    AgendaLayoutEngine();
    ~AgendaLayoutEngine();

    const std::vector<AppointmentView> &computeSlots(data::AppointmentList appointments,
                                                     const QDate &selectedDate,
                                                     const AgendaLayoutConfig &config);
    const std::vector<AppointmentView> &views() const;

    int slotIndexAt(const QPointF &point) const;
    std::size_t occupiedSlotCount() const;
    // Total number of slots ever allocated by this engine.
    std::size_t createdSlotCount() const { return m_createdCount; }
    double contentHeight() const { return m_contentHeight; }
    void reset();

    static double cornerRadiusFor(double itemHeight);
    static double itemHeightFor(const data::Appointment &appointment, const AgendaLayoutConfig &config);
    static std::vector<const data::Appointment *> sortedAppointments(const std::vector<data::Appointment> &appointments);

private:
    void releaseSlots();
    AppointmentView &acquireSlot();

    data::AppointmentList m_appointments;
    std::vector<AppointmentView> m_views;
    std::size_t m_createdCount = 0;
    double m_contentHeight = 0.0;
};

} // namespace layout
} // namespace agenda
