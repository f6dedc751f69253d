#include "agenda/layout/AgendaLayoutEngine.hpp"

#include <QtGlobal>
#include <algorithm>

#include "agenda/core/Logging.hpp"

namespace agenda {
namespace layout {

namespace {
constexpr double MaxCornerRadius = 5.0;
constexpr double CornerRadiusFactor = 0.1;
} // namespace

AgendaLayoutEngine::AgendaLayoutEngine() = default;
AgendaLayoutEngine::~AgendaLayoutEngine() = default;

const std::vector<AppointmentView> &AgendaLayoutEngine::computeSlots(data::AppointmentList appointments,
                                                                     const QDate &selectedDate,
                                                                     const AgendaLayoutConfig &config)
{
    releaseSlots();
    m_appointments = std::move(appointments);
    m_contentHeight = 0.0;
    if (!selectedDate.isValid() || !m_appointments || m_appointments->empty()) {
        qCDebug(lcAgendaLayout) << "no slots for" << selectedDate
                                << (m_appointments ? "empty list" : "no data");
        return m_views;
    }

    const double padding = config.padding;
    double itemWidth = config.width - 2 * padding;
    if (itemWidth < 0.0) {
        qCWarning(lcAgendaLayout) << "agenda width" << config.width << "too small for padding, clamping to 0";
        itemWidth = 0.0;
    }

    const std::size_t before = m_createdCount;
    double y = padding;
    for (const data::Appointment *appointment : sortedAppointments(*m_appointments)) {
        const double itemHeight = itemHeightFor(*appointment, config);
        AppointmentView &view = acquireSlot();
        view.appointment = appointment;
        view.canReuse = false;
        view.rect = RoundedRect{ QRectF(padding, y, itemWidth, itemHeight), cornerRadiusFor(itemHeight) };
        y += itemHeight + padding;
    }
    m_contentHeight = y;

    qCDebug(lcAgendaLayout) << "laid out" << m_appointments->size() << "appointments in" << m_views.size()
                            << "slots," << (m_createdCount - before) << "new";
    return m_views;
}

const std::vector<AppointmentView> &AgendaLayoutEngine::views() const
{
    return m_views;
}

int AgendaLayoutEngine::slotIndexAt(const QPointF &point) const
{
    for (std::size_t i = 0; i < m_views.size(); ++i) {
        const AppointmentView &view = m_views[i];
        if (view.isEmpty()) {
            continue;
        }
        if (view.rect->rect.contains(point)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::size_t AgendaLayoutEngine::occupiedSlotCount() const
{
    return static_cast<std::size_t>(std::count_if(m_views.begin(), m_views.end(), [](const AppointmentView &view) {
        return !view.isEmpty();
    }));
}

void AgendaLayoutEngine::reset()
{
    m_views.clear();
    m_appointments.reset();
    m_contentHeight = 0.0;
}

double AgendaLayoutEngine::cornerRadiusFor(double itemHeight)
{
    return qBound(0.0, itemHeight * CornerRadiusFactor, MaxCornerRadius);
}

double AgendaLayoutEngine::itemHeightFor(const data::Appointment &appointment, const AgendaLayoutConfig &config)
{
    const bool useAllDayHeight = (appointment.allDay || data::isSpanned(appointment)) && !config.largerScheduleLayout;
    return qMax(0.0, useAllDayHeight ? config.allDayAppointmentHeight : config.appointmentHeight);
}

std::vector<const data::Appointment *> AgendaLayoutEngine::sortedAppointments(const std::vector<data::Appointment> &appointments)
{
    std::vector<const data::Appointment *> sorted;
    sorted.reserve(appointments.size());
    for (const auto &appointment : appointments) {
        sorted.push_back(&appointment);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const data::Appointment *lhs, const data::Appointment *rhs) {
        if (lhs->start != rhs->start) {
            return lhs->start < rhs->start;
        }
        if (lhs->allDay != rhs->allDay) {
            return !lhs->allDay;
        }
        const bool lhsSpanned = data::isSpanned(*lhs);
        const bool rhsSpanned = data::isSpanned(*rhs);
        if (lhsSpanned != rhsSpanned) {
            return !lhsSpanned;
        }
        return false;
    });
    return sorted;
}

void AgendaLayoutEngine::releaseSlots()
{
    for (auto &view : m_views) {
        view.appointment = nullptr;
        view.rect.reset();
        view.canReuse = true;
    }
}

AppointmentView &AgendaLayoutEngine::acquireSlot()
{
    for (auto &view : m_views) {
        if (view.appointment == nullptr) {
            return view;
        }
    }
    m_views.emplace_back();
    ++m_createdCount;
    return m_views.back();
}

} // namespace layout
} // namespace agenda
