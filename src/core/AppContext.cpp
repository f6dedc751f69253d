#include "agenda/core/AppContext.hpp"

#include <QDate>
#include <QDateTime>
#include <QObject>
#include <QTime>

#include "agenda/data/InMemoryAppointmentRepository.hpp"

namespace agenda {
namespace core {

AppContext::AppContext()
    : m_appointmentRepository(std::make_unique<data::InMemoryAppointmentRepository>())
{
    seedDemoData();
}

AppContext::~AppContext() = default;

data::AppointmentRepository &AppContext::appointmentRepository()
{
    return *m_appointmentRepository;
}

void AppContext::seedDemoData()
{
    const QDate today = QDate::currentDate();

    data::Appointment standup;
    standup.subject = QObject::tr("Daily Standup");
    standup.start = QDateTime(today, QTime(9, 0));
    standup.end = standup.start.addSecs(30 * 60);
    standup.recurrenceRule = QStringLiteral("FREQ=DAILY;BYDAY=MO,TU,WE,TH,FR");
    standup.location = QObject::tr("Huddle Room");
    standup.color = QColor(0x0f, 0x9d, 0x58);

    data::Appointment planning;
    planning.subject = QObject::tr("Sprint planning with the whole product team and stakeholders");
    planning.start = QDateTime(today, QTime(14, 0));
    planning.end = planning.start.addSecs(90 * 60);
    planning.location = QObject::tr("Conference Room A");

    data::Appointment holiday;
    holiday.subject = QObject::tr("Company holiday");
    holiday.start = QDateTime(today, QTime(0, 0));
    holiday.end = QDateTime(today, QTime(23, 59));
    holiday.allDay = true;
    holiday.color = QColor(0xf4, 0xb4, 0x00);

    data::Appointment conference;
    conference.subject = QObject::tr("Developer conference");
    conference.start = QDateTime(today.addDays(-1), QTime(8, 0));
    conference.end = QDateTime(today.addDays(1), QTime(18, 0));
    conference.color = QColor(0xdb, 0x44, 0x37);

    m_appointmentRepository->addAppointment(std::move(standup));
    m_appointmentRepository->addAppointment(std::move(planning));
    m_appointmentRepository->addAppointment(std::move(holiday));
    m_appointmentRepository->addAppointment(std::move(conference));
}

} // namespace core
} // namespace agenda
