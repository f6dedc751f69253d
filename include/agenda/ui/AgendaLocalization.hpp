#pragma once

#include <QDate>
#include <QLocale>
#include <QString>
#include <QStringList>

#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace ui {

class AgendaLocalization
{
public:
    explicit AgendaLocalization(const QString &localeName = QStringLiteral("en"));

    QString localeName() const { return m_localeName; }
    const QLocale &locale() const { return m_locale; }

    QString noSelectedDateLabel() const;
    QString noEventsLabel() const;
    QString daySpanCountLabel() const;
    QString allDayLabel() const;

    QString formatDateTime(const QDateTime &dateTime, const QString &pattern) const;
    // "<subject> (<Day> n / m)" for the day being viewed.
    QString spanSummaryText(const data::Appointment &appointment, const QDate &viewedDate) const;
    QString appointmentDescription(const data::Appointment &appointment) const;
    QString emptyDayDescription(const QDate &date) const;

    static bool isSupported(const QString &localeName);
    static QStringList supportedLocales();

    struct Strings
    {
        const char *languageCode;
        const char *noSelectedDate;
        const char *noEvents;
        const char *daySpanCount;
        const char *allDay;
        const char *rangeSeparator;
    };

private:
    const Strings *m_strings = nullptr;
    QString m_localeName;
    QLocale m_locale;
};

} // namespace ui
} // namespace agenda
