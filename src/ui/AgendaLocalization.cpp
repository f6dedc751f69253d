#include "agenda/ui/AgendaLocalization.hpp"

#include <QRegularExpression>
#include <array>

#include "agenda/core/Logging.hpp"

namespace agenda {
namespace ui {

namespace {
const std::array<AgendaLocalization::Strings, 3> Translations = { {
    { "en", "No selected date", "No events", "Day", "All day", "to" },
    { "de", "Kein Datum ausgewählt", "Keine Termine", "Tag", "Ganztägig", "bis" },
    { "vi", "Không có ngày được chọn", "Không có sự kiện", "Ngày", "Cả ngày", "đến" },
} };

QString languageCode(const QString &localeName)
{
    const int separator = localeName.indexOf(QRegularExpression(QStringLiteral("[_-]")));
    return (separator < 0 ? localeName : localeName.left(separator)).toLower();
}

const AgendaLocalization::Strings *lookup(const QString &localeName)
{
    const QString code = languageCode(localeName);
    for (const auto &strings : Translations) {
        if (code == QLatin1String(strings.languageCode)) {
            return &strings;
        }
    }
    return nullptr;
}
} // namespace

AgendaLocalization::AgendaLocalization(const QString &localeName)
    : m_strings(lookup(localeName))
    , m_localeName(localeName)
    , m_locale(localeName)
{
    if (!m_strings) {
        Q_ASSERT_X(false, "AgendaLocalization", "unsupported locale");
        qCWarning(lcAgendaLocale) << "unsupported locale" << localeName << "- falling back to en";
        m_strings = &Translations.front();
        m_localeName = QStringLiteral("en");
        m_locale = QLocale(QLocale::English);
    }
}

QString AgendaLocalization::noSelectedDateLabel() const
{
    return QString::fromUtf8(m_strings->noSelectedDate);
}

QString AgendaLocalization::noEventsLabel() const
{
    return QString::fromUtf8(m_strings->noEvents);
}

QString AgendaLocalization::daySpanCountLabel() const
{
    return QString::fromUtf8(m_strings->daySpanCount);
}

QString AgendaLocalization::allDayLabel() const
{
    return QString::fromUtf8(m_strings->allDay);
}

QString AgendaLocalization::formatDateTime(const QDateTime &dateTime, const QString &pattern) const
{
    return m_locale.toString(dateTime, pattern);
}

QString AgendaLocalization::spanSummaryText(const data::Appointment &appointment, const QDate &viewedDate) const
{
    const QDate startDate = appointment.start.date();
    const qint64 totalDays = startDate.daysTo(appointment.end.date()) + 1;
    const qint64 currentDay = startDate.daysTo(viewedDate) + 1;
    return QStringLiteral("%1 (%2 %3 / %4)")
        .arg(appointment.subject, daySpanCountLabel())
        .arg(currentDay)
        .arg(totalDays);
}

QString AgendaLocalization::appointmentDescription(const data::Appointment &appointment) const
{
    if (appointment.allDay) {
        return QStringLiteral("%1, %2").arg(appointment.subject, allDayLabel());
    }
    const QString pattern = data::isSpanned(appointment) ? QStringLiteral("hh mm AP dd/MMMM/yyyy")
                                                         : QStringLiteral("hh mm AP");
    return QStringLiteral("%1, %2 %3 %4")
        .arg(appointment.subject,
             formatDateTime(appointment.start, pattern),
             QString::fromUtf8(m_strings->rangeSeparator),
             formatDateTime(appointment.end, pattern));
}

QString AgendaLocalization::emptyDayDescription(const QDate &date) const
{
    return QStringLiteral("%1, %2").arg(m_locale.toString(date, QStringLiteral("dddd dd/MMMM/yyyy")), noEventsLabel());
}

bool AgendaLocalization::isSupported(const QString &localeName)
{
    return lookup(localeName) != nullptr;
}

QStringList AgendaLocalization::supportedLocales()
{
    QStringList codes;
    for (const auto &strings : Translations) {
        codes << QString::fromLatin1(strings.languageCode);
    }
    return codes;
}

} // namespace ui
} // namespace agenda
