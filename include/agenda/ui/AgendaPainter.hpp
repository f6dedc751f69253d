#pragma once

#include <QDate>
#include <QFont>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <vector>

#include "agenda/layout/AgendaLayoutConfig.hpp"
#include "agenda/layout/AppointmentView.hpp"

class QPainter;

namespace agenda {
namespace ui {

class AgendaLocalization;
struct AgendaStyle;

struct AgendaPaintContext
{
    QSizeF size;
    QDate selectedDate;
    bool hasAppointments = false;
    const AgendaLocalization *localization = nullptr;
    const AgendaStyle *style = nullptr;
    const layout::AgendaLayoutConfig *config = nullptr;
};

// Default painting used when no appointment builder is installed.
class AgendaPainter
{
public:
    void paint(QPainter &painter,
               const std::vector<layout::AppointmentView> &views,
               const AgendaPaintContext &context) const;

    static constexpr double VerticalTextPadding = 10.0;
    static constexpr double DefaultFontSize = 14.0;

    static double fontSize(const QFont &font);
    static QFont scaledFont(const QFont &font, double textScaleFactor);
    // Shrinks to the smaller rect dimension when the rect cannot hold the font.
    static double textSizeFor(const QRectF &rect, double fontSize);
    static int maxLineCount(double itemHeight, double lineHeight, bool allDay, bool spanned);
    static QStringList layoutLines(const QString &text, const QFont &font, double maxWidth, int maxLines);
    static QString elide(const QString &text, const QFont &font, double maxWidth);
    static QString timeRangeText(const data::Appointment &appointment,
                                 const QString &formatOverride,
                                 const AgendaLocalization &localization);
    static QString recurrenceGlyph(bool seriesPattern);
    static QString continuesGlyph();

private:
    void paintPlaceholder(QPainter &painter, const AgendaPaintContext &context) const;
    void paintAppointment(QPainter &painter, const layout::AppointmentView &view, const AgendaPaintContext &context) const;
    void paintLines(QPainter &painter,
                    const QStringList &lines,
                    const QPointF &origin,
                    double lineHeight,
                    double maxWidth) const;
    void paintIcon(QPainter &painter,
                   const QString &glyph,
                   const layout::RoundedRect &rect,
                   const QColor &plateColor,
                   double textSize,
                   double topPadding,
                   double lineHeight,
                   double rightInset) const;
};

} // namespace ui
} // namespace agenda
