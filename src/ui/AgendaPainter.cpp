#include "agenda/ui/AgendaPainter.hpp"

#include <QFontMetricsF>
#include <QPainter>
#include <QPainterPath>
#include <QTextLayout>
#include <QtMath>
#include <cmath>

#include "agenda/core/Logging.hpp"
#include "agenda/ui/AgendaLocalization.hpp"
#include "agenda/ui/AgendaState.hpp"

namespace agenda {
namespace ui {

namespace {
const QString EllipsisMarker = QStringLiteral("..");
constexpr double IconReserve = 10.0;
constexpr double IconPlateExtra = 8.0;
} // namespace

void AgendaPainter::paint(QPainter &painter,
                          const std::vector<layout::AppointmentView> &views,
                          const AgendaPaintContext &context) const
{
    if (!context.localization || !context.style || !context.config) {
        return;
    }
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    if (!context.selectedDate.isValid() || !context.hasAppointments) {
        paintPlaceholder(painter, context);
        painter.restore();
        return;
    }

    int painted = 0;
    for (const auto &view : views) {
        if (view.isEmpty()) {
            continue;
        }
        paintAppointment(painter, view, context);
        ++painted;
    }
    qCDebug(lcAgendaPaint) << "painted" << painted << "appointments for" << context.selectedDate;
    painter.restore();
}

double AgendaPainter::fontSize(const QFont &font)
{
    if (font.pixelSize() > 0) {
        return static_cast<double>(font.pixelSize());
    }
    if (font.pointSizeF() > 0.0) {
        return font.pointSizeF();
    }
    return DefaultFontSize;
}

QFont AgendaPainter::scaledFont(const QFont &font, double textScaleFactor)
{
    QFont scaled = font;
    const double factor = textScaleFactor > 0.0 ? textScaleFactor : 1.0;
    scaled.setPixelSize(qMax(1, qRound(fontSize(font) * factor)));
    return scaled;
}

double AgendaPainter::textSizeFor(const QRectF &rect, double fontSize)
{
    if (rect.width() < fontSize || rect.height() < fontSize) {
        return qMax(0.0, qMin(rect.width(), rect.height()));
    }
    return fontSize;
}

int AgendaPainter::maxLineCount(double itemHeight, double lineHeight, bool allDay, bool spanned)
{
    if (lineHeight <= 0.0) {
        return 1;
    }
    const int maxLines = static_cast<int>(std::floor((itemHeight - VerticalTextPadding) / lineHeight));
    if (maxLines <= 1) {
        return 1;
    }
    return allDay || spanned ? maxLines : maxLines - 1;
}

QStringList AgendaPainter::layoutLines(const QString &text, const QFont &font, double maxWidth, int maxLines)
{
    QStringList lines;
    if (text.isEmpty() || maxWidth <= 0.0 || maxLines <= 0) {
        return lines;
    }

    QString content = text;
    content.replace(QLatin1Char('\n'), QChar::LineSeparator);
    QTextLayout textLayout(content, font);
    QTextOption option;
    option.setWrapMode(QTextOption::WrapAtWordBoundaryOrAnywhere);
    textLayout.setTextOption(option);
    textLayout.beginLayout();
    while (lines.size() < maxLines) {
        QTextLine line = textLayout.createLine();
        if (!line.isValid()) {
            break;
        }
        line.setLineWidth(maxWidth);
        if (lines.size() == maxLines - 1) {
            // The last permitted line carries whatever is left.
            QString remainder = content.mid(line.textStart());
            remainder.replace(QChar::LineSeparator, QLatin1Char(' '));
            lines << elide(remainder.trimmed(), font, maxWidth);
            break;
        }
        lines << content.mid(line.textStart(), line.textLength()).trimmed();
    }
    textLayout.endLayout();
    return lines;
}

QString AgendaPainter::elide(const QString &text, const QFont &font, double maxWidth)
{
    if (maxWidth <= 0.0) {
        return QString();
    }
    const QFontMetricsF metrics(font);
    if (metrics.horizontalAdvance(text) <= maxWidth) {
        return text;
    }
    QString truncated = text;
    while (!truncated.isEmpty() && metrics.horizontalAdvance(truncated + EllipsisMarker) > maxWidth) {
        truncated.chop(1);
    }
    if (truncated.isEmpty() && metrics.horizontalAdvance(EllipsisMarker) > maxWidth) {
        return QString();
    }
    return truncated + EllipsisMarker;
}

QString AgendaPainter::timeRangeText(const data::Appointment &appointment,
                                     const QString &formatOverride,
                                     const AgendaLocalization &localization)
{
    QString format = formatOverride;
    if (format.isEmpty()) {
        format = appointment.start.date() == appointment.end.date() ? QStringLiteral("hh:mm AP")
                                                                    : QStringLiteral("MMM dd, hh:mm AP");
    }
    return QStringLiteral("%1 - %2").arg(localization.formatDateTime(appointment.start, format),
                                         localization.formatDateTime(appointment.end, format));
}

QString AgendaPainter::recurrenceGlyph(bool seriesPattern)
{
    return seriesPattern ? QString(QChar(0x21BB)) : QString(QChar(0x21BA));
}

QString AgendaPainter::continuesGlyph()
{
    return QString(QChar(0x2192));
}

void AgendaPainter::paintPlaceholder(QPainter &painter, const AgendaPaintContext &context) const
{
    const AgendaStyle &style = *context.style;
    const double padding = context.config->padding;
    const QString label = context.selectedDate.isValid() ? context.localization->noEventsLabel()
                                                         : context.localization->noSelectedDateLabel();
    const QFont font = scaledFont(style.placeholderFont, context.config->textScaleFactor);
    const QFontMetricsF metrics(font);
    const double width = qMax(0.0, context.size.width() - 2 * padding);

    painter.setFont(font);
    painter.setPen(style.placeholderTextColor);
    painter.drawText(QRectF(padding, 2 * padding, width, metrics.height()),
                     Qt::AlignLeft | Qt::AlignTop,
                     elide(label, font, width));
}

void AgendaPainter::paintAppointment(QPainter &painter,
                                     const layout::AppointmentView &view,
                                     const AgendaPaintContext &context) const
{
    const data::Appointment &appointment = *view.appointment;
    const layout::RoundedRect &rounded = *view.rect;
    const QRectF rect = rounded.rect;
    const double padding = context.config->padding;
    const double itemHeight = rect.height();
    const AgendaStyle &style = *context.style;

    QPainterPath clip;
    clip.addRoundedRect(rect, rounded.radius, rounded.radius);
    painter.save();
    painter.setClipPath(clip);
    painter.setPen(Qt::NoPen);
    painter.setBrush(appointment.color);
    painter.drawPath(clip);

    const QFont baseFont = scaledFont(style.appointmentFont, context.config->textScaleFactor);
    const double textSize = textSizeFor(rect, fontSize(baseFont));
    QFont font = baseFont;
    font.setPixelSize(qMax(1, qRound(textSize)));
    const double lineHeight = QFontMetricsF(font).height();
    painter.setFont(font);
    painter.setPen(style.appointmentTextColor);

    const bool recurring = data::isRecurring(appointment);
    const bool showRecurrence = recurring || data::isRecurrenceInstance(appointment);
    const double recurrenceReserve = showRecurrence ? textSize + IconReserve : 0.0;
    double recurrenceInset = 0.0;
    double topPadding = 0.0;
    const QPointF textOrigin(rect.left() + padding, rect.top());

    if (data::isSpanned(appointment)) {
        const bool continues = appointment.end.date() != context.selectedDate;
        const double continuesReserve = continues ? textSize + IconReserve : 0.0;
        const double maxWidth = qMax(0.0, rect.width() - 2 * padding - continuesReserve - recurrenceReserve);
        const QStringList lines = layoutLines(context.localization->spanSummaryText(appointment, context.selectedDate),
                                              font,
                                              maxWidth,
                                              maxLineCount(itemHeight, lineHeight, false, true));
        topPadding = (itemHeight - lines.size() * lineHeight) / 2;
        paintLines(painter, lines, textOrigin + QPointF(0, topPadding), lineHeight, maxWidth);
        if (continues) {
            paintIcon(painter, continuesGlyph(), rounded, appointment.color, textSize, topPadding, lineHeight, 0.0);
            recurrenceInset = textSize + IconPlateExtra;
        }
    } else if (!appointment.allDay) {
        const double maxWidth = qMax(0.0, rect.width() - 2 * padding - recurrenceReserve);
        const QStringList lines = layoutLines(appointment.subject,
                                              font,
                                              maxWidth,
                                              maxLineCount(itemHeight, lineHeight, false, false));
        const double subjectHeight = lines.size() * lineHeight;
        topPadding = (itemHeight - (subjectHeight + lineHeight)) / 2;
        paintLines(painter, lines, textOrigin + QPointF(0, topPadding), lineHeight, maxWidth);

        const QString timeText = timeRangeText(appointment, context.config->timeTextFormat, *context.localization);
        painter.drawText(QRectF(textOrigin.x(), rect.top() + topPadding + subjectHeight, maxWidth, lineHeight),
                         Qt::AlignLeft | Qt::AlignVCenter,
                         elide(timeText, font, maxWidth));
    } else {
        const double maxWidth = qMax(0.0, rect.width() - 2 * padding - recurrenceReserve);
        const QStringList lines = layoutLines(appointment.subject,
                                              font,
                                              maxWidth,
                                              maxLineCount(itemHeight, lineHeight, true, false));
        topPadding = (itemHeight - lines.size() * lineHeight) / 2;
        paintLines(painter, lines, textOrigin + QPointF(0, topPadding), lineHeight, maxWidth);
    }

    if (showRecurrence) {
        paintIcon(painter, recurrenceGlyph(recurring), rounded, appointment.color, textSize, topPadding, lineHeight,
                  recurrenceInset);
    }
    painter.restore();
}

void AgendaPainter::paintLines(QPainter &painter,
                               const QStringList &lines,
                               const QPointF &origin,
                               double lineHeight,
                               double maxWidth) const
{
    double y = origin.y();
    for (const auto &line : lines) {
        painter.drawText(QRectF(origin.x(), y, maxWidth, lineHeight), Qt::AlignLeft | Qt::AlignVCenter, line);
        y += lineHeight;
    }
}

void AgendaPainter::paintIcon(QPainter &painter,
                              const QString &glyph,
                              const layout::RoundedRect &rect,
                              const QColor &plateColor,
                              double textSize,
                              double topPadding,
                              double lineHeight,
                              double rightInset) const
{
    const double iconSize = textSize + IconPlateExtra;
    const QRectF plate(rect.rect.right() - rightInset - iconSize, rect.rect.top(), iconSize, rect.rect.height());
    painter.save();
    painter.setPen(Qt::NoPen);
    painter.setBrush(plateColor);
    painter.drawRoundedRect(plate, rect.radius, rect.radius);
    painter.restore();

    const QRectF glyphRect(plate.left(), rect.rect.top() + qMax(0.0, topPadding), iconSize, lineHeight);
    painter.drawText(glyphRect, Qt::AlignCenter, glyph);
}

} // namespace ui
} // namespace agenda
