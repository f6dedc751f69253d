#include "agenda/ui/AgendaState.hpp"

namespace agenda {
namespace ui {

namespace {
QFont pixelFont(int pixelSize, bool bold = false)
{
    QFont font(QStringLiteral("Roboto"));
    font.setPixelSize(pixelSize);
    font.setBold(bold);
    return font;
}

bool geometryChanged(const layout::AgendaLayoutConfig &previous, const layout::AgendaLayoutConfig &next)
{
    return previous.width != next.width
        || previous.height != next.height
        || previous.timeLabelWidth != next.timeLabelWidth
        || previous.appointmentHeight != next.appointmentHeight
        || previous.allDayAppointmentHeight != next.allDayAppointmentHeight
        || previous.padding != next.padding
        || previous.largerScheduleLayout != next.largerScheduleLayout;
}
} // namespace

AgendaStyle::AgendaStyle()
    : appointmentFont(pixelFont(13))
    , placeholderFont(pixelFont(15))
    , dayFont(pixelFont(10))
    , dateFont(pixelFont(18, true))
{
}

bool AgendaStyle::operator==(const AgendaStyle &other) const
{
    return appointmentFont == other.appointmentFont
        && appointmentTextColor == other.appointmentTextColor
        && placeholderFont == other.placeholderFont
        && placeholderTextColor == other.placeholderTextColor
        && backgroundColor == other.backgroundColor
        && dayFont == other.dayFont
        && dateFont == other.dateFont
        && dayTextColor == other.dayTextColor
        && todayHighlightColor == other.todayHighlightColor
        && todayTextColor == other.todayTextColor;
}

AgendaUpdate diffAgendaState(const AgendaState &previous, const AgendaState &next)
{
    if (previous.appointments != next.appointments
        || previous.selectedDate != next.selectedDate
        || previous.builder != next.builder
        || geometryChanged(previous.config, next.config)) {
        return AgendaUpdate::Relayout;
    }

    if (previous.style != next.style
        || previous.config.textScaleFactor != next.config.textScaleFactor
        || previous.config.localeName != next.config.localeName
        || previous.config.timeTextFormat != next.config.timeTextFormat) {
        return AgendaUpdate::Repaint;
    }
    return AgendaUpdate::None;
}

} // namespace ui
} // namespace agenda
