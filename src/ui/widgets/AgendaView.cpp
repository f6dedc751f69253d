#include "agenda/ui/widgets/AgendaView.hpp"

#include <QAccessible>
#include <QFontMetricsF>
#include <QHelpEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QScrollBar>
#include <QStringList>
#include <QToolTip>
#include <QtMath>

#include "agenda/core/Logging.hpp"
#include "agenda/ui/widgets/AgendaAccessible.hpp"

namespace agenda {
namespace ui {

AgendaView::AgendaView(QWidget *parent)
    : QAbstractScrollArea(parent)
    , m_localization(m_state.config.localeName)
{
    static const bool accessibleFactoryInstalled = [] {
        QAccessible::installFactory(&createAgendaAccessible);
        return true;
    }();
    Q_UNUSED(accessibleFactoryInstalled);

    setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setVerticalScrollBarPolicy(Qt::ScrollBarAsNeeded);
    setFrameShape(QFrame::NoFrame);
    viewport()->setMouseTracking(true);
    syncViewportGeometry(m_state.config);
    relayout();
}

AgendaView::~AgendaView()
{
    destroyChildren();
    m_semantics.clear();
    m_engine.reset();
}

void AgendaView::setSelectedDate(const QDate &date)
{
    AgendaState next = m_state;
    next.selectedDate = date;
    applyState(std::move(next));
}

void AgendaView::setAppointments(data::AppointmentList appointments)
{
    AgendaState next = m_state;
    next.appointments = std::move(appointments);
    applyState(std::move(next));
}

void AgendaView::setAppointmentBuilder(AppointmentBuilder builder)
{
    AgendaState next = m_state;
    next.builder = builder ? std::make_shared<const AppointmentBuilder>(std::move(builder)) : nullptr;
    applyState(std::move(next));
}

void AgendaView::clearAppointmentBuilder()
{
    setAppointmentBuilder(AppointmentBuilder());
}

void AgendaView::setLayoutConfig(const layout::AgendaLayoutConfig &config)
{
    AgendaState next = m_state;
    next.config = config;
    applyState(std::move(next));
}

void AgendaView::setAgendaStyle(const AgendaStyle &style)
{
    AgendaState next = m_state;
    next.style = style;
    applyState(std::move(next));
}

AgendaUpdate AgendaView::applyState(AgendaState next)
{
    syncViewportGeometry(next.config);
    const AgendaUpdate update = diffAgendaState(m_state, next);
    const bool localeChanged = next.config.localeName != m_state.config.localeName;
    m_state = std::move(next);
    if (localeChanged) {
        m_localization = AgendaLocalization(m_state.config.localeName);
    }

    switch (update) {
    case AgendaUpdate::Relayout:
        relayout();
        break;
    case AgendaUpdate::Repaint:
        if (localeChanged) {
            updateSemantics();
        }
        viewport()->update();
        break;
    case AgendaUpdate::None:
        break;
    }
    return update;
}

const std::vector<layout::AppointmentView> &AgendaView::appointmentViews() const
{
    return m_engine.views();
}

const std::vector<SemanticsNode> &AgendaView::semanticsNodes() const
{
    return m_semantics.nodes();
}

const SemanticsNode *AgendaView::semanticsNode(int id) const
{
    return m_semantics.nodeById(id);
}

QRect AgendaView::semanticsNodeViewportRect(const SemanticsNode &node) const
{
    return mapFromContent(node.rect).toAlignedRect();
}

double AgendaView::contentHeight() const
{
    return m_engine.contentHeight();
}

const data::Appointment *AgendaView::appointmentAt(const QPoint &viewportPos) const
{
    const int index = m_engine.slotIndexAt(mapToContent(viewportPos));
    if (index < 0) {
        return nullptr;
    }
    return m_engine.views()[static_cast<std::size_t>(index)].appointment;
}

QPointF AgendaView::mapToContent(const QPoint &viewportPos) const
{
    return QPointF(viewportPos) + QPointF(-m_state.config.timeLabelWidth, verticalScrollBar()->value());
}

QRectF AgendaView::mapFromContent(const QRectF &contentRect) const
{
    return contentRect.translated(m_state.config.timeLabelWidth, -verticalScrollBar()->value());
}

void AgendaView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(viewport());
    painter.fillRect(viewport()->rect(), m_state.style.backgroundColor);
    painter.setRenderHint(QPainter::Antialiasing, true);
    paintDateColumn(painter);

    const bool hasAppointments = m_state.appointments && !m_state.appointments->empty();
    const bool placeholder = !m_state.selectedDate.isValid() || !hasAppointments;
    if (m_renderMode == RenderMode::Delegated && !placeholder) {
        return;
    }

    const double left = m_state.config.timeLabelWidth;
    painter.save();
    painter.setClipRect(QRectF(left, 0, qMax(0.0, viewport()->width() - left), viewport()->height()));
    painter.translate(left, -verticalScrollBar()->value());

    AgendaPaintContext context;
    context.size = QSizeF(m_state.config.width, qMax(m_state.config.height, m_engine.contentHeight()));
    context.selectedDate = m_state.selectedDate;
    context.hasAppointments = hasAppointments;
    context.localization = &m_localization;
    context.style = &m_state.style;
    context.config = &m_state.config;
    m_painter.paint(painter, m_engine.views(), context);
    painter.restore();
}

void AgendaView::resizeEvent(QResizeEvent *event)
{
    QAbstractScrollArea::resizeEvent(event);
    applyState(m_state);
}

void AgendaView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        QAbstractScrollArea::mousePressEvent(event);
        return;
    }
    // Receivers may replace the list while the signal is in flight.
    const data::AppointmentList keepAlive = m_state.appointments;
    if (const auto *appointment = appointmentAt(event->pos())) {
        emit appointmentTapped(*appointment);
    } else {
        emit emptyAreaTapped(m_state.selectedDate);
    }
    event->accept();
}

void AgendaView::mouseDoubleClickEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        QAbstractScrollArea::mouseDoubleClickEvent(event);
        return;
    }
    const data::AppointmentList keepAlive = m_state.appointments;
    if (const auto *appointment = appointmentAt(event->pos())) {
        emit appointmentActivated(*appointment);
    }
    event->accept();
}

bool AgendaView::viewportEvent(QEvent *event)
{
    if (event->type() == QEvent::ToolTip) {
        auto *helpEvent = static_cast<QHelpEvent *>(event);
        if (const auto *appointment = appointmentAt(helpEvent->pos())) {
            QToolTip::showText(helpEvent->globalPos(), appointmentTooltipText(*appointment), viewport());
            return true;
        }
        QToolTip::hideText();
        event->ignore();
        return true;
    }
    return QAbstractScrollArea::viewportEvent(event);
}

void AgendaView::scrollContentsBy(int dx, int dy)
{
    Q_UNUSED(dx);
    Q_UNUSED(dy);
    positionChildren();
    viewport()->update();
}

void AgendaView::relayout()
{
    ++m_layoutPasses;
    m_renderMode = m_state.builder && *m_state.builder ? RenderMode::Delegated : RenderMode::DefaultPaint;
    m_engine.computeSlots(m_state.appointments, m_state.selectedDate, m_state.config);
    qCDebug(lcAgendaLayout) << "relayout" << m_layoutPasses << "mode"
                            << (m_renderMode == RenderMode::Delegated ? "delegated" : "default")
                            << "content height" << m_engine.contentHeight();
    updateScrollBars();
    rebuildChildren();
    updateSemantics();
    viewport()->update();
}

void AgendaView::syncViewportGeometry(layout::AgendaLayoutConfig &config) const
{
    config.width = qMax(0.0, static_cast<double>(viewport()->width()) - config.timeLabelWidth);
    config.height = static_cast<double>(viewport()->height());
}

void AgendaView::rebuildChildren()
{
    destroyChildren();
    if (m_renderMode != RenderMode::Delegated) {
        return;
    }
    const AppointmentBuilder &builder = *m_state.builder;
    const auto &views = m_engine.views();
    for (std::size_t i = 0; i < views.size(); ++i) {
        const auto &view = views[i];
        if (view.isEmpty()) {
            continue;
        }
        QWidget *child = builder(viewport(), m_state.selectedDate, *view.appointment);
        if (!child) {
            continue;
        }
        if (child->parentWidget() != viewport()) {
            child->setParent(viewport());
        }
        m_builtWidgets.push_back(child);
        m_builtSlots.push_back(i);
        child->show();
    }
    positionChildren();
}

void AgendaView::positionChildren()
{
    const auto &views = m_engine.views();
    for (std::size_t i = 0; i < m_builtWidgets.size(); ++i) {
        const auto &view = views[m_builtSlots[i]];
        if (!m_builtWidgets[i] || view.isEmpty()) {
            continue;
        }
        m_builtWidgets[i]->setGeometry(mapFromContent(view.rect->rect).toRect());
    }
}

void AgendaView::destroyChildren()
{
    // A builder widget may be the sender of the event that got us here.
    for (const QPointer<QWidget> &child : m_builtWidgets) {
        if (child) {
            child->hide();
            child->deleteLater();
        }
    }
    m_builtWidgets.clear();
    m_builtSlots.clear();
}

void AgendaView::updateScrollBars()
{
    const int pageStep = qMax(1, viewport()->height());
    const int content = qCeil(m_engine.contentHeight());
    verticalScrollBar()->setRange(0, qMax(0, content - pageStep));
    verticalScrollBar()->setPageStep(pageStep);
    verticalScrollBar()->setSingleStep(qMax(1, qRound(m_state.config.appointmentHeight / 2)));
}

void AgendaView::updateSemantics()
{
    const QSizeF size(m_state.config.width, qMax(m_state.config.height, m_engine.contentHeight()));
    m_semantics.assemble(describeAgenda(m_engine.views(), m_state.selectedDate, m_state.appointments, size, m_localization));
    if (QAccessible::isActive()) {
        if (auto *accessible = dynamic_cast<AgendaAccessible *>(QAccessible::queryAccessibleInterface(this))) {
            accessible->pruneStaleItems();
        }
        QAccessibleEvent event(this, QAccessible::ObjectReorder);
        QAccessible::updateAccessibility(&event);
    }
}

void AgendaView::paintDateColumn(QPainter &painter) const
{
    const double width = m_state.config.timeLabelWidth;
    const QDate date = m_state.selectedDate;
    if (width <= 0.0 || !date.isValid()) {
        return;
    }
    const AgendaStyle &style = m_state.style;
    const double padding = m_state.config.padding;
    const double scale = m_state.config.textScaleFactor;

    const QFont dayFont = AgendaPainter::scaledFont(style.dayFont, scale);
    const QRectF dayRect(0, padding, width, QFontMetricsF(dayFont).height());
    painter.setFont(dayFont);
    painter.setPen(style.dayTextColor);
    painter.drawText(dayRect, Qt::AlignCenter, m_localization.locale().toString(date, QStringLiteral("ddd")).toUpper());

    const QFont dateFont = AgendaPainter::scaledFont(style.dateFont, scale);
    const double diameter = QFontMetricsF(dateFont).height() + padding;
    const QRectF dateRect((width - diameter) / 2, dayRect.bottom() + padding / 2, diameter, diameter);
    painter.setFont(dateFont);
    if (date == QDate::currentDate()) {
        painter.setPen(Qt::NoPen);
        painter.setBrush(style.todayHighlightColor);
        painter.drawEllipse(dateRect);
        painter.setPen(style.todayTextColor);
    } else {
        painter.setPen(style.dayTextColor);
    }
    painter.drawText(dateRect, Qt::AlignCenter, QString::number(date.day()));
}

QString AgendaView::appointmentTooltipText(const data::Appointment &appointment) const
{
    QStringList lines;
    lines << appointment.subject.trimmed();
    if (appointment.allDay) {
        lines << m_localization.allDayLabel();
    } else {
        lines << AgendaPainter::timeRangeText(appointment, m_state.config.timeTextFormat, m_localization);
    }
    const QString location = appointment.location.trimmed();
    if (!location.isEmpty()) {
        lines << location;
    }
    const QString notes = appointment.notes.trimmed();
    if (!notes.isEmpty()) {
        lines << notes;
    }
    return lines.join(QStringLiteral("\n"));
}

} // namespace ui
} // namespace agenda
