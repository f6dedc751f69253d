#pragma once

#include <QAbstractScrollArea>
#include <QDate>
#include <QPointer>
#include <QRect>
#include <memory>
#include <optional>
#include <vector>

#include "agenda/data/Appointment.hpp"
#include "agenda/layout/AgendaLayoutEngine.hpp"
#include "agenda/ui/AgendaLocalization.hpp"
#include "agenda/ui/AgendaPainter.hpp"
#include "agenda/ui/AgendaSemantics.hpp"
#include "agenda/ui/AgendaState.hpp"

namespace agenda {
namespace ui {

class AgendaView : public QAbstractScrollArea
{
    Q_OBJECT

public:
    enum class RenderMode
    {
        DefaultPaint,
        Delegated
    };

    explicit AgendaView(QWidget *parent = nullptr);
    ~AgendaView() override;

    void setSelectedDate(const QDate &date);
    QDate selectedDate() const { return m_state.selectedDate; }
    void setAppointments(data::AppointmentList appointments);
    void setAppointmentBuilder(AppointmentBuilder builder);
    void clearAppointmentBuilder();
    void setLayoutConfig(const layout::AgendaLayoutConfig &config);
    void setAgendaStyle(const AgendaStyle &style);

    // Applies a full snapshot; relayout or repaint is decided by diffing.
    AgendaUpdate applyState(AgendaState next);
    const AgendaState &state() const { return m_state; }

    RenderMode renderMode() const { return m_renderMode; }
    const std::vector<layout::AppointmentView> &appointmentViews() const;
    const std::vector<QPointer<QWidget>> &builtWidgets() const { return m_builtWidgets; }
    const std::vector<SemanticsNode> &semanticsNodes() const;
    const SemanticsNode *semanticsNode(int id) const;
    QRect semanticsNodeViewportRect(const SemanticsNode &node) const;
    const AgendaLocalization &localization() const { return m_localization; }
    int layoutPassCount() const { return m_layoutPasses; }
    double contentHeight() const;

    const data::Appointment *appointmentAt(const QPoint &viewportPos) const;
    QPointF mapToContent(const QPoint &viewportPos) const;
    QRectF mapFromContent(const QRectF &contentRect) const;

signals:
    void appointmentTapped(const data::Appointment &appointment);
    void appointmentActivated(const data::Appointment &appointment);
    void emptyAreaTapped(const QDate &date);

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    bool viewportEvent(QEvent *event) override;
    void scrollContentsBy(int dx, int dy) override;

private:
    void relayout();
    void syncViewportGeometry(layout::AgendaLayoutConfig &config) const;
    void rebuildChildren();
    void positionChildren();
    void destroyChildren();
    void updateScrollBars();
    void updateSemantics();
    void paintDateColumn(QPainter &painter) const;
    QString appointmentTooltipText(const data::Appointment &appointment) const;

    AgendaState m_state;
    AgendaLocalization m_localization;
    layout::AgendaLayoutEngine m_engine;
    AgendaPainter m_painter;
    SemanticsNodePool m_semantics;
    RenderMode m_renderMode = RenderMode::DefaultPaint;
    // Widgets created by the builder, paired with their slot index. A widget
    // may be deleted behind our back, so entries can turn null.
    std::vector<QPointer<QWidget>> m_builtWidgets;
    std::vector<std::size_t> m_builtSlots;
    int m_layoutPasses = 0;
};

} // namespace ui
} // namespace agenda
