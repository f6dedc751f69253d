#pragma once

#include <QDate>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <deque>
#include <vector>

#include "agenda/data/Appointment.hpp"
#include "agenda/layout/AppointmentView.hpp"

namespace agenda {
namespace ui {

class AgendaLocalization;

struct SemanticsDescriptor
{
    QRectF rect;
    QString label;
    Qt::LayoutDirection direction = Qt::LeftToRight;
};

struct SemanticsNode
{
    int id = 0;
    QRectF rect;
    QString label;
    Qt::LayoutDirection direction = Qt::LeftToRight;
};

// Describes the accessible content of the agenda from the same slot
// geometry the painter uses.
std::vector<SemanticsDescriptor> describeAgenda(const std::vector<layout::AppointmentView> &views,
                                                const QDate &selectedDate,
                                                const data::AppointmentList &appointments,
                                                const QSizeF &size,
                                                const AgendaLocalization &localization);

// Hands out node ids so that a regenerated tree keeps the ids of the
// previous one, in order, for as many nodes as it still has.
class SemanticsNodePool
{
public:
    const std::vector<SemanticsNode> &assemble(const std::vector<SemanticsDescriptor> &descriptors);
    const std::vector<SemanticsNode> &nodes() const { return m_nodes; }
    const SemanticsNode *nodeById(int id) const;
    int createdNodeCount() const { return m_nextId - 1; }
    void clear();

private:
    std::deque<int> m_pool;
    std::vector<SemanticsNode> m_nodes;
    int m_nextId = 1;
};

} // namespace ui
} // namespace agenda
