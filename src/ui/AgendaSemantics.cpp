#include "agenda/ui/AgendaSemantics.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/ui/AgendaLocalization.hpp"

namespace agenda {
namespace ui {

std::vector<SemanticsDescriptor> describeAgenda(const std::vector<layout::AppointmentView> &views,
                                                const QDate &selectedDate,
                                                const data::AppointmentList &appointments,
                                                const QSizeF &size,
                                                const AgendaLocalization &localization)
{
    std::vector<SemanticsDescriptor> descriptors;
    const QRectF bounds(QPointF(0, 0), size);
    if (!selectedDate.isValid()) {
        descriptors.push_back({ bounds, localization.noSelectedDateLabel(), Qt::LeftToRight });
        return descriptors;
    }
    if (!appointments || appointments->empty()) {
        descriptors.push_back({ bounds, localization.emptyDayDescription(selectedDate), Qt::LeftToRight });
        return descriptors;
    }

    for (const auto &view : views) {
        if (view.isEmpty()) {
            continue;
        }
        descriptors.push_back({ view.rect->rect, localization.appointmentDescription(*view.appointment), Qt::LeftToRight });
    }
    return descriptors;
}

const std::vector<SemanticsNode> &SemanticsNodePool::assemble(const std::vector<SemanticsDescriptor> &descriptors)
{
    std::vector<SemanticsNode> nodes;
    nodes.reserve(descriptors.size());
    for (const auto &descriptor : descriptors) {
        SemanticsNode node;
        if (!m_pool.empty()) {
            node.id = m_pool.front();
            m_pool.pop_front();
        } else {
            node.id = m_nextId++;
        }
        node.rect = descriptor.rect;
        node.label = descriptor.label;
        node.direction = descriptor.direction;
        nodes.push_back(std::move(node));
    }

    // Ids not claimed this time are dropped; the new tree seeds the next pass.
    m_pool.clear();
    for (const auto &node : nodes) {
        m_pool.push_back(node.id);
    }
    m_nodes = std::move(nodes);
    qCDebug(lcAgendaAccessibility) << "assembled" << m_nodes.size() << "semantics nodes," << createdNodeCount()
                                   << "ids minted so far";
    return m_nodes;
}

const SemanticsNode *SemanticsNodePool::nodeById(int id) const
{
    for (const auto &node : m_nodes) {
        if (node.id == id) {
            return &node;
        }
    }
    return nullptr;
}

void SemanticsNodePool::clear()
{
    m_pool.clear();
    m_nodes.clear();
}

} // namespace ui
} // namespace agenda
