#include "agenda/ui/widgets/AgendaAccessible.hpp"

#include <QWindow>
#include <utility>

#include "agenda/core/Logging.hpp"
#include "agenda/ui/widgets/AgendaView.hpp"

namespace agenda {
namespace ui {

AgendaAccessible::AgendaAccessible(AgendaView *view)
    : QAccessibleWidget(view, QAccessible::List)
{
}

AgendaAccessible::~AgendaAccessible()
{
    for (const QAccessible::Id id : std::as_const(m_items)) {
        QAccessible::deleteAccessibleInterface(id);
    }
}

AgendaView *AgendaAccessible::agendaView() const
{
    return qobject_cast<AgendaView *>(object());
}

int AgendaAccessible::nodeCount() const
{
    const AgendaView *view = agendaView();
    return view ? static_cast<int>(view->semanticsNodes().size()) : 0;
}

void AgendaAccessible::pruneStaleItems() const
{
    const AgendaView *view = agendaView();
    for (auto it = m_items.begin(); it != m_items.end();) {
        if (view && view->semanticsNode(it.key())) {
            ++it;
            continue;
        }
        QAccessible::deleteAccessibleInterface(it.value());
        qCDebug(lcAgendaAccessibility) << "dropped accessible item for node" << it.key();
        it = m_items.erase(it);
    }
}

int AgendaAccessible::childCount() const
{
    pruneStaleItems();
    return nodeCount() + QAccessibleWidget::childCount();
}

QAccessibleInterface *AgendaAccessible::child(int index) const
{
    const int nodes = nodeCount();
    if (index < 0) {
        return nullptr;
    }
    if (index >= nodes) {
        return QAccessibleWidget::child(index - nodes);
    }

    pruneStaleItems();
    AgendaView *view = agendaView();
    const SemanticsNode &node = view->semanticsNodes()[static_cast<std::size_t>(index)];
    const auto it = m_items.constFind(node.id);
    if (it != m_items.constEnd()) {
        if (QAccessibleInterface *existing = QAccessible::accessibleInterface(it.value())) {
            return existing;
        }
    }
    auto *item = new AgendaItemAccessible(view, node.id);
    m_items.insert(node.id, QAccessible::registerAccessibleInterface(item));
    qCDebug(lcAgendaAccessibility) << "registered accessible item for node" << node.id;
    return item;
}

int AgendaAccessible::indexOfChild(const QAccessibleInterface *child) const
{
    if (!child) {
        return -1;
    }
    if (const auto *item = dynamic_cast<const AgendaItemAccessible *>(child)) {
        const AgendaView *view = agendaView();
        if (!view) {
            return -1;
        }
        const auto &nodes = view->semanticsNodes();
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            if (nodes[i].id == item->nodeId()) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }
    const int index = QAccessibleWidget::indexOfChild(child);
    return index < 0 ? -1 : index + nodeCount();
}

QAccessibleInterface *AgendaAccessible::childAt(int x, int y) const
{
    const int nodes = nodeCount();
    for (int i = 0; i < nodes; ++i) {
        QAccessibleInterface *item = child(i);
        if (item && item->rect().contains(x, y)) {
            return item;
        }
    }
    return QAccessibleWidget::childAt(x, y);
}

AgendaItemAccessible::AgendaItemAccessible(AgendaView *view, int nodeId)
    : m_view(view)
    , m_nodeId(nodeId)
{
}

bool AgendaItemAccessible::isValid() const
{
    return m_view && m_view->semanticsNode(m_nodeId) != nullptr;
}

QObject *AgendaItemAccessible::object() const
{
    return nullptr;
}

QWindow *AgendaItemAccessible::window() const
{
    if (!m_view) {
        return nullptr;
    }
    return m_view->window()->windowHandle();
}

QAccessibleInterface *AgendaItemAccessible::childAt(int x, int y) const
{
    Q_UNUSED(x);
    Q_UNUSED(y);
    return nullptr;
}

QAccessibleInterface *AgendaItemAccessible::parent() const
{
    return m_view ? QAccessible::queryAccessibleInterface(m_view.data()) : nullptr;
}

QAccessibleInterface *AgendaItemAccessible::child(int index) const
{
    Q_UNUSED(index);
    return nullptr;
}

int AgendaItemAccessible::childCount() const
{
    return 0;
}

int AgendaItemAccessible::indexOfChild(const QAccessibleInterface *child) const
{
    Q_UNUSED(child);
    return -1;
}

QString AgendaItemAccessible::text(QAccessible::Text t) const
{
    if (t != QAccessible::Name && t != QAccessible::Description) {
        return QString();
    }
    const SemanticsNode *node = m_view ? m_view->semanticsNode(m_nodeId) : nullptr;
    return node ? node->label : QString();
}

void AgendaItemAccessible::setText(QAccessible::Text t, const QString &text)
{
    Q_UNUSED(t);
    Q_UNUSED(text);
}

QRect AgendaItemAccessible::rect() const
{
    const SemanticsNode *node = m_view ? m_view->semanticsNode(m_nodeId) : nullptr;
    if (!node) {
        return QRect();
    }
    const QRect local = m_view->semanticsNodeViewportRect(*node);
    return QRect(m_view->viewport()->mapToGlobal(local.topLeft()), local.size());
}

QAccessible::Role AgendaItemAccessible::role() const
{
    return QAccessible::ListItem;
}

QAccessible::State AgendaItemAccessible::state() const
{
    QAccessible::State state;
    const SemanticsNode *node = m_view ? m_view->semanticsNode(m_nodeId) : nullptr;
    if (!node) {
        state.invalid = true;
        return state;
    }
    state.readOnly = true;
    if (!m_view->semanticsNodeViewportRect(*node).intersects(m_view->viewport()->rect())) {
        state.invisible = true;
        state.offscreen = true;
    }
    return state;
}

QAccessibleInterface *createAgendaAccessible(const QString &className, QObject *object)
{
    Q_UNUSED(className);
    if (auto *view = qobject_cast<AgendaView *>(object)) {
        return new AgendaAccessible(view);
    }
    return nullptr;
}

} // namespace ui
} // namespace agenda
