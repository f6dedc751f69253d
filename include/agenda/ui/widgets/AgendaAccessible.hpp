#pragma once

#include <QAccessible>
#include <QAccessibleWidget>
#include <QHash>
#include <QPointer>

namespace agenda {
namespace ui {

class AgendaView;

// Exposes the agenda's semantics nodes as list items ahead of the
// widget's regular accessible children.
class AgendaAccessible : public QAccessibleWidget
{
public:
    explicit AgendaAccessible(AgendaView *view);
    ~AgendaAccessible() override;

    int childCount() const override;
    QAccessibleInterface *child(int index) const override;
    int indexOfChild(const QAccessibleInterface *child) const override;
    QAccessibleInterface *childAt(int x, int y) const override;

    AgendaView *agendaView() const;

    // Unregisters items whose semantics node is gone.
    void pruneStaleItems() const;
    int registeredItemCount() const { return static_cast<int>(m_items.size()); }

private:
    int nodeCount() const;

    // Semantics node id -> registered item interface.
    mutable QHash<int, QAccessible::Id> m_items;
};

class AgendaItemAccessible : public QAccessibleInterface
{
public:
    AgendaItemAccessible(AgendaView *view, int nodeId);

    int nodeId() const { return m_nodeId; }

    bool isValid() const override;
    QObject *object() const override;
    QWindow *window() const override;
    QAccessibleInterface *childAt(int x, int y) const override;
    QAccessibleInterface *parent() const override;
    QAccessibleInterface *child(int index) const override;
    int childCount() const override;
    int indexOfChild(const QAccessibleInterface *child) const override;
    QString text(QAccessible::Text t) const override;
    void setText(QAccessible::Text t, const QString &text) override;
    QRect rect() const override;
    QAccessible::Role role() const override;
    QAccessible::State state() const override;

private:
    QPointer<AgendaView> m_view;
    int m_nodeId = 0;
};

QAccessibleInterface *createAgendaAccessible(const QString &className, QObject *object);

} // namespace ui
} // namespace agenda
