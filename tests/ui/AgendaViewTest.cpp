#include <QtTest/QtTest>

#include <QAccessible>
#include <QLabel>
#include <QPointer>
#include <QPushButton>
#include <QScrollBar>

#include "agenda/ui/widgets/AgendaAccessible.hpp"
#include "agenda/ui/widgets/AgendaView.hpp"

using namespace agenda;

namespace {
const QDate Day(2024, 5, 1);

data::AppointmentList sampleAppointments()
{
    data::Appointment standup;
    standup.subject = "Standup";
    standup.start = QDateTime(Day, QTime(9, 0));
    standup.end = QDateTime(Day, QTime(9, 15));
    data::Appointment review;
    review.subject = "Review";
    review.start = QDateTime(Day, QTime(14, 0));
    review.end = QDateTime(Day, QTime(15, 0));
    return data::makeAppointmentList({ review, standup });
}

data::AppointmentList manyAppointments(int count)
{
    std::vector<data::Appointment> appointments;
    for (int i = 0; i < count; ++i) {
        data::Appointment appointment;
        appointment.subject = QStringLiteral("Item %1").arg(i);
        appointment.start = QDateTime(Day, QTime(8 + i, 0));
        appointment.end = appointment.start.addSecs(1800);
        appointments.push_back(appointment);
    }
    return data::makeAppointmentList(appointments);
}

// Samples a point inside the slot's padding strip, clear of any text.
QColor slotEdgeColor(ui::AgendaView *view, std::size_t slot)
{
    const QImage image = view->viewport()->grab().toImage();
    const QRect rect = view->mapFromContent(view->appointmentViews()[slot].rect->rect).toRect();
    return image.pixelColor(rect.left() + 4, rect.top() + 8);
}

ui::AppointmentBuilder labelBuilder()
{
    return [](QWidget *parent, const QDate &, const data::Appointment &appointment) -> QWidget * {
        return new QLabel(appointment.subject, parent);
    };
}
} // namespace

class AgendaViewTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void startsWithoutDate();
    void laysOutAppointmentsBesideDateColumn();
    void delegatesToBuilder();
    void builderMayDeclineSlots();
    void builderWidgetMayReplaceAppointments();
    void survivesDeletedBuilderWidget();
    void skipsRedundantLayout();
    void tapsReportAppointmentOrEmptyArea();
    void tapReceiversMayReplaceAppointments();
    void accessibleItemsFollowSemantics();
    void keepsSemanticsIdsOnRefresh();
    void relabelsSemanticsOnLocaleChange();

private:
    ui::AgendaView *m_view = nullptr;
};

void AgendaViewTest::init()
{
    m_view = new ui::AgendaView;
    m_view->resize(360, 400);
    m_view->show();
    QVERIFY(QTest::qWaitForWindowExposed(m_view));
}

void AgendaViewTest::cleanup()
{
    delete m_view;
    m_view = nullptr;
}

void AgendaViewTest::startsWithoutDate()
{
    QCOMPARE(m_view->renderMode(), ui::AgendaView::RenderMode::DefaultPaint);
    QVERIFY(m_view->appointmentViews().empty());
    QCOMPARE(m_view->semanticsNodes().size(), static_cast<size_t>(1));
    QCOMPARE(m_view->semanticsNodes().front().label, QStringLiteral("No selected date"));
}

void AgendaViewTest::laysOutAppointmentsBesideDateColumn()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(sampleAppointments());

    const double width = m_view->viewport()->width() - m_view->state().config.timeLabelWidth;
    QCOMPARE(m_view->state().config.width, width);

    const auto &views = m_view->appointmentViews();
    QCOMPARE(views.size(), static_cast<size_t>(2));
    QCOMPARE(views[0].appointment->subject, QStringLiteral("Standup"));
    QCOMPARE(views[0].rect->rect, QRectF(5, 5, width - 10, 60));
    QCOMPARE(views[1].rect->rect.top(), 70.0);

    const auto *hit = m_view->appointmentAt(QPoint(80, 30));
    QVERIFY(hit);
    QCOMPARE(hit->subject, QStringLiteral("Standup"));
    QVERIFY(!m_view->appointmentAt(QPoint(30, 30)));
}

void AgendaViewTest::delegatesToBuilder()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(sampleAppointments());
    m_view->setAppointmentBuilder(labelBuilder());

    QCOMPARE(m_view->renderMode(), ui::AgendaView::RenderMode::Delegated);
    QCOMPARE(m_view->builtWidgets().size(), static_cast<size_t>(2));
    QWidget *first = m_view->builtWidgets().front();
    QCOMPARE(first->parentWidget(), m_view->viewport());
    QCOMPARE(qobject_cast<QLabel *>(first)->text(), QStringLiteral("Standup"));
    QCOMPARE(first->geometry(), m_view->mapFromContent(m_view->appointmentViews()[0].rect->rect).toRect());
    QVERIFY(slotEdgeColor(m_view, 0) != m_view->appointmentViews()[0].appointment->color);

    QPointer<QWidget> tracked(first);
    m_view->clearAppointmentBuilder();
    QCOMPARE(m_view->renderMode(), ui::AgendaView::RenderMode::DefaultPaint);
    QVERIFY(m_view->builtWidgets().empty());
    QVERIFY(tracked->isHidden());
    QTRY_VERIFY(tracked.isNull());
    QCOMPARE(slotEdgeColor(m_view, 0), m_view->appointmentViews()[0].appointment->color);
}

void AgendaViewTest::builderMayDeclineSlots()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(sampleAppointments());
    m_view->setAppointmentBuilder([](QWidget *, const QDate &, const data::Appointment &) -> QWidget * {
        return nullptr;
    });
    QCOMPARE(m_view->renderMode(), ui::AgendaView::RenderMode::Delegated);
    QVERIFY(m_view->builtWidgets().empty());
    QCOMPARE(m_view->appointmentViews().size(), static_cast<size_t>(2));

    for (std::size_t slot = 0; slot < 2; ++slot) {
        QCOMPARE(slotEdgeColor(m_view, slot), m_view->state().style.backgroundColor);
    }
}

void AgendaViewTest::builderWidgetMayReplaceAppointments()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(sampleAppointments());
    ui::AgendaView *view = m_view;
    m_view->setAppointmentBuilder([view](QWidget *parent, const QDate &, const data::Appointment &appointment) -> QWidget * {
        auto *button = new QPushButton(appointment.subject, parent);
        QObject::connect(button, &QPushButton::clicked, view, [view]() {
            data::Appointment lunch;
            lunch.subject = "Lunch";
            lunch.start = QDateTime(Day, QTime(12, 0));
            lunch.end = QDateTime(Day, QTime(13, 0));
            view->setAppointments(data::makeAppointmentList({ lunch }));
        });
        return button;
    });
    QCOMPARE(m_view->builtWidgets().size(), static_cast<size_t>(2));

    QPointer<QWidget> clicked = m_view->builtWidgets().front();
    QTest::mouseClick(clicked.data(), Qt::LeftButton);

    QCOMPARE(m_view->builtWidgets().size(), static_cast<size_t>(1));
    QCOMPARE(qobject_cast<QPushButton *>(m_view->builtWidgets().front().data())->text(), QStringLiteral("Lunch"));
    QVERIFY(!clicked.isNull());
    QVERIFY(clicked->isHidden());
    QTRY_VERIFY(clicked.isNull());
}

void AgendaViewTest::survivesDeletedBuilderWidget()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(manyAppointments(10));
    m_view->setAppointmentBuilder(labelBuilder());
    QCOMPARE(m_view->builtWidgets().size(), static_cast<size_t>(10));
    QVERIFY(m_view->verticalScrollBar()->maximum() > 0);

    delete m_view->builtWidgets().front().data();
    QVERIFY(m_view->builtWidgets().front().isNull());

    m_view->verticalScrollBar()->setValue(50);
    const QRect second = m_view->mapFromContent(m_view->appointmentViews()[1].rect->rect).toRect();
    QCOMPARE(m_view->builtWidgets()[1]->geometry(), second);

    m_view->setAppointments(manyAppointments(3));
    QCOMPARE(m_view->builtWidgets().size(), static_cast<size_t>(3));
}

void AgendaViewTest::skipsRedundantLayout()
{
    m_view->setSelectedDate(Day);
    const auto appointments = sampleAppointments();
    m_view->setAppointments(appointments);
    const int passes = m_view->layoutPassCount();

    QCOMPARE(m_view->applyState(m_view->state()), ui::AgendaUpdate::None);
    m_view->setAppointments(appointments);
    QCOMPARE(m_view->layoutPassCount(), passes);

    ui::AgendaStyle style = m_view->state().style;
    style.appointmentTextColor = Qt::black;
    m_view->setAgendaStyle(style);
    QCOMPARE(m_view->layoutPassCount(), passes);

    m_view->setSelectedDate(Day.addDays(1));
    QCOMPARE(m_view->layoutPassCount(), passes + 1);
}

void AgendaViewTest::tapsReportAppointmentOrEmptyArea()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(sampleAppointments());

    QString tapped;
    QDate emptyDate;
    connect(m_view, &ui::AgendaView::appointmentTapped, this, [&tapped](const data::Appointment &appointment) {
        tapped = appointment.subject;
    });
    connect(m_view, &ui::AgendaView::emptyAreaTapped, this, [&emptyDate](const QDate &date) { emptyDate = date; });

    QTest::mouseClick(m_view->viewport(), Qt::LeftButton, Qt::NoModifier, QPoint(80, 100));
    QCOMPARE(tapped, QStringLiteral("Review"));
    QVERIFY(!emptyDate.isValid());

    QTest::mouseClick(m_view->viewport(), Qt::LeftButton, Qt::NoModifier, QPoint(80, 300));
    QCOMPARE(emptyDate, Day);
}

void AgendaViewTest::keepsSemanticsIdsOnRefresh()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(sampleAppointments());
    std::vector<int> before;
    for (const auto &node : m_view->semanticsNodes()) {
        before.push_back(node.id);
    }
    QCOMPARE(before.size(), static_cast<size_t>(2));

    m_view->setAppointments(sampleAppointments());
    std::vector<int> after;
    for (const auto &node : m_view->semanticsNodes()) {
        after.push_back(node.id);
    }
    QVERIFY(after == before);

    const auto *node = m_view->semanticsNode(before.front());
    QVERIFY(node);
    QCOMPARE(m_view->semanticsNodeViewportRect(*node).left(),
             static_cast<int>(m_view->state().config.timeLabelWidth) + 5);
}

void AgendaViewTest::relabelsSemanticsOnLocaleChange()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(data::makeAppointmentList({}));
    const int passes = m_view->layoutPassCount();

    layout::AgendaLayoutConfig config = m_view->state().config;
    config.localeName = "vi";
    m_view->setLayoutConfig(config);

    QCOMPARE(m_view->layoutPassCount(), passes);
    QCOMPARE(m_view->localization().localeName(), QStringLiteral("vi"));
    QVERIFY(m_view->semanticsNodes().front().label.endsWith(QString::fromUtf8("Không có sự kiện")));
}

void AgendaViewTest::tapReceiversMayReplaceAppointments()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(sampleAppointments());

    QStringList seen;
    connect(m_view, &ui::AgendaView::appointmentTapped, this, [this, &seen](const data::Appointment &appointment) {
        m_view->setAppointments(data::makeAppointmentList({}));
        seen << appointment.subject;
    });
    connect(m_view, &ui::AgendaView::appointmentTapped, this, [&seen](const data::Appointment &appointment) {
        seen << appointment.subject;
    });

    QTest::mouseClick(m_view->viewport(), Qt::LeftButton, Qt::NoModifier, QPoint(80, 30));
    QCOMPARE(seen, QStringList({ "Standup", "Standup" }));
    QVERIFY(m_view->state().appointments->empty());
}

void AgendaViewTest::accessibleItemsFollowSemantics()
{
    m_view->setSelectedDate(Day);
    m_view->setAppointments(manyAppointments(3));

    auto *accessible = dynamic_cast<ui::AgendaAccessible *>(QAccessible::queryAccessibleInterface(m_view));
    QVERIFY(accessible);
    QCOMPARE(accessible->role(), QAccessible::List);
    for (int i = 0; i < 3; ++i) {
        QCOMPARE(accessible->child(i)->role(), QAccessible::ListItem);
    }
    QCOMPARE(accessible->child(0)->text(QAccessible::Name), m_view->semanticsNodes().front().label);
    const QAccessible::Id lastItem = QAccessible::uniqueId(accessible->child(2));
    QCOMPARE(accessible->registeredItemCount(), 3);

    m_view->setAppointments(manyAppointments(1));
    QVERIFY(accessible->childCount() >= 1);
    QCOMPARE(accessible->registeredItemCount(), 1);
    QVERIFY(QAccessible::accessibleInterface(lastItem) == nullptr);

    for (int round = 0; round < 3; ++round) {
        m_view->setAppointments(manyAppointments(3));
        for (int i = 0; i < 3; ++i) {
            QVERIFY(accessible->child(i));
        }
        m_view->setAppointments(manyAppointments(1));
        accessible->childCount();
    }
    QCOMPARE(accessible->registeredItemCount(), 1);
}

QTEST_MAIN(AgendaViewTest)
#include "AgendaViewTest.moc"
