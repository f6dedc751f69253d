#include "agenda/ui/MainWindow.hpp"

#include <QCalendarWidget>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>

#include "agenda/core/AgendaSettings.hpp"
#include "agenda/core/AppContext.hpp"
#include "agenda/ui/viewmodels/AgendaViewModel.hpp"
#include "agenda/ui/widgets/AgendaView.hpp"

namespace agenda {
namespace ui {

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>())
    , m_agendaViewModel(std::make_unique<AgendaViewModel>(m_appContext->appointmentRepository()))
{
    setupUi();
    restoreAgendaState();
}

MainWindow::~MainWindow()
{
    saveAgendaState();
}

void MainWindow::setupUi()
{
    m_splitter = new QSplitter(Qt::Vertical, this);
    m_calendar = new QCalendarWidget(m_splitter);
    m_calendar->setGridVisible(false);
    m_agendaView = new AgendaView(m_splitter);
    m_splitter->addWidget(m_calendar);
    m_splitter->addWidget(m_agendaView);
    m_splitter->setStretchFactor(1, 1);
    setCentralWidget(m_splitter);

    connect(m_calendar, &QCalendarWidget::selectionChanged, this, [this]() {
        m_agendaViewModel->setSelectedDate(m_calendar->selectedDate());
    });
    connect(m_agendaViewModel.get(),
            &AgendaViewModel::appointmentsChanged,
            this,
            [this](const QDate &date, const data::AppointmentList &appointments) {
                AgendaState next = m_agendaView->state();
                next.selectedDate = date;
                next.appointments = appointments;
                m_agendaView->applyState(std::move(next));
            });
    connect(m_agendaView, &AgendaView::appointmentTapped, this, [this](const data::Appointment &appointment) {
        statusBar()->showMessage(m_agendaView->localization().appointmentDescription(appointment), 4000);
    });
    connect(m_agendaView, &AgendaView::emptyAreaTapped, this, [this]() {
        statusBar()->clearMessage();
    });
}

void MainWindow::saveAgendaState() const
{
    QSettings settings;
    core::AgendaSettings::save(settings, m_agendaView->state().config);
    settings.setValue(QStringLiteral("ui/agendaSplitter"), m_splitter->saveState());
    settings.setValue(QStringLiteral("ui/selectedDate"), m_calendar->selectedDate());
}

void MainWindow::restoreAgendaState()
{
    QSettings settings;
    m_agendaView->setLayoutConfig(core::AgendaSettings::load(settings));
    const QByteArray splitterState = settings.value(QStringLiteral("ui/agendaSplitter")).toByteArray();
    if (!splitterState.isEmpty()) {
        m_splitter->restoreState(splitterState);
    }
    QDate date = settings.value(QStringLiteral("ui/selectedDate")).toDate();
    if (!date.isValid()) {
        date = QDate::currentDate();
    }
    m_calendar->setSelectedDate(date);
    m_agendaViewModel->setSelectedDate(date);
}

} // namespace ui
} // namespace agenda
