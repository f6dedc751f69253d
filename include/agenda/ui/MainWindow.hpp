#pragma once

#include <QMainWindow>
#include <memory>

class QCalendarWidget;
class QSplitter;

namespace agenda {
namespace core {
class AppContext;
}

namespace ui {

class AgendaView;
class AgendaViewModel;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

private:
    void setupUi();
    void saveAgendaState() const;
    void restoreAgendaState();

    std::unique_ptr<core::AppContext> m_appContext;
    std::unique_ptr<AgendaViewModel> m_agendaViewModel;
    QSplitter *m_splitter = nullptr;
    QCalendarWidget *m_calendar = nullptr;
    AgendaView *m_agendaView = nullptr;
};

} // namespace ui
} // namespace agenda
