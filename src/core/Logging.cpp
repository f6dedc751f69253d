#include "agenda/core/Logging.hpp"

// Enable with QT_LOGGING_RULES="agenda.*.debug=true".
Q_LOGGING_CATEGORY(lcAgendaLayout, "agenda.layout", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAgendaPaint, "agenda.paint", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAgendaLocale, "agenda.locale", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAgendaAccessibility, "agenda.a11y", QtWarningMsg)
