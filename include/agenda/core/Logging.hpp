#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcAgendaLayout)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaPaint)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaLocale)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaAccessibility)
