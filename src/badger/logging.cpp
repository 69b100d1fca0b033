/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/logging.hpp"


Q_LOGGING_CATEGORY(lcRender,   "badger.render",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcBatch,    "badger.batch",    QtInfoMsg)
Q_LOGGING_CATEGORY(lcValidate, "badger.validate", QtInfoMsg)

void badger::enableVerboseLogging()
{
    QLoggingCategory::setFilterRules(QStringLiteral("badger.*.debug=true"));
}
