#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(waveviewData)
Q_DECLARE_LOGGING_CATEGORY(waveviewPoints)
Q_DECLARE_LOGGING_CATEGORY(waveviewDrag)
