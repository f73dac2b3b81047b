#include "waveview/core/Logging.hpp"

Q_LOGGING_CATEGORY(waveviewData, "waveview.data")
Q_LOGGING_CATEGORY(waveviewPoints, "waveview.points")
Q_LOGGING_CATEGORY(waveviewDrag, "waveview.drag")
