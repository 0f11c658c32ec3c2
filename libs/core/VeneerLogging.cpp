#include "VeneerLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "veneer.app")
Q_LOGGING_CATEGORY(logStyle, "veneer.style")
Q_LOGGING_CATEGORY(logAssets, "veneer.assets")
Q_LOGGING_CATEGORY(logDebug, "veneer.debug", QtWarningMsg)
