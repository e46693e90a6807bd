#pragma once

#include <QLoggingCategory>

// "nom.store": warnings are always on, info lines only when enabled
// through the filter rules (see app::enable_verbose_logging).
Q_DECLARE_LOGGING_CATEGORY(nomStoreLog)
