#include "storage/store_log.hpp"

Q_LOGGING_CATEGORY(nomStoreLog, "nom.store", QtWarningMsg)
