#include "Log.h"

Q_LOGGING_CATEGORY(lcCodec,     "ccidgadget.codec")
Q_LOGGING_CATEGORY(lcSlot,      "ccidgadget.slot")
Q_LOGGING_CATEGORY(lcEngine,    "ccidgadget.engine")
Q_LOGGING_CATEGORY(lcPump,      "ccidgadget.pump")
Q_LOGGING_CATEGORY(lcTransport, "ccidgadget.transport")
Q_LOGGING_CATEGORY(lcConfig,    "ccidgadget.config")
