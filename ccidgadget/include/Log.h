#ifndef CCIDGADGET_LOG_H
#define CCIDGADGET_LOG_H
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcCodec)
Q_DECLARE_LOGGING_CATEGORY(lcSlot)
Q_DECLARE_LOGGING_CATEGORY(lcEngine)
Q_DECLARE_LOGGING_CATEGORY(lcPump)
Q_DECLARE_LOGGING_CATEGORY(lcTransport)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

#endif // CCIDGADGET_LOG_H
