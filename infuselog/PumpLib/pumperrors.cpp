/* PumpLib Error Types
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "pumperrors.h"

PumpLibError::PumpLibError(const QString & message)
    : std::runtime_error(message.toStdString()), m_message(message)
{
}

StructCodecError::StructCodecError(Kind kind, const QString & message)
    : PumpLibError(message), m_kind(kind)
{
}

OrderingViolation::OrderingViolation(const QDateTime & lastTimestamp, const QDateTime & eventTime, const QString & eventType)
    : SimulatorError(QString("Timestamps must be in order. Current timestamp was [%1], but got %2 at [%3]")
                     .arg(lastTimestamp.toString(Qt::ISODateWithMs))
                     .arg(eventType)
                     .arg(eventTime.toString(Qt::ISODateWithMs))),
      m_lastTimestamp(lastTimestamp), m_eventTime(eventTime)
{
}
