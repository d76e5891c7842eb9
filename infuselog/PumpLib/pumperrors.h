/* PumpLib Error Types
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef PUMPERRORS_H
#define PUMPERRORS_H

#include <stdexcept>
#include <QDateTime>
#include <QString>

/*! \class PumpLibError
    \brief Base class for all errors raised by PumpLib
 */
class PumpLibError : public std::runtime_error
{
public:
    explicit PumpLibError(const QString & message);
    virtual ~PumpLibError() throw() {}

    const QString & message() const { return m_message; }

protected:
    QString m_message;
};


/*! \class StructCodecError
    \brief Raised when a record descriptor is malformed or misused.

    These are programming errors: descriptors are fixed at build time, so the codec
    refuses to return partial or zero-filled results.
 */
class StructCodecError : public PumpLibError
{
public:
    enum Kind {
        ArityMismatch,     // descriptor length != number of names or values
        UnknownWidthCode,  // descriptor character is not one of b, s, I
        DuplicateField,    // the same field name appears twice, or clashes with "unpack_length"
        UnknownField,      // lookup of a name the record doesn't have
        OutOfRange,        // access beyond the end of a buffer
    };

    StructCodecError(Kind kind, const QString & message);
    virtual ~StructCodecError() throw() {}

    Kind kind() const { return m_kind; }

protected:
    Kind m_kind;
};


/*! \class SimulatorError
    \brief Raised when the event simulator is driven in a way it can't honor.
 */
class SimulatorError : public PumpLibError
{
public:
    explicit SimulatorError(const QString & message) : PumpLibError(message) {}
    virtual ~SimulatorError() throw() {}
};


/*! \class OrderingViolation
    \brief An event arrived with a timestamp earlier than the last accepted one.
 */
class OrderingViolation : public SimulatorError
{
public:
    OrderingViolation(const QDateTime & lastTimestamp, const QDateTime & eventTime, const QString & eventType);
    virtual ~OrderingViolation() throw() {}

    const QDateTime & lastTimestamp() const { return m_lastTimestamp; }
    const QDateTime & eventTime() const { return m_eventTime; }

protected:
    QDateTime m_lastTimestamp;
    QDateTime m_eventTime;
};


/*! \class EventFormatError
    \brief An input event record couldn't be turned into a typed event.
 */
class EventFormatError : public PumpLibError
{
public:
    explicit EventFormatError(const QString & message) : PumpLibError(message) {}
    virtual ~EventFormatError() throw() {}
};

#endif // PUMPERRORS_H
