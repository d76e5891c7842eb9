/* PumpLib Event Reader Header
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef EVENTREADER_H
#define EVENTREADER_H

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>

#include "PumpLib/pumpevent.h"

/*! \class EventReader
    \brief Converts between JSON event records and typed pump events.

    Input records carry a "type" tag, a "time" string and the fields of their kind.
    Anything that can't be turned into a typed event raises EventFormatError.
 */
class EventReader
{
public:
    //! \brief Build a typed event from one record.
    static PumpEventPtr fromJson(const QJsonObject & record);

    //! \brief Parse a JSON array of records, in file order.
    static QList<PumpEventPtr> readArray(const QByteArray & json);

    //! \brief Read and parse a file containing a JSON array of records.
    static QList<PumpEventPtr> readFile(const QString & filename);

    //! \brief Serialize events to their canonical upload form.
    static QJsonArray toJsonArray(const QList<PumpEventPtr> & events);

protected:
    static QDateTime readDateTime(const QJsonObject & record, const QString & key);
    static double readDouble(const QJsonObject & record, const QString & key, bool required = true);
    static qint64 readDuration(const QJsonObject & record, const QString & key);
    static QString readString(const QJsonObject & record, const QString & key);
    static BolusEvent readBolus(const QJsonObject & record, const QDateTime & defaultTime);
};

#endif // EVENTREADER_H
