/* PumpLib Struct Codec Header
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef STRUCTCODEC_H
#define STRUCTCODEC_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>

#include "PumpLib/pumperrors.h"

// Width codes understood by StructDescriptor, all unsigned little-endian.
const QChar STRUCT_BYTE  = 'b';  // 1 byte
const QChar STRUCT_SHORT = 's';  // 2 bytes
const QChar STRUCT_INT   = 'I';  // 4 bytes

// Synthetic field added to StructRecord::toVariantMap()
const QString STR_STRUCT_UnpackLength = "unpack_length";


// Raw little-endian accessors. Callers are responsible for bounds.
inline quint32 extractInt(const unsigned char* b, int st)
{
    // The top byte is scaled rather than shifted so that values >= 2^31 can never
    // pass through a signed intermediate.
    return (16777216u * (quint32) b[st+3]) + ((quint32) b[st+2] << 16) + ((quint32) b[st+1] << 8) + (quint32) b[st];
}
inline quint16 extractShort(const unsigned char* b, int st)
{
    return (quint16) ((b[st+1] << 8) + b[st]);
}
inline quint8 extractByte(const unsigned char* b, int st)
{
    return b[st];
}
inline void storeInt(quint32 v, unsigned char* b, int st)
{
    b[st]     = v & 0xFF;
    b[st + 1] = (v >> 8) & 0xFF;
    b[st + 2] = (v >> 16) & 0xFF;
    b[st + 3] = (v >> 24) & 0xFF;
}
inline void storeShort(quint32 v, unsigned char* b, int st)
{
    b[st]     = v & 0xFF;
    b[st + 1] = (v >> 8) & 0xFF;
}
inline void storeByte(quint32 v, unsigned char* b, int st)
{
    b[st] = v & 0xFF;
}


/*! \class StructRecord
    \brief The named fields decoded from one fixed-layout record
 */
class StructRecord
{
public:
    StructRecord() : m_unpackLength(0) {}
    StructRecord(const QStringList & names, const QVector<quint32> & values, int unpackLength);

    //! \brief Returns the value of the named field, throwing StructCodecError if there is no such field.
    quint32 value(const QString & name) const;
    quint32 operator[](const QString & name) const { return value(name); }
    bool contains(const QString & name) const { return m_index.contains(name); }

    const QStringList & names() const { return m_names; }
    const QVector<quint32> & values() const { return m_values; }

    //! \brief Number of bytes consumed from the buffer, so callers can advance a read cursor.
    int unpackLength() const { return m_unpackLength; }

    //! \brief All fields plus the synthetic "unpack_length" field.
    QVariantMap toVariantMap() const;

protected:
    QStringList m_names;
    QVector<quint32> m_values;
    QHash<QString, int> m_index;
    int m_unpackLength;
};


/*! \class StructDescriptor
    \brief Declarative description of a fixed-layout hardware record.

    The format is a string of width codes ('b', 's', 'I'), one per field. Both the
    codes and the number of field names are validated when the descriptor is built,
    so a bad descriptor fails at construction rather than on the first record.
 */
class StructDescriptor
{
public:
    //! \brief Descriptor for decoding and encoding, with one name per width code.
    StructDescriptor(const QString & format, const QStringList & names);
    //! \brief Encode-only descriptor; decode() on it throws ArityMismatch.
    explicit StructDescriptor(const QString & format);

    const QString & format() const { return m_format; }
    const QStringList & names() const { return m_names; }
    int fieldCount() const { return m_widths.size(); }
    int width(int field) const { return m_widths.at(field); }

    //! \brief Total record length in bytes.
    int length() const { return m_length; }

    //! \brief Decode one record starting at offset.
    StructRecord decode(const QByteArray & buffer, int offset = 0) const;

    //! \brief Store values into buffer starting at offset and return the number of bytes written.
    // The buffer must already be large enough; it is never resized.
    int encode(QByteArray & buffer, int offset, const QList<quint32> & values) const;

    //! \brief Width in bytes of a single code, throwing UnknownWidthCode for anything else.
    static int widthOf(QChar code);

protected:
    void parseFormat();
    void checkRange(const QByteArray & buffer, int offset, const char* operation) const;

    QString m_format;
    QStringList m_names;
    QVector<int> m_widths;
    int m_length;
};


//! \brief Sum of the widths in format, validated the same way as a descriptor.
int structLength(const QString & format);

//! \brief Interpret len bytes at start as a one-byte-per-character string; len < 0 reads to the end of the buffer.
QString extractString(const QByteArray & bytes, int start, int len = -1);

//! \brief Copy count raw bytes from src into dst at offset, returning count.
int copyBytes(QByteArray & dst, int offset, const QByteArray & src, int count);

#endif // STRUCTCODEC_H
