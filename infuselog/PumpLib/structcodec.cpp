/* PumpLib Struct Codec Implementation
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>
#include <QSet>

#include "structcodec.h"

// ===============================================================================================
// StructRecord

StructRecord::StructRecord(const QStringList & names, const QVector<quint32> & values, int unpackLength)
    : m_names(names), m_values(values), m_unpackLength(unpackLength)
{
    Q_ASSERT(names.size() == values.size());
    for (int i = 0; i < m_names.size(); i++) {
        m_index[m_names.at(i)] = i;
    }
}

quint32 StructRecord::value(const QString & name) const
{
    QHash<QString, int>::const_iterator it = m_index.constFind(name);
    if (it == m_index.constEnd()) {
        throw StructCodecError(StructCodecError::UnknownField,
                               QString("Record has no field named \"%1\" (fields: %2)").arg(name).arg(m_names.join(",")));
    }
    return m_values.at(it.value());
}

QVariantMap StructRecord::toVariantMap() const
{
    QVariantMap out;
    for (int i = 0; i < m_names.size(); i++) {
        out[m_names.at(i)] = m_values.at(i);
    }
    out[STR_STRUCT_UnpackLength] = m_unpackLength;
    return out;
}


// ===============================================================================================
// StructDescriptor

StructDescriptor::StructDescriptor(const QString & format, const QStringList & names)
    : m_format(format), m_names(names), m_length(0)
{
    parseFormat();

    if (m_names.size() != m_widths.size()) {
        throw StructCodecError(StructCodecError::ArityMismatch,
                               QString("Descriptor \"%1\" has %2 fields but %3 names were given")
                               .arg(m_format).arg(m_widths.size()).arg(m_names.size()));
    }
    QSet<QString> seen;
    for (const QString & name : m_names) {
        if (name == STR_STRUCT_UnpackLength) {
            throw StructCodecError(StructCodecError::DuplicateField,
                                   QString("Descriptor \"%1\" uses the reserved field name \"%2\"").arg(m_format).arg(name));
        }
        if (seen.contains(name)) {
            throw StructCodecError(StructCodecError::DuplicateField,
                                   QString("Descriptor \"%1\" names field \"%2\" twice").arg(m_format).arg(name));
        }
        seen.insert(name);
    }
}

StructDescriptor::StructDescriptor(const QString & format)
    : m_format(format), m_length(0)
{
    parseFormat();
}

int StructDescriptor::widthOf(QChar code)
{
    if (code == STRUCT_INT) {
        return 4;
    } else if (code == STRUCT_SHORT) {
        return 2;
    } else if (code == STRUCT_BYTE) {
        return 1;
    }
    throw StructCodecError(StructCodecError::UnknownWidthCode,
                           QString("Unknown width code '%1' (0x%2)").arg(code).arg(code.unicode(), 2, 16, QChar('0')));
}

void StructDescriptor::parseFormat()
{
    m_widths.reserve(m_format.size());
    for (const QChar & code : m_format) {
        int w = widthOf(code);
        m_widths.append(w);
        m_length += w;
    }
}

void StructDescriptor::checkRange(const QByteArray & buffer, int offset, const char* operation) const
{
    if (offset < 0 || offset > buffer.size() - m_length) {
        throw StructCodecError(StructCodecError::OutOfRange,
                               QString("Cannot %1 %2-byte record \"%3\" at offset %4 of a %5-byte buffer")
                               .arg(operation).arg(m_length).arg(m_format).arg(offset).arg(buffer.size()));
    }
}

StructRecord StructDescriptor::decode(const QByteArray & buffer, int offset) const
{
    if (m_names.size() != m_widths.size()) {
        throw StructCodecError(StructCodecError::ArityMismatch,
                               QString("Descriptor \"%1\" has no field names and can only be used for encoding").arg(m_format));
    }
    checkRange(buffer, offset, "decode");

    const unsigned char* b = reinterpret_cast<const unsigned char*>(buffer.constData());
    QVector<quint32> values(m_widths.size());
    int ctr = 0;
    for (int i = 0; i < m_widths.size(); i++) {
        switch (m_widths.at(i)) {
        case 4: values[i] = extractInt(b, offset + ctr); break;
        case 2: values[i] = extractShort(b, offset + ctr); break;
        default: values[i] = extractByte(b, offset + ctr); break;
        }
        ctr += m_widths.at(i);
    }
    return StructRecord(m_names, values, ctr);
}

int StructDescriptor::encode(QByteArray & buffer, int offset, const QList<quint32> & values) const
{
    if (values.size() != m_widths.size()) {
        throw StructCodecError(StructCodecError::ArityMismatch,
                               QString("Descriptor \"%1\" has %2 fields but %3 values were given")
                               .arg(m_format).arg(m_widths.size()).arg(values.size()));
    }
    checkRange(buffer, offset, "encode");

    unsigned char* b = reinterpret_cast<unsigned char*>(buffer.data());
    int ctr = 0;
    for (int i = 0; i < m_widths.size(); i++) {
        switch (m_widths.at(i)) {
        case 4: storeInt(values.at(i), b, offset + ctr); break;
        case 2: storeShort(values.at(i), b, offset + ctr); break;
        default: storeByte(values.at(i), b, offset + ctr); break;
        }
        ctr += m_widths.at(i);
    }
    return ctr;
}


// ===============================================================================================

int structLength(const QString & format)
{
    return StructDescriptor(format).length();
}

QString extractString(const QByteArray & bytes, int start, int len)
{
    if (len < 0) {
        len = bytes.size() - start;
    }
    if (start < 0 || len < 0 || start > bytes.size() - len) {
        throw StructCodecError(StructCodecError::OutOfRange,
                               QString("Cannot extract %1 characters at offset %2 of a %3-byte buffer")
                               .arg(len).arg(start).arg(bytes.size()));
    }
    return QString::fromLatin1(bytes.constData() + start, len);
}

int copyBytes(QByteArray & dst, int offset, const QByteArray & src, int count)
{
    if (count < 0 || count > src.size() || offset < 0 || offset > dst.size() - count) {
        throw StructCodecError(StructCodecError::OutOfRange,
                               QString("Cannot copy %1 of %2 bytes to offset %3 of a %4-byte buffer")
                               .arg(count).arg(src.size()).arg(offset).arg(dst.size()));
    }
    for (int i = 0; i < count; ++i) {
        dst[offset + i] = src.at(i);
    }
    return count;
}
