/*
 * converter.h — Markdown text → styled element sequence
 *
 * Runs Scanner, TokenBuilder and DocumentBuilder in order. A conversion
 * either returns the complete element sequence or an error; it never
 * returns a partial result.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_CONVERTER_H
#define MARKPRINT_CONVERTER_H

#include <QByteArray>
#include <QString>

#include "styledmodel.h"
#include "tokenmodel.h"

class StyleMatch;

struct ConversionResult {
    bool ok = false;
    QString errorString;
    Styled::Document elements;
};

class Converter
{
public:
    explicit Converter(const StyleMatch &table);

    // Input must be valid UTF-8
    ConversionResult convert(const QByteArray &markdown) const;
    ConversionResult convertText(const QString &markdown) const;

    // First two stages only; returns false and sets *errorString on failure
    static bool parse(const QString &markdown, Token::Document *document,
                      QString *errorString = nullptr);

private:
    const StyleMatch &m_table;
};

#endif // MARKPRINT_CONVERTER_H
