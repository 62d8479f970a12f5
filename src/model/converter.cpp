#include "converter.h"
#include "documentbuilder.h"
#include "scanner.h"
#include "stylematch.h"
#include "tokenbuilder.h"

#include <QDebug>
#include <QStringDecoder>

Converter::Converter(const StyleMatch &table)
    : m_table(table)
{
}

ConversionResult Converter::convert(const QByteArray &markdown) const
{
    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder(markdown);
    if (decoder.hasError()) {
        ConversionResult result;
        result.errorString = QStringLiteral("input is not valid UTF-8");
        qWarning() << "Converter:" << result.errorString;
        return result;
    }
    return convertText(text);
}

ConversionResult Converter::convertText(const QString &markdown) const
{
    ConversionResult result;

    Token::Document document;
    if (!parse(markdown, &document, &result.errorString))
        return result;

    DocumentBuilder builder(m_table);
    result.elements = builder.build(document);
    result.ok = true;
    return result;
}

bool Converter::parse(const QString &markdown, Token::Document *document, QString *errorString)
{
    Scanner scanner;
    const QList<LexicalUnit> units = scanner.scan(markdown);
    if (scanner.hasError()) {
        if (errorString)
            *errorString = QStringLiteral("malformed input: %1").arg(scanner.errorString());
        return false;
    }

    TokenBuilder builder;
    Token::Document built = builder.build(units);
    if (builder.hasError()) {
        if (errorString)
            *errorString = QStringLiteral("internal error: %1").arg(builder.errorString());
        return false;
    }

    if (document)
        *document = std::move(built);
    return true;
}
