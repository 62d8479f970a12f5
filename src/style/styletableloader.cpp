/*
 * styletableloader.cpp — JSON style file parsing
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "styletableloader.h"
#include "stylekeys.h"
#include "stylematch.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

static QFont::Weight parseWeight(const QString &w)
{
    if (w == QLatin1String("bold"))
        return QFont::Bold;
    if (w == QLatin1String("normal"))
        return QFont::Normal;
    bool ok;
    int num = w.toInt(&ok);
    if (ok)
        return static_cast<QFont::Weight>(qBound(1, num, 1000));
    return QFont::Normal;
}

static Qt::Alignment parseAlignment(const QString &a)
{
    if (a == QLatin1String("center"))  return Qt::AlignCenter;
    if (a == QLatin1String("right"))   return Qt::AlignRight;
    if (a == QLatin1String("justify")) return Qt::AlignJustify;
    return Qt::AlignLeft;
}

// "#rrggbb" or { "r": .., "g": .., "b": .. }; invalid colour on failure
static QColor parseColor(const QJsonValue &value)
{
    if (value.isString())
        return QColor(value.toString());
    if (value.isObject()) {
        const QJsonObject obj = value.toObject();
        if (!obj.value(QLatin1String("r")).isDouble()
            || !obj.value(QLatin1String("g")).isDouble()
            || !obj.value(QLatin1String("b")).isDouble())
            return QColor();
        return QColor(qBound(0, obj.value(QLatin1String("r")).toInt(), 255),
                      qBound(0, obj.value(QLatin1String("g")).toInt(), 255),
                      qBound(0, obj.value(QLatin1String("b")).toInt(), 255));
    }
    return QColor();
}

bool StyleTableLoader::loadFromFile(const QString &path, StyleMatch *table)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_errorString = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        qWarning() << "StyleTableLoader:" << m_errorString;
        return false;
    }
    return loadFromJson(file.readAll(), table);
}

bool StyleTableLoader::loadFromJson(const QByteArray &json, StyleMatch *table)
{
    m_errorString.clear();
    m_warnings.clear();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull() || !doc.isObject()) {
        m_errorString = doc.isNull()
            ? QStringLiteral("invalid JSON at offset %1: %2")
                  .arg(parseError.offset).arg(parseError.errorString())
            : QStringLiteral("style file must contain a JSON object");
        qWarning() << "StyleTableLoader:" << m_errorString;
        return false;
    }

    QJsonObject root = doc.object();
    m_name = root.value(QLatin1String("name")).toString();
    if (root.contains(QLatin1String("pageLayout")))
        parsePageLayout(root.value(QLatin1String("pageLayout")).toObject());
    applyStyles(root, table);
    return true;
}

void StyleTableLoader::applyStyles(const QJsonObject &root, StyleMatch *table)
{
    QJsonObject styles = root.value(QLatin1String("styles")).toObject();
    for (auto it = styles.begin(); it != styles.end(); ++it) {
        if (!StyleKeys::isValidKey(it.key())) {
            warn(QStringLiteral("unknown style key \"%1\" ignored").arg(it.key()));
            continue;
        }
        if (!it.value().isObject()) {
            warn(QStringLiteral("style \"%1\" is not an object").arg(it.key()));
            continue;
        }

        // If this style already exists, modify it; otherwise start empty
        const ElementStyle *existing = table->style(it.key());
        ElementStyle style = parseStyle(it.key(), it.value().toObject(),
                                        existing ? *existing : ElementStyle());
        table->setStyle(it.key(), style);
    }
}

ElementStyle StyleTableLoader::parseStyle(const QString &key, const QJsonObject &props,
                                          const ElementStyle &base)
{
    ElementStyle style = base;

    for (auto it = props.begin(); it != props.end(); ++it) {
        const QString prop = it.key();
        const QJsonValue value = it.value();
        bool valid = true;

        if (prop == QLatin1String("fontFamily")) {
            valid = value.isString();
            if (valid)
                style.setFontFamily(value.toString());
        } else if (prop == QLatin1String("fontSize")) {
            valid = value.isDouble() && value.toDouble() > 0;
            if (valid)
                style.setFontSize(value.toDouble());
        } else if (prop == QLatin1String("fontWeight")) {
            valid = value.isString() || value.isDouble();
            if (valid)
                style.setFontWeight(parseWeight(value.isDouble()
                                                    ? QString::number(value.toInt())
                                                    : value.toString()));
        } else if (prop == QLatin1String("fontItalic")) {
            valid = value.isBool();
            if (valid)
                style.setFontItalic(value.toBool());
        } else if (prop == QLatin1String("underline")) {
            valid = value.isBool();
            if (valid)
                style.setFontUnderline(value.toBool());
        } else if (prop == QLatin1String("strikeOut")) {
            valid = value.isBool();
            if (valid)
                style.setFontStrikeOut(value.toBool());
        } else if (prop == QLatin1String("foreground") || prop == QLatin1String("background")) {
            const QColor color = parseColor(value);
            valid = color.isValid();
            if (valid && prop == QLatin1String("foreground"))
                style.setForeground(color);
            else if (valid)
                style.setBackground(color);
        } else if (prop == QLatin1String("spaceBefore")) {
            valid = value.isDouble();
            if (valid)
                style.setSpaceBefore(value.toDouble());
        } else if (prop == QLatin1String("spaceAfter")) {
            valid = value.isDouble();
            if (valid)
                style.setSpaceAfter(value.toDouble());
        } else if (prop == QLatin1String("alignment")) {
            valid = value.isString();
            if (valid)
                style.setAlignment(parseAlignment(value.toString()));
        } else if (prop == QLatin1String("indent")) {
            valid = value.isDouble();
            if (valid)
                style.setIndent(value.toDouble());
        } else {
            warn(QStringLiteral("unknown property \"%1\" in style \"%2\" ignored").arg(prop, key));
            continue;
        }

        if (!valid)
            warn(QStringLiteral("invalid value for \"%1\" in style \"%2\" ignored").arg(prop, key));
    }
    return style;
}

void StyleTableLoader::parsePageLayout(const QJsonObject &obj)
{
    m_pageLayout = PageLayout{};
    if (obj.contains(QLatin1String("pageSize"))) {
        QString sizeStr = obj.value(QLatin1String("pageSize")).toString();
        if (sizeStr == QLatin1String("Letter"))      m_pageLayout.pageSizeId = QPageSize::Letter;
        else if (sizeStr == QLatin1String("A5"))      m_pageLayout.pageSizeId = QPageSize::A5;
        else if (sizeStr == QLatin1String("Legal"))   m_pageLayout.pageSizeId = QPageSize::Legal;
        else if (sizeStr == QLatin1String("B5"))      m_pageLayout.pageSizeId = QPageSize::B5;
        else                                           m_pageLayout.pageSizeId = QPageSize::A4;
    }
    if (obj.contains(QLatin1String("orientation"))) {
        QString orient = obj.value(QLatin1String("orientation")).toString();
        m_pageLayout.orientation = (orient == QLatin1String("landscape"))
            ? QPageLayout::Landscape : QPageLayout::Portrait;
    }
    if (obj.contains(QLatin1String("margins"))) {
        QJsonObject m = obj.value(QLatin1String("margins")).toObject();
        m_pageLayout.margins = QMarginsF(
            m.value(QLatin1String("left")).toDouble(20.0),
            m.value(QLatin1String("top")).toDouble(20.0),
            m.value(QLatin1String("right")).toDouble(20.0),
            m.value(QLatin1String("bottom")).toDouble(20.0));
    }
}

void StyleTableLoader::warn(const QString &message)
{
    m_warnings.append(message);
    qWarning() << "StyleTableLoader:" << message;
}
