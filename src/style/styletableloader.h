/*
 * styletableloader.h — JSON style file → StyleMatch + PageLayout
 *
 * {
 *   "name": "Default",
 *   "pageLayout": { "pageSize": "A4", "orientation": "portrait",
 *                   "margins": { "left": 20, "top": 20, "right": 20, "bottom": 20 } },
 *   "styles": { "heading-1": { "fontSize": 24, "foreground": "#202020" },
 *               "list-item.emphasis": { "foreground": { "r": 85, "g": 85, "b": 85 } } }
 * }
 *
 * Unknown style keys and properties are reported as warnings and skipped.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_STYLETABLELOADER_H
#define MARKPRINT_STYLETABLELOADER_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "elementstyle.h"
#include "pagelayout.h"

class StyleMatch;

class StyleTableLoader
{
public:
    StyleTableLoader() = default;

    // Both return false (leaving `table` untouched) when the file cannot be
    // read or is not a JSON object.
    bool loadFromFile(const QString &path, StyleMatch *table);
    bool loadFromJson(const QByteArray &json, StyleMatch *table);

    // Entries in `root["styles"]` are merged over existing ones
    void applyStyles(const QJsonObject &root, StyleMatch *table);

    QString name() const { return m_name; }
    PageLayout pageLayout() const { return m_pageLayout; }
    QString errorString() const { return m_errorString; }
    QStringList warnings() const { return m_warnings; }

private:
    ElementStyle parseStyle(const QString &key, const QJsonObject &props, const ElementStyle &base);
    void parsePageLayout(const QJsonObject &obj);
    void warn(const QString &message);

    QString m_name;
    PageLayout m_pageLayout;
    QString m_errorString;
    QStringList m_warnings;
};

#endif // MARKPRINT_STYLETABLELOADER_H
