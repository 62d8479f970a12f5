/*
 * elementstyle.h — Partial and resolved style records
 *
 * ElementStyle is what a style-table entry, a built-in default or a token's
 * inline override carries: every property is optional and tracked by a
 * has-flag. ResolvedStyle is the concrete result after all layers are merged.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_ELEMENTSTYLE_H
#define MARKPRINT_ELEMENTSTYLE_H

#include <QColor>
#include <QFont>
#include <QString>
#include <Qt>

struct ResolvedStyle {
    // Character properties (inherited by nested tokens)
    QString fontFamily = QStringLiteral("Noto Serif");
    qreal fontSize = 11.0;
    QFont::Weight fontWeight = QFont::Normal;
    bool italic = false;
    bool underline = false;
    bool strikeOut = false;
    QColor foreground = QColor(0x1a, 0x1a, 0x1a);

    // Block properties (not inherited)
    QColor background;          // invalid = transparent
    qreal spaceBefore = 0;
    qreal spaceAfter = 0;
    Qt::Alignment alignment = Qt::AlignLeft;
    qreal indent = 0;           // points per list level

    void inheritCharacterFrom(const ResolvedStyle &parent);

    bool operator==(const ResolvedStyle &other) const;
    bool operator!=(const ResolvedStyle &other) const { return !(*this == other); }
};

class ElementStyle
{
public:
    ElementStyle() = default;

    // Setters
    void setFontFamily(const QString &family) { m_fontFamily = family; m_hasFontFamily = true; }
    void setFontSize(qreal pts) { m_fontSize = pts; m_hasFontSize = true; }
    void setFontWeight(QFont::Weight w) { m_fontWeight = w; m_hasFontWeight = true; }
    void setFontItalic(bool on) { m_fontItalic = on; m_hasFontItalic = true; }
    void setFontUnderline(bool on) { m_fontUnderline = on; m_hasFontUnderline = true; }
    void setFontStrikeOut(bool on) { m_fontStrikeOut = on; m_hasFontStrikeOut = true; }
    void setForeground(const QColor &c) { m_foreground = c; m_hasForeground = true; }
    void setBackground(const QColor &c) { m_background = c; m_hasBackground = true; }
    void setSpaceBefore(qreal pts) { m_spaceBefore = pts; m_hasSpaceBefore = true; }
    void setSpaceAfter(qreal pts) { m_spaceAfter = pts; m_hasSpaceAfter = true; }
    void setAlignment(Qt::Alignment a) { m_alignment = a; m_hasAlignment = true; }
    void setIndent(qreal pts) { m_indent = pts; m_hasIndent = true; }

    // Getters
    QString fontFamily() const { return m_fontFamily; }
    qreal fontSize() const { return m_fontSize; }
    QFont::Weight fontWeight() const { return m_fontWeight; }
    bool fontItalic() const { return m_fontItalic; }
    bool fontUnderline() const { return m_fontUnderline; }
    bool fontStrikeOut() const { return m_fontStrikeOut; }
    QColor foreground() const { return m_foreground; }
    QColor background() const { return m_background; }
    qreal spaceBefore() const { return m_spaceBefore; }
    qreal spaceAfter() const { return m_spaceAfter; }
    Qt::Alignment alignment() const { return m_alignment; }
    qreal indent() const { return m_indent; }

    // Has* flags
    bool hasFontFamily() const { return m_hasFontFamily; }
    bool hasFontSize() const { return m_hasFontSize; }
    bool hasFontWeight() const { return m_hasFontWeight; }
    bool hasFontItalic() const { return m_hasFontItalic; }
    bool hasFontUnderline() const { return m_hasFontUnderline; }
    bool hasFontStrikeOut() const { return m_hasFontStrikeOut; }
    bool hasForeground() const { return m_hasForeground; }
    bool hasBackground() const { return m_hasBackground; }
    bool hasSpaceBefore() const { return m_hasSpaceBefore; }
    bool hasSpaceAfter() const { return m_hasSpaceAfter; }
    bool hasAlignment() const { return m_hasAlignment; }
    bool hasIndent() const { return m_hasIndent; }

    bool isEmpty() const;

    // Properties set in `other` replace ours; unset ones leave ours alone
    void overlay(const ElementStyle &other);

    // Write every set property into a concrete style
    void applyTo(ResolvedStyle &style) const;

private:
    QString m_fontFamily;
    qreal m_fontSize = 0;
    QFont::Weight m_fontWeight = QFont::Normal;
    bool m_fontItalic = false;
    bool m_fontUnderline = false;
    bool m_fontStrikeOut = false;
    QColor m_foreground;
    QColor m_background;
    qreal m_spaceBefore = 0;
    qreal m_spaceAfter = 0;
    Qt::Alignment m_alignment = Qt::AlignLeft;
    qreal m_indent = 0;

    bool m_hasFontFamily = false;
    bool m_hasFontSize = false;
    bool m_hasFontWeight = false;
    bool m_hasFontItalic = false;
    bool m_hasFontUnderline = false;
    bool m_hasFontStrikeOut = false;
    bool m_hasForeground = false;
    bool m_hasBackground = false;
    bool m_hasSpaceBefore = false;
    bool m_hasSpaceAfter = false;
    bool m_hasAlignment = false;
    bool m_hasIndent = false;
};

#endif // MARKPRINT_ELEMENTSTYLE_H
