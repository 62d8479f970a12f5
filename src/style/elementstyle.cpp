#include "elementstyle.h"

void ResolvedStyle::inheritCharacterFrom(const ResolvedStyle &parent)
{
    fontFamily = parent.fontFamily;
    fontSize = parent.fontSize;
    fontWeight = parent.fontWeight;
    italic = parent.italic;
    underline = parent.underline;
    strikeOut = parent.strikeOut;
    foreground = parent.foreground;
}

bool ResolvedStyle::operator==(const ResolvedStyle &other) const
{
    return fontFamily == other.fontFamily
        && fontSize == other.fontSize
        && fontWeight == other.fontWeight
        && italic == other.italic
        && underline == other.underline
        && strikeOut == other.strikeOut
        && foreground == other.foreground
        && background == other.background
        && spaceBefore == other.spaceBefore
        && spaceAfter == other.spaceAfter
        && alignment == other.alignment
        && indent == other.indent;
}

bool ElementStyle::isEmpty() const
{
    return !(m_hasFontFamily || m_hasFontSize || m_hasFontWeight || m_hasFontItalic
             || m_hasFontUnderline || m_hasFontStrikeOut || m_hasForeground
             || m_hasBackground || m_hasSpaceBefore || m_hasSpaceAfter
             || m_hasAlignment || m_hasIndent);
}

void ElementStyle::overlay(const ElementStyle &other)
{
    if (other.m_hasFontFamily)    setFontFamily(other.m_fontFamily);
    if (other.m_hasFontSize)      setFontSize(other.m_fontSize);
    if (other.m_hasFontWeight)    setFontWeight(other.m_fontWeight);
    if (other.m_hasFontItalic)    setFontItalic(other.m_fontItalic);
    if (other.m_hasFontUnderline) setFontUnderline(other.m_fontUnderline);
    if (other.m_hasFontStrikeOut) setFontStrikeOut(other.m_fontStrikeOut);
    if (other.m_hasForeground)    setForeground(other.m_foreground);
    if (other.m_hasBackground)    setBackground(other.m_background);
    if (other.m_hasSpaceBefore)   setSpaceBefore(other.m_spaceBefore);
    if (other.m_hasSpaceAfter)    setSpaceAfter(other.m_spaceAfter);
    if (other.m_hasAlignment)     setAlignment(other.m_alignment);
    if (other.m_hasIndent)        setIndent(other.m_indent);
}

void ElementStyle::applyTo(ResolvedStyle &style) const
{
    if (m_hasFontFamily)    style.fontFamily = m_fontFamily;
    if (m_hasFontSize)      style.fontSize = m_fontSize;
    if (m_hasFontWeight)    style.fontWeight = m_fontWeight;
    if (m_hasFontItalic)    style.italic = m_fontItalic;
    if (m_hasFontUnderline) style.underline = m_fontUnderline;
    if (m_hasFontStrikeOut) style.strikeOut = m_fontStrikeOut;
    if (m_hasForeground)    style.foreground = m_foreground;
    if (m_hasBackground)    style.background = m_background;
    if (m_hasSpaceBefore)   style.spaceBefore = m_spaceBefore;
    if (m_hasSpaceAfter)    style.spaceAfter = m_spaceAfter;
    if (m_hasAlignment)     style.alignment = m_alignment;
    if (m_hasIndent)        style.indent = m_indent;
}
