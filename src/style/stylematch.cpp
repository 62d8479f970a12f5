#include "stylematch.h"

namespace {

struct CompositeRank {
    int segments = 0;
    int specificSegments = 0;
};

// Matches segments right to left against the ancestry, nearest ancestor
// first. Returns false when some segment has no matching ancestor.
bool matchComposite(const QStringList &segments, const StyleKey &key,
                    const QList<StyleKey> &ancestry, CompositeRank &rank)
{
    if (segments.size() < 2 || !key.matches(segments.last()))
        return false;

    rank.segments = segments.size();
    rank.specificSegments = segments.last() == key.specific ? 1 : 0;

    int j = ancestry.size() - 1;
    for (int s = segments.size() - 2; s >= 0; --s) {
        const QString &segment = segments.at(s);
        while (j >= 0 && !ancestry.at(j).matches(segment))
            --j;
        if (j < 0)
            return false;
        if (ancestry.at(j).specific == segment)
            ++rank.specificSegments;
        --j;
    }
    return true;
}

} // anonymous namespace

void StyleMatch::setStyle(const QString &key, const ElementStyle &style)
{
    m_styles.insert(key, style);
}

const ElementStyle *StyleMatch::style(const QString &key) const
{
    auto it = m_styles.constFind(key);
    if (it != m_styles.constEnd())
        return &it.value();
    return nullptr;
}

QStringList StyleMatch::compositeKeys() const
{
    QStringList result;
    for (auto it = m_styles.constBegin(); it != m_styles.constEnd(); ++it) {
        if (it.key().contains(QLatin1Char('.')))
            result.append(it.key());
    }
    result.sort();
    return result;
}

const ElementStyle *StyleMatch::bestComposite(const StyleKey &key,
                                              const QList<StyleKey> &ancestry,
                                              QString *matchedKey) const
{
    const ElementStyle *best = nullptr;
    QString bestKey;
    CompositeRank bestRank;

    for (auto it = m_styles.constBegin(); it != m_styles.constEnd(); ++it) {
        if (!it.key().contains(QLatin1Char('.')))
            continue;

        CompositeRank rank;
        if (!matchComposite(it.key().split(QLatin1Char('.')), key, ancestry, rank))
            continue;

        bool better = false;
        if (!best)
            better = true;
        else if (rank.segments != bestRank.segments)
            better = rank.segments > bestRank.segments;
        else if (rank.specificSegments != bestRank.specificSegments)
            better = rank.specificSegments > bestRank.specificSegments;
        else
            better = it.key() < bestKey; // hash order must not decide

        if (better) {
            best = &it.value();
            bestKey = it.key();
            bestRank = rank;
        }
    }

    if (matchedKey)
        *matchedKey = bestKey;
    return best;
}
