/*
 * delimiterresolver.cpp — Bracket and delimiter stacks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "delimiterresolver.h"

namespace {

struct BracketOpener {
    int index = 0;
    bool image = false;
    bool active = true;
};

} // anonymous namespace

QList<DelimiterPlan> DelimiterResolver::resolve(const QList<LexicalUnit> &units)
{
    m_units = &units;
    m_plan = QList<DelimiterPlan>(units.size());
    m_activeOpeners = 0;

    pairLinks();
    pairEmphasis();

    m_units = nullptr;
    return std::move(m_plan);
}

void DelimiterResolver::pairLinks()
{
    const QList<LexicalUnit> &units = *m_units;
    QList<BracketOpener> brackets;

    for (int i = 0; i < units.size(); ++i) {
        const LexicalUnit &unit = units.at(i);

        if (unit.kind == LexicalUnit::LinkTarget) {
            // Not claimed by a preceding "]"
            m_plan[i].role = DelimiterPlan::Literal;
            continue;
        }
        if (unit.kind != LexicalUnit::LinkBracket)
            continue;

        if (unit.marker == QLatin1Char('[')) {
            if (brackets.size() >= MaxNestingDepth)
                m_plan[i].role = DelimiterPlan::Literal;
            else
                brackets.append({i, unit.image, true});
            continue;
        }

        // Closing bracket
        if (brackets.isEmpty()) {
            m_plan[i].role = DelimiterPlan::Literal;
            continue;
        }
        const BracketOpener opener = brackets.takeLast();
        const bool hasTarget = i + 1 < units.size()
            && units.at(i + 1).kind == LexicalUnit::LinkTarget
            && !units.at(i + 1).info.isEmpty();
        if (!opener.active || !hasTarget) {
            m_plan[opener.index].role = DelimiterPlan::Literal;
            m_plan[i].role = DelimiterPlan::Literal;
            continue;
        }

        m_plan[opener.index].role = DelimiterPlan::LinkOpen;
        m_plan[i].role = DelimiterPlan::LinkClose;
        m_plan[i + 1].role = DelimiterPlan::LinkTarget;
        ++i;

        // No links inside links; images may still contain them
        if (!opener.image) {
            for (BracketOpener &b : brackets) {
                if (!b.image)
                    b.active = false;
            }
        }
    }

    for (const BracketOpener &b : brackets)
        m_plan[b.index].role = DelimiterPlan::Literal;
}

void DelimiterResolver::pairEmphasis()
{
    const QList<LexicalUnit> &units = *m_units;

    // One delimiter stack per open link label, plus the outermost one
    QList<QList<int>> segments;
    segments.append(QList<int>());

    for (int i = 0; i < units.size(); ++i) {
        switch (m_plan.at(i).role) {
        case DelimiterPlan::LinkOpen:
            segments.append(QList<int>());
            continue;
        case DelimiterPlan::LinkClose:
            abandonOpeners(segments.last());
            segments.removeLast();
            continue;
        default:
            break;
        }
        if (units.at(i).kind == LexicalUnit::EmphasisMarker)
            closeEmphasisRun(i, segments.last());
    }

    for (QList<int> &openers : segments)
        abandonOpeners(openers);
}

void DelimiterResolver::closeEmphasisRun(int index, QList<int> &openers)
{
    const LexicalUnit &run = m_units->at(index);
    DelimiterPlan &plan = m_plan[index];
    int remaining = run.count;

    if (run.canClose) {
        while (remaining > 0) {
            int found = -1;
            for (int k = openers.size() - 1; k >= 0; --k) {
                const int candidate = openers.at(k);
                if (m_units->at(candidate).marker == run.marker
                    && m_plan.at(candidate).openLength <= remaining) {
                    found = k;
                    break;
                }
            }
            if (found < 0)
                break;

            // Openers between the pair can no longer close properly
            while (openers.size() - 1 > found) {
                DelimiterPlan &skipped = m_plan[openers.takeLast()];
                skipped.literalLength += skipped.openLength;
                skipped.openLength = 0;
                --m_activeOpeners;
            }

            remaining -= m_plan.at(openers.takeLast()).openLength;
            --m_activeOpeners;
            ++plan.closeCount;
        }
    }

    if (remaining <= 0)
        return;

    if (run.canOpen && m_activeOpeners < MaxNestingDepth) {
        plan.openLength = remaining;
        openers.append(index);
        ++m_activeOpeners;
    } else {
        plan.literalLength = remaining;
    }
}

void DelimiterResolver::abandonOpeners(QList<int> &openers)
{
    for (int index : openers) {
        DelimiterPlan &plan = m_plan[index];
        plan.literalLength += plan.openLength;
        plan.openLength = 0;
        --m_activeOpeners;
    }
    openers.clear();
}
