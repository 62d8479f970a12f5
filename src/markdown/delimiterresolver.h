/*
 * delimiterresolver.h — Pairs link brackets and emphasis runs
 *
 * Works on the inline units of one block and decides, per unit, what role
 * it plays in the token tree. Links are paired first with a bracket stack;
 * emphasis is then paired with a delimiter stack separately inside each
 * link label and outside all links, so emphasis never crosses a link
 * boundary. Anything that does not pair is marked literal.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_DELIMITERRESOLVER_H
#define MARKPRINT_DELIMITERRESOLVER_H

#include <QList>

#include "lexicalunit.h"

struct DelimiterPlan {
    enum Role {
        Plain,      // not a delimiter, or an emphasis run (see the counts)
        LinkOpen,   // "[" or "![" that starts a link or image
        LinkClose,  // "]" that ends one
        LinkTarget, // "(url)" belonging to the preceding LinkClose
        Literal     // bracket or target that did not form a link
    };

    Role role = Plain;

    // Emphasis runs: characters are consumed as closes first, then the
    // remainder is either literal text or opens one new emphasis frame.
    int closeCount = 0;
    int literalLength = 0;
    int openLength = 0;
};

class DelimiterResolver
{
public:
    // Bounds the nesting of emphasis frames and of link brackets
    static constexpr int MaxNestingDepth = 64;

    QList<DelimiterPlan> resolve(const QList<LexicalUnit> &units);

private:
    void pairLinks();
    void pairEmphasis();
    void closeEmphasisRun(int index, QList<int> &openers);
    void abandonOpeners(QList<int> &openers);

    const QList<LexicalUnit> *m_units = nullptr;
    QList<DelimiterPlan> m_plan;
    int m_activeOpeners = 0;
};

#endif // MARKPRINT_DELIMITERRESOLVER_H
