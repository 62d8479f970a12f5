/*
 * styleresolver.h — Token kind + ancestry + style table → ResolvedStyle
 *
 * Layers, later ones overriding earlier ones per property:
 *   1. built-in default for the kind
 *   2. table entry for the family key, then for the specific key
 *   3. most specific composite entry matching the ancestry
 *   4. inline overrides carried by the token
 * Character properties not set by any layer are inherited from the
 * enclosing token's resolved style; block properties are not.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_STYLERESOLVER_H
#define MARKPRINT_STYLERESOLVER_H

#include "elementstyle.h"
#include "stylekeys.h"

#include <QList>

class StyleMatch;

class StyleResolver
{
public:
    explicit StyleResolver(const StyleMatch &table);

    // Resolves `key` by folding the whole chain from the document root.
    // `ancestry` lists the enclosing kinds, root first.
    ResolvedStyle resolve(const StyleKey &key, const QList<StyleKey> &ancestry,
                          const ElementStyle &overrides = ElementStyle()) const;

    // Incremental form: `parent` is the already resolved style of the
    // nearest enclosing token, or nullptr at the root.
    ResolvedStyle resolveChild(const ResolvedStyle *parent, const StyleKey &key,
                               const QList<StyleKey> &ancestry,
                               const ElementStyle &overrides = ElementStyle()) const;

    static ElementStyle builtinStyle(const StyleKey &key);

private:
    const StyleMatch &m_table;
};

#endif // MARKPRINT_STYLERESOLVER_H
