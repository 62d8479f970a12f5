#include "tokenmodel.h"

#include <QStack>

#include <type_traits>

namespace Token {

namespace {

struct Cursor {
    const QList<Node> *nodes = nullptr;
    int index = 0;
};

template<typename T>
constexpr bool isContainer = std::is_same_v<T, Heading> || std::is_same_v<T, Paragraph>
    || std::is_same_v<T, Emphasis> || std::is_same_v<T, BlockQuote>;

} // anonymous namespace

QString plainText(const QList<Node> &nodes)
{
    QString result;
    QStack<Cursor> stack;
    stack.push({&nodes, 0});

    while (!stack.isEmpty()) {
        Cursor &top = stack.top();
        if (top.index >= top.nodes->size()) {
            stack.pop();
            continue;
        }
        const Node &node = top.nodes->at(top.index++);

        std::visit([&](const auto &n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (isContainer<T>) {
                stack.push({&n.children, 0});
            } else if constexpr (std::is_same_v<T, Link>) {
                stack.push({&n.label, 0});
            } else if constexpr (std::is_same_v<T, List>) {
                // Items pushed last-first so they come out in order
                for (int i = n.items.size() - 1; i >= 0; --i)
                    stack.push({&n.items.at(i).children, 0});
            } else if constexpr (std::is_same_v<T, Text> || std::is_same_v<T, Literal>
                                 || std::is_same_v<T, CodeSpan> || std::is_same_v<T, CodeBlock>) {
                result += n.content;
            } else if constexpr (std::is_same_v<T, Image>) {
                result += n.alt;
            } else if constexpr (std::is_same_v<T, SoftBreak>) {
                result += QLatin1Char(' ');
            }
        }, node);
    }
    return result;
}

} // namespace Token
