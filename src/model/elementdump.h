#ifndef MARKPRINT_ELEMENTDUMP_H
#define MARKPRINT_ELEMENTDUMP_H

#include <QJsonArray>
#include <QJsonObject>

#include "styledmodel.h"

// JSON view of a styled element sequence, used by `markprint --dump`
namespace ElementDump {

QJsonArray toJson(const Styled::Document &document);
QJsonObject styleToJson(const ResolvedStyle &style);

} // namespace ElementDump

#endif // MARKPRINT_ELEMENTDUMP_H
