#include "mdlog/core/ParseError.hpp"

namespace mdlog {
namespace core {

QString ParseError::errorString() const
{
    switch (kind) {
    case StructuralError:
        return QStringLiteral("structural error at offset %1: %2").arg(offset).arg(message);
    case DateResolutionError:
        return QStringLiteral("date resolution failed at offset %1: %2").arg(offset).arg(message);
    case NoError:
    default:
        return QStringLiteral("no error occurred");
    }
}

} // namespace core
} // namespace mdlog
