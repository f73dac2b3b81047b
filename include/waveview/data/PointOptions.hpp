#pragma once

#include <QColor>
#include <QString>
#include <optional>

namespace waveview {
namespace data {

// Fields for adding a point, or the subset of fields to change on update.
// Unset fields keep their current (or default) value.
struct PointOptions
{
    std::optional<QString> id;
    std::optional<double> time;
    std::optional<QString> labelText;
    std::optional<QColor> color;
    std::optional<bool> editable;
};

} // namespace data
} // namespace waveview
