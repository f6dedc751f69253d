#pragma once

#include <QRectF>
#include <optional>

#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace layout {

struct RoundedRect
{
    QRectF rect;
    double radius = 0.0;
};

// A recyclable slot. The appointment pointer refers into the list the
// engine was last given; null marks the slot as free.
struct AppointmentView
{
    const data::Appointment *appointment = nullptr;
    std::optional<RoundedRect> rect;
    bool canReuse = true;

    bool isEmpty() const { return appointment == nullptr || !rect.has_value(); }
};

} // namespace layout
} // namespace agenda
