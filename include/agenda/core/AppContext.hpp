#pragma once

#include <memory>

namespace agenda {
namespace data {
class AppointmentRepository;
}

namespace core {

class AppContext
{
public:
    AppContext();
    ~AppContext();

    data::AppointmentRepository &appointmentRepository();

private:
    void seedDemoData();

    std::unique_ptr<data::AppointmentRepository> m_appointmentRepository;
};

} // namespace core
} // namespace agenda
