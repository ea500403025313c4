#include <coroutine>

#include "folio/task.hpp"

namespace folio {

bool Layout_Scheduler::run_one()
{
    if (m_ready.empty()) {
        return false;
    }
    const std::coroutine_handle<> next = m_ready.front();
    m_ready.pop_front();
    next.resume();
    return true;
}

} // namespace folio
