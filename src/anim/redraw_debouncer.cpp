#include "redraw_debouncer.hpp"

#include <tracemark/logger.hpp>

namespace tracemark
{

RedrawDebouncer::RedrawDebouncer(Duration delay) : delay_(delay) {}

void RedrawDebouncer::request(TimePoint now)
{
    ++requests_;
    deadline_ = now + delay_;
}

bool RedrawDebouncer::poll(TimePoint now)
{
    if (!deadline_ || now < *deadline_)
        return false;

    deadline_.reset();
    ++fires_;
    TRACEMARK_LOG_TRACE("sync", "Redraw after {} requests", requests_);
    if (callback_)
        callback_();
    return true;
}

}   // namespace tracemark
