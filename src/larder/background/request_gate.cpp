#include <larder/background/request_gate.h>

namespace larder {

admission_ticket&
admission_ticket::operator=(admission_ticket&& other)
{
    if (this != &other)
    {
        release();
        gate_ = other.gate_;
        key_ = std::move(other.key_);
        other.gate_ = nullptr;
    }
    return *this;
}

admission_ticket::~admission_ticket()
{
    release();
}

void
admission_ticket::release()
{
    if (gate_)
    {
        gate_->release(key_);
        gate_ = nullptr;
    }
}

bool
request_gate::try_admit(string const& key)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return active_keys_.insert(key).second;
}

void
request_gate::release(string const& key)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    active_keys_.erase(key);
}

optional<admission_ticket>
request_gate::admit(string const& key)
{
    if (!try_admit(key))
        return none;
    return admission_ticket(*this, key);
}

bool
request_gate::is_active(string const& key)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return active_keys_.count(key) != 0;
}

std::size_t
request_gate::active_count()
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return active_keys_.size();
}

} // namespace larder
