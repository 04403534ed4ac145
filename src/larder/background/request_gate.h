#ifndef LARDER_BACKGROUND_REQUEST_GATE_H
#define LARDER_BACKGROUND_REQUEST_GATE_H

#include <mutex>
#include <unordered_set>

#include <larder/core.h>

// A request_gate enforces single-flight admission: at most one request per
// key may be active at any time. A request for a key that's already active
// is rejected (rather than queued or merged with the active one).

namespace larder {

struct request_gate;

// An admission_ticket represents an admitted request. It releases the key
// when it's destroyed.
struct admission_ticket
{
    admission_ticket(request_gate& gate, string key)
        : gate_(&gate), key_(std::move(key))
    {
    }

    admission_ticket(admission_ticket&& other)
        : gate_(other.gate_), key_(std::move(other.key_))
    {
        other.gate_ = nullptr;
    }

    admission_ticket&
    operator=(admission_ticket&& other);

    admission_ticket(admission_ticket const&) = delete;
    admission_ticket&
    operator=(admission_ticket const&) = delete;

    ~admission_ticket();

    string const&
    key() const
    {
        return key_;
    }

    // Release the key now (rather than at destruction).
    void
    release();

 private:
    request_gate* gate_;
    string key_;
};

struct request_gate : noncopyable
{
    // If :key isn't active, mark it as active and return true.
    // Otherwise, return false.
    bool
    try_admit(string const& key);

    // Mark :key as no longer active.
    void
    release(string const& key);

    // Try to admit :key, returning a ticket that releases it.
    optional<admission_ticket>
    admit(string const& key);

    bool
    is_active(string const& key);

    std::size_t
    active_count();

 private:
    std::unordered_set<string> active_keys_;
    std::mutex mutex_;
};

} // namespace larder

#endif
