#ifndef LARDER_CORE_MONITORING_H
#define LARDER_CORE_MONITORING_H

namespace larder {

// Long-running operations (like network fetches) use callbacks to report
// progress or check in with their callers (which can, for example, terminate
// the operation). The following are the interface definitions for these
// callbacks and some trivial implementations.

// A progress reporter object gets called periodically with the progress of the
// operation (0 is just started, 1 is done).
struct progress_reporter_interface
{
    virtual void
    operator()(float)
        = 0;
};
// If you don't want to know about the progress, pass one of these.
struct null_progress_reporter : progress_reporter_interface
{
    void
    operator()(float)
    {
    }
};

// A check_in_interface object is called periodically by an operation. It
// provides the caller with an opportunity to abort the operation, which it
// does by throwing an exception from the call.
struct check_in_interface
{
    virtual void
    operator()()
        = 0;
};
// If you don't need to check in, pass one of these.
struct null_check_in : check_in_interface
{
    void
    operator()()
    {
    }
};

} // namespace larder

#endif
