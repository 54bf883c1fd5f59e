#pragma once

#include <stdexcept>
#include <string>

namespace FanoutBench
{

//
// Error taxonomy
//
//   Every failure the core can observe is one of these. They are thrown at the point of
//   failure and converted into typed records (or logged) by the layer that owns recovery.
//

// A resource pool could not hand out a handle within its wait budget.
class PoolTimeout final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A submitted task did not complete within the window its waiter allowed.
class TaskTimeout final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A sub-fetch failed for any reason other than a timeout.
class ProcessingError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The batch-level await failed; the driver degrades the batch instead of propagating.
class BatchFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The preferred scheduling substrate could not be constructed.
class SubstrateUnavailable final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Work was submitted to an executor that is shut down or saturated with the abort policy.
class TaskRejected final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raised by the mock upstream client to simulate an API failure.
class SimulatedApiError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace FanoutBench
