#ifndef MAPCORE_THREAD_AFFINITY_HPP
#define MAPCORE_THREAD_AFFINITY_HPP

#ifdef _WIN32
#include <windows.h>
#elif defined(__linux__)
#include <pthread.h>
#include <sched.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#include <mach/thread_policy.h>
#include <pthread.h>
#endif

#include <thread>

namespace mapcore
{
namespace util
{

// Number of CPUs the scheduler reports, never 0.
inline unsigned core_count() noexcept
{
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

// Pins the calling thread to core `id` (taken modulo core_count()).
// Returns false where pinning is unsupported or refused.
inline bool use_core(int id) noexcept
{
    if (id < 0) return false;
    id = static_cast<int>(static_cast<unsigned>(id) % core_count());
#ifdef _WIN32
    HANDLE    thread = GetCurrentThread();
    DWORD_PTR mask   = (static_cast<DWORD_PTR>(1) << id);
    return SetThreadAffinityMask(thread, mask) != 0;
#elif defined(__linux__)
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(id, &cpuset);
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
#elif defined(__APPLE__)
    thread_affinity_policy_data_t policy = {id};
    return thread_policy_set(pthread_mach_thread_np(pthread_self()),
                             THREAD_AFFINITY_POLICY, (thread_policy_t)&policy, 1) == KERN_SUCCESS;
#else
    return false;
#endif
}

}  // namespace util
}  // namespace mapcore

#endif  // MAPCORE_THREAD_AFFINITY_HPP
