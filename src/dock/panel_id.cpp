#include <atomic>
#include <cstdio>
#include <mutex>
#include <quay/panel_id.hpp>
#include <random>

namespace quay
{

PanelId PanelId::generate()
{
    static std::mutex      mutex;
    static std::mt19937_64 rng{[]
                               {
                                   std::random_device rd;
                                   return (static_cast<uint64_t>(rd()) << 32) ^ rd();
                               }()};

    std::lock_guard lock(mutex);
    PanelId         id;
    do
    {
        id.hi = rng();
        id.lo = rng();
    } while (id.is_nil());
    return id;
}

std::string PanelId::to_string() const
{
    char buf[33];
    std::snprintf(buf,
                  sizeof(buf),
                  "%016llx%016llx",
                  static_cast<unsigned long long>(hi),
                  static_cast<unsigned long long>(lo));
    return buf;
}

FocusHandle next_focus_handle()
{
    static std::atomic<FocusHandle> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

}   // namespace quay
