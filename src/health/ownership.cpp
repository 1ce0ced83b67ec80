#include "lp_base.hpp"

#include "health/ownership.hpp"

namespace livepreview::health
{

CurrentProcessIdentity CurrentProcessIdentity::current()
{
    return CurrentProcessIdentity{platform::get_pid()};
}

std::vector<ClassifiedListener> classify(const std::vector<ListenerRecord> &records,
                                         uint64_t self_pid)
{
    std::vector<ClassifiedListener> classified;
    classified.reserve(records.size());
    for (const auto &record : records)
    {
        const bool is_self = record.is_pid_known() && record.process_id == self_pid;
        classified.push_back(ClassifiedListener{record, is_self});
    }
    return classified;
}

} // namespace livepreview::health
