#include "health/listener_record.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace livepreview::health
{

std::string describe(const ListenerRecord &record)
{
    if (!record.is_pid_known())
    {
        return "an unidentified process";
    }
    return fmt::format("`{}` (PID: {})", record.process_name, record.process_id);
}

void to_json(nlohmann::json &j, const ListenerRecord &record)
{
    j = nlohmann::json{{"pid", record.process_id},
                       {"name", record.process_name},
                       {"port", record.port}};
}

} // namespace livepreview::health
