#include "task/task_registry.hpp"

#include <chrono>
#include <stdexcept>

namespace {

JobResult sleepTask(const CancelToken& token, const nlohmann::json& params) {
    double seconds = params.value("seconds", 1.0);
    if (seconds < 0) {
        throw std::invalid_argument("sleep: seconds must not be negative");
    }
    token.sleepFor(std::chrono::duration<double>(seconds));
    return nlohmann::json{{"slept", seconds}};
}

JobResult failTask(const CancelToken&, const nlohmann::json& params) {
    throw std::runtime_error(params.value("message", std::string("task failed")));
}

JobResult sumTask(const CancelToken& token, const nlohmann::json& params) {
    double total = 0;
    for (const auto& v : params.at("values")) {
        token.throwIfCancelled();
        total += v.get<double>();
    }
    return nlohmann::json{{"sum", total}};
}

JobResult echoTask(const CancelToken&, const nlohmann::json& params) {
    return params;
}

} // namespace

void registerBuiltinTasks(TaskRegistry& registry) {
    registry.registerTask("sleep", sleepTask);
    registry.registerTask("fail", failTask);
    registry.registerTask("sum", sumTask);
    registry.registerTask("echo", echoTask);
}
