#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_common.hpp"
#include "monitor/reports.hpp"

#include <memory>

using json = nlohmann::json;

// Tool handler for "cpu_info".
// Samples /proc/stat over the requested window and reports total and per-core usage.

namespace {

constexpr const char *DEFAULT_DURATION = "1s";
constexpr int64_t MAX_SAMPLE_MILLISECONDS = 60 * 1000;

class CpuInfoTool : public mcp_tools::Tool {
public:
    explicit CpuInfoTool(tool_common::ToolEnvironment &environment) : environment_(environment) {}

    std::string name() const override { return "cpu_info"; }

    std::string description() const override {
        return "Report CPU model, core counts, frequency and usage sampled over a short window.";
    }

    json input_schema() const override {
        return mcp_tools::build_input_schema({
            {"duration", "Sampling window for usage", {"1s", "5s", "10s"}, "1s"},
            {"use_cache", "Serve a recent cached result when available", {"true", "false"}, "false"},
        });
    }

    mcp_tools::ToolOutcome execute(const json &arguments) override {
        std::string duration = tool_common::string_argument(arguments, "duration", DEFAULT_DURATION);
        bool use_cache = tool_common::is_true(tool_common::string_argument(arguments, "use_cache", "false"));

        int64_t sample_milliseconds = 0;
        if (!tool_common::parse_duration_milliseconds(duration, sample_milliseconds) ||
            sample_milliseconds > MAX_SAMPLE_MILLISECONDS) {
            duration = DEFAULT_DURATION;
            sample_milliseconds = 1000;
        }

        auto collected = tool_common::cached_collect<monitor::CpuInfo>(
            environment_, "cpu_info_" + duration, use_cache, std::chrono::seconds(30),
            [sample_milliseconds]() { return collectors::collect_cpu(sample_milliseconds); });
        if (!collected.success) {
            return mcp_tools::tool_failure("failed to collect CPU information: " + collected.error_detail);
        }
        return mcp_tools::tool_success(reports::format_cpu_report(collected.data, duration));
    }

private:
    tool_common::ToolEnvironment &environment_;
};

} // namespace

namespace tool_cpu_info {

void register_tool(mcp_tools::ToolRegistry &registry, tool_common::ToolEnvironment &environment) {
    registry.register_tool(std::make_unique<CpuInfoTool>(environment));
}

} // namespace tool_cpu_info
