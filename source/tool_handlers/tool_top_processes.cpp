#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_common.hpp"
#include "monitor/reports.hpp"

#include <cerrno>
#include <cstdlib>
#include <memory>

using json = nlohmann::json;

// Tool handler for "top_processes".
// Lists the heaviest processes by CPU or resident memory.

namespace {

constexpr long DEFAULT_LIMIT = 10;
constexpr long MAX_LIMIT = 100;

// Values outside 1..MAX_LIMIT, and anything that is not a whole number, fall back to the default.
long parse_limit(const std::string &text) {
    errno = 0;
    char *end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value <= 0 || value > MAX_LIMIT) {
        return DEFAULT_LIMIT;
    }
    return value;
}

class TopProcessesTool : public mcp_tools::Tool {
public:
    explicit TopProcessesTool(tool_common::ToolEnvironment &environment) : environment_(environment) {}

    std::string name() const override { return "top_processes"; }

    std::string description() const override {
        return "List the processes using the most CPU or memory.";
    }

    json input_schema() const override {
        return mcp_tools::build_input_schema({
            {"sort_by", "Ranking key", {"cpu", "memory"}, "memory"},
            {"limit", "Number of processes to list (1-100)", {}, "10"},
            {"use_cache", "Serve a recent cached result when available", {"true", "false"}, "false"},
        });
    }

    mcp_tools::ToolOutcome execute(const json &arguments) override {
        std::string sort_by = tool_common::string_argument(arguments, "sort_by", "memory");
        if (sort_by != "cpu") {
            sort_by = "memory";
        }
        long limit = parse_limit(tool_common::string_argument(arguments, "limit", "10"));
        bool use_cache = tool_common::is_true(tool_common::string_argument(arguments, "use_cache", "false"));

        collectors::ProcessSortKey sort_key =
            sort_by == "cpu" ? collectors::ProcessSortKey::Cpu : collectors::ProcessSortKey::Memory;
        std::string key = "top_processes_" + sort_by + "_" + std::to_string(limit);

        auto collected = tool_common::cached_collect<monitor::ProcessList>(
            environment_, key, use_cache, std::chrono::seconds(20),
            [sort_key, limit]() { return collectors::collect_top_processes(sort_key, static_cast<std::size_t>(limit)); });
        if (!collected.success) {
            return mcp_tools::tool_failure("failed to collect process list: " + collected.error_detail);
        }
        return mcp_tools::tool_success(reports::format_process_report(
            collected.data, sort_key == collectors::ProcessSortKey::Cpu, static_cast<std::size_t>(limit)));
    }

private:
    tool_common::ToolEnvironment &environment_;
};

} // namespace

namespace tool_top_processes {

void register_tool(mcp_tools::ToolRegistry &registry, tool_common::ToolEnvironment &environment) {
    registry.register_tool(std::make_unique<TopProcessesTool>(environment));
}

} // namespace tool_top_processes
