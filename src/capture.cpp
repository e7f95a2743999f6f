#include "hostmux/capture.hpp"

#include "hostmux/format.hpp"

#include <glaze/glaze.hpp>

#include <chrono>
#include <fstream>

using namespace hostmux::literals;

namespace hostmux::capture {

    namespace detail {
        static std::string utc_timestamp() {
            auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
            return "{:%FT%TZ}"_format(now);
        }
    }  // namespace detail

    // ── extraction ──────────────────────────────────────────────────────

    std::string extract_text(const json::value& result) {
        if (const auto* blocks = json::as_array(result)) {
            std::vector<std::string> parts{};
            for (const auto& block : *blocks) {
                if (json::string_member(block, "type"sv) != "text") {
                    continue;
                }
                parts.push_back(json::string_member(block, "text"sv).value_or(""));
            }
            return utils::join_with_separator(parts, "\n");
        }
        if (const auto* text = json::as_string(result)) {
            return *text;
        }
        if (json::is_null(result)) {
            return {};
        }
        return json::to_pretty_json(result);
    }

    std::string format_capture_entry(
            std::string_view server_name, std::string_view tool_name, const json::value& arguments,
            std::string_view text) {
        auto args_json = json::to_pretty_json(json::is_null(arguments) ? json::make_object() : arguments);
        return "**Tool Execution: {}:{}**\n```json\n{}\n```\n**Output:**\n{}"_format(
                server_name, tool_name, args_json, text);
    }

    // ── jsonl store ─────────────────────────────────────────────────────

    jsonl_chunk_store::jsonl_chunk_store(fs::path path) : path_{std::move(path)} {}

    std::string jsonl_chunk_store::create(const chunk_create& chunk) {
        if (chunk.content.empty()) {
            throw std::invalid_argument("chunk content must not be empty");
        }

        chunk_record record{
                .id = make_uuid(),
                .content = chunk.content,
                .project_id = chunk.project_id,
                .tags = chunk.tags,
                .source = chunk.source,
                .created_at = detail::utc_timestamp()};

        std::string line{};
        if (auto ec = glz::write_json(record, line)) {
            throw std::runtime_error("failed to serialize chunk record");
        }

        if (path_.has_parent_path()) {
            std::error_code ec{};
            fs::create_directories(path_.parent_path(), ec);
            if (ec) {
                throw std::runtime_error(
                        "failed to create {}: {}"_format(path_.parent_path().string(), ec.message()));
            }
        }

        std::ofstream out{path_, std::ios::app};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path_.string()));
        }
        out << line << '\n';
        if (!out.flush()) {
            throw std::runtime_error("failed to write {}"_format(path_.string()));
        }

        return record.id;
    }

    std::vector<chunk_record> jsonl_chunk_store::load() const {
        std::vector<chunk_record> records{};
        std::ifstream in{path_};
        if (!in) {
            return records;
        }

        std::string line{};
        size_t lineno = 0;
        while (std::getline(in, line)) {
            ++lineno;
            if (utils::trim_view(line).empty()) {
                continue;
            }
            chunk_record record{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(record, line)) {
                warn_log("skipping malformed record at ", path_.string(), ":", lineno);
                continue;
            }
            records.push_back(std::move(record));
        }
        return records;
    }

    // ── pipeline ────────────────────────────────────────────────────────

    capture_pipeline::capture_pipeline(mcp::aggregator& registry, chunk_store* store)
            : registry_{registry}, store_{store} {}

    call_outcome capture_pipeline::call_tool(
            const std::optional<std::string>& server_name,
            std::string_view tool_name,
            const json::value& arguments,
            const std::optional<std::string>& project_id,
            bool capture) {
        // routing ignores server_name; it only labels provenance
        std::string provenance = server_name.value_or("");
        if (provenance.empty()) {
            auto route = registry_.find_tool(tool_name);
            provenance = route ? route->client->descriptor().name : "unknown";
        }

        call_outcome outcome{.tool = std::string{tool_name}};
        outcome.result = registry_.call_tool(tool_name, arguments);

        if (!capture) {
            return outcome;
        }
        if (store_ == nullptr) {
            debug_log("capture requested for '", tool_name, "' but no store is attached");
            return outcome;
        }

        auto text = extract_text(outcome.result);
        if (text.empty()) {
            debug_log("nothing to capture from '", tool_name, "'");
            return outcome;
        }

        try {
            outcome.chunk_id = capture_output(provenance, tool_name, arguments, text, project_id);
        } catch (const std::exception& e) {
            throw capture_error("tool '{}' succeeded but capture failed: {}"_format(tool_name, e.what()),
                                std::move(outcome.result));
        }
        return outcome;
    }

    std::string capture_pipeline::capture_output(
            std::string_view server_name,
            std::string_view tool_name,
            const json::value& arguments,
            std::string_view text,
            const std::optional<std::string>& project_id) {
        auto id = store_->create(
                chunk_create{
                        .content = format_capture_entry(server_name, tool_name, arguments, text),
                        .tags = {"tool_result", "mcp:{}"_format(server_name), std::string{tool_name}},
                        .source = "mcp:{}:{}"_format(server_name, tool_name),
                        .project_id = project_id});
        info_log("captured tool result as chunk ", id, " (", server_name, ":", tool_name, ")");
        return id;
    }

}  // namespace hostmux::capture
