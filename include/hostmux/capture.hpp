#pragma once

#include "aggregator.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hostmux::capture {

    namespace fs = std::filesystem;

    struct chunk_create {
        std::string content{};
        std::vector<std::string> tags{};
        std::string source{};
        std::optional<std::string> project_id{};
    };

    // persisted form of one captured artifact
    struct chunk_record {
        std::string id{};
        std::string content{};
        std::optional<std::string> project_id{};
        std::vector<std::string> tags{};
        std::string source{};
        std::string status{"inbox"};
        std::string created_at{};
    };

    class chunk_store {
      public:
        virtual ~chunk_store() = default;

        // returns the identifier of the new artifact; throws on failure
        virtual std::string create(const chunk_create& chunk) = 0;
    };

    // append-only store, one JSON record per line
    class jsonl_chunk_store final : public chunk_store {
      public:
        explicit jsonl_chunk_store(fs::path path);

        std::string create(const chunk_create& chunk) override;

        // every record in file order; malformed lines are skipped
        std::vector<chunk_record> load() const;

        const fs::path& path() const { return path_; }

      private:
        fs::path path_{};
    };

    // the tool call succeeded but persisting its output failed
    struct capture_error : std::runtime_error {
        capture_error(const std::string& message, json::value tool_result)
                : std::runtime_error{message}, result{std::move(tool_result)} {}

        json::value result{};
    };

    struct call_outcome {
        std::string tool{};
        json::value result{};
        std::optional<std::string> chunk_id{};
    };

    /*
     * Human-readable text of a tool result.
     * - list of content blocks: the `text` of every block typed "text", joined with '\n'
     * - string: itself
     * - null: empty
     * - anything else: pretty-printed JSON
     */
    std::string extract_text(const json::value& result);

    std::string format_capture_entry(
            std::string_view server_name, std::string_view tool_name, const json::value& arguments,
            std::string_view text);

    /*
     * Tool call followed by optional persistence of its output.
     *
     * Provenance names the caller's server_name when given, otherwise the display name of the
     * server that answered. Nothing is persisted when capture is off, no store is attached, or
     * the extracted text is empty.
     */
    class capture_pipeline {
      public:
        explicit capture_pipeline(mcp::aggregator& registry, chunk_store* store = nullptr);

        call_outcome call_tool(
                const std::optional<std::string>& server_name,
                std::string_view tool_name,
                const json::value& arguments,
                const std::optional<std::string>& project_id = std::nullopt,
                bool capture = false);

        void set_store(chunk_store* store) { store_ = store; }
        bool has_store() const { return store_ != nullptr; }

      private:
        std::string capture_output(
                std::string_view server_name,
                std::string_view tool_name,
                const json::value& arguments,
                std::string_view text,
                const std::optional<std::string>& project_id);

        mcp::aggregator& registry_;
        chunk_store* store_{};
    };

}  // namespace hostmux::capture
