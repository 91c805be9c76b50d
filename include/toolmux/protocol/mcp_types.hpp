#ifndef TOOLMUX_PROTOCOL_MCP_TYPES_HPP
#define TOOLMUX_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolmux {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Version & Method Names
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

namespace method {
inline constexpr std::string_view initialize          = "initialize";
inline constexpr std::string_view initialized         = "notifications/initialized";
inline constexpr std::string_view ping                = "ping";
inline constexpr std::string_view tools_list          = "tools/list";
inline constexpr std::string_view tools_call          = "tools/call";
inline constexpr std::string_view tools_list_changed  = "notifications/tools/list_changed";
inline constexpr std::string_view sandbox_state       = "notifications/sandbox_state";
inline constexpr std::string_view sandbox_state_alias = "sandbox/state_changed";
}  // namespace method

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

// toolmux never serves roots, sampling or elicitation; only extension
// capabilities are advertised.
struct ClientCapabilities {
    Json experimental = Json::object();

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (!experimental.empty()) {
            j["experimental"] = experimental;
        }
        return j;
    }
};

struct ServerCapabilities {
    struct Tools {
        bool list_changed = false;
    };

    std::optional<Tools> tools;
    bool logging = false;
    bool prompts = false;
    bool resources = false;
    Json experimental;

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (!j.is_object()) {
            return caps;
        }
        if (j.contains("tools") && j["tools"].is_object()) {
            caps.tools = Tools{j["tools"].value("listChanged", false)};
        }
        caps.logging = j.contains("logging");
        caps.prompts = j.contains("prompts");
        caps.resources = j.contains("resources");
        if (j.contains("experimental")) {
            caps.experimental = j["experimental"];
        }
        return caps;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = j.value("protocolVersion", "");
        if (j.contains("capabilities")) {
            result.capabilities = ServerCapabilities::from_json(j["capabilities"]);
        }
        if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("instructions") && j["instructions"].is_string()) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct ToolSchema {
    std::string name;
    std::string description;
    Json input_schema = Json::object();

    static ToolSchema from_json(const Json& j) {
        ToolSchema tool;
        tool.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"inputSchema", input_schema}};
        if (!description.empty()) {
            j["description"] = description;
        }
        return j;
    }

    bool operator==(const ToolSchema&) const = default;
};

// One page of tools/list. Entries without a name are skipped.
struct ListToolsResult {
    std::vector<ToolSchema> tools;
    std::optional<std::string> next_cursor;

    static ListToolsResult from_json(const Json& j) {
        ListToolsResult result;
        if (j.contains("tools") && j["tools"].is_array()) {
            for (const auto& t : j["tools"]) {
                if (!t.is_object()) {
                    continue;
                }
                auto tool = ToolSchema::from_json(t);
                if (!tool.name.empty()) {
                    result.tools.push_back(std::move(tool));
                }
            }
        }
        if (j.contains("nextCursor") && j["nextCursor"].is_string()) {
            auto cursor = j["nextCursor"].get<std::string>();
            if (!cursor.empty()) {
                result.next_cursor = std::move(cursor);
            }
        }
        return result;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments;

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (!arguments.is_null()) {
            j["arguments"] = arguments;
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content
// ═══════════════════════════════════════════════════════════════════════════

struct TextContent {
    std::string text;

    static TextContent from_json(const Json& j) {
        return TextContent{j.value("text", "")};
    }
};

struct ImageContent {
    std::string data;  // base64
    std::string mime_type;

    static ImageContent from_json(const Json& j) {
        return ImageContent{j.value("data", ""), j.value("mimeType", "")};
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;

    static EmbeddedResource from_json(const Json& j) {
        EmbeddedResource res;
        if (j.contains("resource") && j["resource"].is_object()) {
            const auto& r = j["resource"];
            res.uri = r.value("uri", "");
            if (r.contains("mimeType")) {
                res.mime_type = r["mimeType"].get<std::string>();
            }
            if (r.contains("text")) {
                res.text = r["text"].get<std::string>();
            }
        }
        return res;
    }
};

using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

// Server payloads pass through untouched in `raw`; `content` is the typed
// view of the entries toolmux understands.
struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;
    std::optional<Json> structured_content;
    Json raw;

    static CallToolResult from_json(const Json& j) {
        CallToolResult result;
        result.raw = j;
        result.is_error = j.value("isError", false);
        if (j.contains("structuredContent")) {
            result.structured_content = j["structuredContent"];
        }
        if (j.contains("content") && j["content"].is_array()) {
            for (const auto& c : j["content"]) {
                const auto type = c.value("type", "");
                if (type == "text") {
                    result.content.push_back(TextContent::from_json(c));
                } else if (type == "image") {
                    result.content.push_back(ImageContent::from_json(c));
                } else if (type == "resource") {
                    result.content.push_back(EmbeddedResource::from_json(c));
                }
            }
        }
        return result;
    }

    /// Concatenated text of all TextContent entries.
    [[nodiscard]] std::string text() const {
        std::string out;
        for (const auto& item : content) {
            if (const auto* t = std::get_if<TextContent>(&item)) {
                if (!out.empty()) {
                    out += '\n';
                }
                out += t->text;
            }
        }
        return out;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Sandbox State
// ═══════════════════════════════════════════════════════════════════════════
// Carried by notifications/sandbox_state in both directions.

struct SandboxState {
    bool enabled = false;
    std::string policy;
    Json params;  // full payload as received

    static SandboxState from_json(const Json& j) {
        SandboxState state;
        state.params = j;
        if (j.is_object()) {
            state.enabled = j.value("enabled", false);
            if (j.contains("policy") && j["policy"].is_string()) {
                state.policy = j["policy"].get<std::string>();
            }
        }
        return state;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"enabled", enabled}};
        if (!policy.empty()) {
            j["policy"] = policy;
        }
        return j;
    }
};

}  // namespace toolmux

#endif  // TOOLMUX_PROTOCOL_MCP_TYPES_HPP
