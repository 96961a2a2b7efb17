#include "duckmcp/dispatcher.hpp"

#include <fmt/format.h>

#include <exception>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "duckmcp/logger.hpp"

namespace duckmcp {

namespace {

struct no_reply {};
using outcome = std::variant<no_reply, json::value, rpc_error>;

struct reply {
  outcome body;
  bool completes{true};  // followed by a `done` frame
};

// Stops forwarding frames once the sink reports the client is gone.
class emitter {
 public:
  explicit emitter(const frame_sink& sink) : sink_{&sink} {}

  void emit(std::string event, json::value data) {
    if (!open_) return;
    open_ = (*sink_)(frame{std::move(event), std::move(data)});
    if (!open_) LOG_INFO("client went away, dropping remaining frames");
  }

 private:
  const frame_sink* sink_;
  bool open_{true};
};

json::object message_object(std::string message) {
  json::object obj;
  obj["message"] = std::move(message);
  return obj;
}

struct router {
  search_tool& tool;
  const server_identity& identity;

  reply operator()(const initialize_request&) const {
    return {json::value(initialize_result(identity.name, identity.version))};
  }

  reply operator()(const resources_list_request&) const {
    return {json::value(resources_list_result())};
  }

  reply operator()(const tools_list_request&) const {
    return {json::value(tools_list_result())};
  }

  reply operator()(const initialized_notification&) const {
    LOG_INFO("Client initialized notification received");
    return {no_reply{}};
  }

  reply operator()(const cancelled_notification& n) const {
    LOG_DEBUG(
        "Request {} was cancelled: {}", json::serialize(n.request_id),
        n.reason);
    return {no_reply{}};
  }

  reply operator()(const tool_call_request& call) const {
    if (call.name != search_tool_name) {
      return {rpc_error{
        METHOD_NOT_FOUND,
        fmt::format(
            "Unknown tool: {}", call.name.empty() ? "<none>" : call.name)}};
    }

    auto params = parse_search_arguments(call.arguments);
    if (!params)
      return {rpc_error{INVALID_PARAMS, "query parameter is required"}, false};

    try {
      return {json::value(tool.call(*params))};
    } catch (const search_error& e) {
      return {rpc_error{INTERNAL_ERROR, fmt::format("Search failed: {}", e.what())}};
    }
  }

  reply operator()(const malformed_params& m) const {
    return {rpc_error{INVALID_PARAMS, m.message}};
  }

  reply operator()(const missing_method&) const {
    return {rpc_error{INVALID_REQUEST, "No method specified in request"}};
  }

  reply operator()(const unknown_method& m) const {
    return {rpc_error{METHOD_NOT_FOUND, fmt::format("Unknown method: {}", m.name)}};
  }
};

}  // namespace

std::string format_frame(const frame& f) {
  return fmt::format("event: {}\ndata: {}\n\n", f.event, json::serialize(f.data));
}

void dispatcher::dispatch(std::string_view body, const frame_sink& sink) const {
  emitter out{sink};

  boost::system::error_code ec;
  auto parsed = json::parse(body, ec);
  if (ec) {
    LOG_ERROR("Error parsing JSON: {}", ec.message());
    out.emit("error", message_object(fmt::format("Invalid JSON: {}", ec.message())));
    return;
  }

  envelope env;
  try {
    env = parse_envelope(parsed);
  } catch (const std::invalid_argument& e) {
    LOG_ERROR("Rejected request body: {}", e.what());
    out.emit("error", message_object(fmt::format("Invalid request: {}", e.what())));
    return;
  }
  dispatch(env, sink);
}

void dispatcher::dispatch(const envelope& env, const frame_sink& sink) const {
  emitter out{sink};
  LOG_INFO(
      "MCP request: {} (JSON-RPC: {}, id: {})", env.method.value_or("<none>"),
      env.jsonrpc, env.id ? json::serialize(*env.id) : "none");

  try {
    auto r = std::visit(router{*tool_, identity_}, classify(env));

    if (env.is_notification()) {
      if (!std::holds_alternative<no_reply>(r.body))
        LOG_DEBUG("no id on '{}', reply suppressed", env.method.value_or(""));
    } else {
      std::visit(
          [&](auto&& body) {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, json::value>) {
              if (env.wraps())
                out.emit("message", make_result_response(*env.id, std::move(body)));
              else
                out.emit("message", std::move(body));
            } else if constexpr (std::is_same_v<T, rpc_error>) {
              LOG_WARN("replying with error {}: {}", body.code, body.message);
              if (env.wraps())
                out.emit("message", make_error_response(*env.id, body));
              else
                out.emit("error", error_object(body));
            }
          },
          r.body);
    }

    if (r.completes) out.emit("done", json::object{});
  } catch (const std::exception& e) {
    LOG_ERROR("Error in dispatch: {}", e.what());
    out.emit("error", message_object(fmt::format("Error: {}", e.what())));
  }
}

}  // namespace duckmcp
