#pragma once

/**
 * @file dispatcher.hpp
 * @brief Routes one protocol envelope and emits its SSE frames.
 *
 * Each exchange produces, in order: zero or one reply frame (`message`
 * for results and JSON-RPC errors, `error` for bare errors), then a
 * terminal `done` frame.  Two paths end without `done`: a search call
 * missing its query, and a failure that escapes routing (reported as an
 * `error` event).  A body that does not parse is reported as an `error`
 * event before any routing happens.
 */

#include <boost/json.hpp>
#include <functional>
#include <string>
#include <string_view>

#include "duckmcp/protocol.hpp"
#include "duckmcp/search_tool.hpp"

namespace duckmcp {

namespace json = boost::json;

struct frame {
  std::string event;
  json::value data;
};

// "event: <name>\ndata: <json>\n\n"
std::string format_frame(const frame& f);

// Writes one frame; returns false once the client has gone away.
using frame_sink = std::function<bool(const frame&)>;

struct server_identity {
  std::string name;
  std::string version;
};

class dispatcher {
 public:
  dispatcher(search_tool& tool, server_identity identity)
      : tool_{&tool}, identity_{std::move(identity)} {}

  // Parses `body` and dispatches it.
  void dispatch(std::string_view body, const frame_sink& sink) const;

  void dispatch(const envelope& env, const frame_sink& sink) const;

 private:
  search_tool* tool_;
  server_identity identity_;
};

}  // namespace duckmcp
