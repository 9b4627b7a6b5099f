#pragma once

#include <string_view>

#include "filterlet/timedef.hpp"

namespace filterlet {

namespace property {

// Filter state keys understood by the gateway.

// Default key of the access log attribute property.
inline constexpr std::string_view CustomLog = "custom_log";
// Access log attribute property dedicated to AI statistics.
inline constexpr std::string_view AiLog = "ai_log";
// Each user attribute exported to the trace span is written as a property named with this prefix and its key.
inline constexpr std::string_view TraceSpanTagPrefix = "trace_span_tag.";
// Writing "off" prevents the proxy from recomputing the route after request headers are modified.
inline constexpr std::string_view ClearRouteCache = "clear_route_cache";
inline constexpr std::string_view DecoderBufferLimit = "set_decoder_buffer_limit";
inline constexpr std::string_view EncoderBufferLimit = "set_encoder_buffer_limit";
inline constexpr std::string_view RequestId = "x_request_id";
inline constexpr std::string_view RouteName = "route_name";
inline constexpr std::string_view ClusterName = "cluster_name";

}  // namespace property

namespace header {

// Pseudo headers and regular headers read by the runtime. Proxies expose them lower-cased.
inline constexpr std::string_view Scheme = ":scheme";
inline constexpr std::string_view Authority = ":authority";
inline constexpr std::string_view Path = ":path";
inline constexpr std::string_view Method = ":method";
inline constexpr std::string_view RequestId = "x-request-id";
inline constexpr std::string_view ContentType = "content-type";
inline constexpr std::string_view ContentEncoding = "content-encoding";

}  // namespace header

// Minimal period at which the host delivers tick signals.
inline constexpr Millis kTickGranularity{100};

}  // namespace filterlet
