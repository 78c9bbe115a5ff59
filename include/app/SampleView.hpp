#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "app/Reservoir.hpp"
#include "model/Sample.hpp"

namespace ssample::app {

struct HttpResponse {
  int status{200};
  std::string content_type{"text/plain"};
  std::string body;
  bool head_only{false}; // HEAD: headers carry the body length, body is not sent
};

// Largest request head (request line + headers) accepted before answering 431.
inline constexpr size_t kMaxRequestHead = 16 * 1024;

[[nodiscard]] const char* http_reason(int status);

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Split the query part of a request-target ("/path?a=1&b=x%20y") into
// percent-decoded key/value pairs, in order of appearance.
[[nodiscard]] QueryParams parse_query(std::string_view target);

// First value for key, if the key is present at all.
[[nodiscard]] std::optional<std::string_view> query_value(const QueryParams& q, std::string_view key);

// False for "", "f", "false", "0" (any case); true for everything else.
[[nodiscard]] bool parse_truthy(std::string_view v);

enum class SampleFormat { Json, Text, Plain };

// p wins over t; neither (or both falsy) selects JSON.
[[nodiscard]] SampleFormat select_format(const QueryParams& q);

// "<line>\n" per entry.
[[nodiscard]] std::string render_plain(const model::SampleSnapshot& snap);
// "<line_number>\t<line>\n" per entry. Also the final stdout emission.
[[nodiscard]] std::string render_text(const model::SampleSnapshot& snap);
// {"lines":[...],"lineNumbers":[...],"seen":N}
// Throws nlohmann::json::exception if a line is not valid UTF-8.
[[nodiscard]] std::string render_json(const model::SampleSnapshot& snap);

// Offset one past the blank line ending the request head, or npos.
[[nodiscard]] size_t find_head_end(std::string_view buf);

// Status line, Content-Type, Content-Length, Connection: close, then body.
[[nodiscard]] std::string serialize_response(const HttpResponse& resp);

// Read-only HTTP view of a reservoir. Stateless: every call takes a fresh
// snapshot, renders it, and never touches the reservoir otherwise.
class SampleView {
public:
  explicit SampleView(const Reservoir& reservoir) : reservoir_(reservoir) {}

  [[nodiscard]] HttpResponse respond(std::string_view target) const;

  // Answer a complete HTTP/1.x request head. GET and HEAD on any path are
  // served; other methods get 405, an unparseable request line 400.
  [[nodiscard]] HttpResponse handle(std::string_view request_head) const;

private:
  const Reservoir& reservoir_;
};

} // namespace ssample::app
