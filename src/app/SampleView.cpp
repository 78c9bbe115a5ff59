#include "app/SampleView.hpp"
#include <charconv>
#include <cstdio>
#include <nlohmann/json.hpp>

namespace ssample::app {

namespace {

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// application/x-www-form-urlencoded: '+' is a space, %XX a byte.
// Malformed escapes are kept literally.
std::string url_decode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    char c = in[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < in.size()) {
      int hi = hex_digit(in[i + 1]), lo = hex_digit(in[i + 2]);
      if (hi < 0 || lo < 0) { out += c; continue; }
      out += static_cast<char>(hi * 16 + lo);
      i += 2;
    } else {
      out += c;
    }
  }
  return out;
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

char ascii_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
  return true;
}

} // namespace

const char* http_reason(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    default: return "Unknown";
  }
}

QueryParams parse_query(std::string_view target) {
  QueryParams out;
  auto q = target.find('?');
  if (q == std::string_view::npos) return out;
  std::string_view rest = target.substr(q + 1);
  if (auto frag = rest.find('#'); frag != std::string_view::npos) rest = rest.substr(0, frag);
  while (!rest.empty()) {
    auto amp = rest.find_first_of("&;");
    std::string_view part = rest.substr(0, amp);
    rest = (amp == std::string_view::npos) ? std::string_view{} : rest.substr(amp + 1);
    if (part.empty()) continue;
    auto eq = part.find('=');
    if (eq == std::string_view::npos) {
      out.emplace_back(url_decode(part), std::string{});
    } else {
      out.emplace_back(url_decode(part.substr(0, eq)), url_decode(part.substr(eq + 1)));
    }
  }
  return out;
}

std::optional<std::string_view> query_value(const QueryParams& q, std::string_view key) {
  for (const auto& [k, v] : q)
    if (k == key) return std::string_view(v);
  return std::nullopt;
}

bool parse_truthy(std::string_view v) {
  if (v.empty()) return false;
  return !(iequals(v, "false") || iequals(v, "f") || v == "0");
}

SampleFormat select_format(const QueryParams& q) {
  auto flag = [&](std::string_view key) {
    auto v = query_value(q, key);
    return v && parse_truthy(*v);
  };
  if (flag("p")) return SampleFormat::Plain;
  if (flag("t")) return SampleFormat::Text;
  return SampleFormat::Json;
}

std::string render_plain(const model::SampleSnapshot& snap) {
  std::string out;
  for (const auto& e : snap.entries) {
    out += e.line;
    out += '\n';
  }
  return out;
}

std::string render_text(const model::SampleSnapshot& snap) {
  std::string out;
  for (const auto& e : snap.entries) {
    append_uint(out, e.line_number);
    out += '\t';
    out += e.line;
    out += '\n';
  }
  return out;
}

std::string render_json(const model::SampleSnapshot& snap) {
  nlohmann::ordered_json lines = nlohmann::ordered_json::array();
  nlohmann::ordered_json numbers = nlohmann::ordered_json::array();
  for (const auto& e : snap.entries) {
    lines.push_back(e.line);
    numbers.push_back(e.line_number);
  }
  nlohmann::ordered_json doc;
  doc["lines"] = std::move(lines);
  doc["lineNumbers"] = std::move(numbers);
  doc["seen"] = snap.seen;
  return doc.dump();
}

HttpResponse SampleView::respond(std::string_view target) const {
  const QueryParams q = parse_query(target);
  const SampleFormat fmt = select_format(q);
  const model::SampleSnapshot snap = reservoir_.snapshot();

  HttpResponse resp;
  switch (fmt) {
    case SampleFormat::Plain:
      resp.content_type = "text/plain; charset=utf-8";
      resp.body = render_plain(snap);
      break;
    case SampleFormat::Text:
      resp.content_type = "text/plain; charset=utf-8";
      resp.body = render_text(snap);
      break;
    case SampleFormat::Json:
      try {
        resp.body = render_json(snap);
        resp.content_type = "application/json";
      } catch (const nlohmann::json::exception& e) {
        std::fprintf(stderr, "ssample: view: json render failed: %s\n", e.what());
        resp.status = 500;
        resp.content_type = "text/plain";
        resp.body = std::string("json err: ") + e.what() + "\n";
      }
      break;
  }
  return resp;
}

HttpResponse SampleView::handle(std::string_view request_head) const {
  auto eol = request_head.find_first_of("\r\n");
  std::string_view request_line = request_head.substr(0, eol);

  // METHOD SP request-target SP HTTP-version
  auto sp1 = request_line.find(' ');
  auto sp2 = (sp1 == std::string_view::npos) ? sp1 : request_line.find(' ', sp1 + 1);
  if (sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
      !request_line.substr(sp2 + 1).starts_with("HTTP/1.")) {
    return HttpResponse{400, "text/plain", "400 Bad Request\n"};
  }
  std::string_view method = request_line.substr(0, sp1);
  std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  if (target.empty()) return HttpResponse{400, "text/plain", "400 Bad Request\n"};

  if (method == "GET") return respond(target);
  if (method == "HEAD") {
    HttpResponse resp = respond(target);
    resp.head_only = true;
    return resp;
  }
  return HttpResponse{405, "text/plain", "405 Method Not Allowed\n"};
}

size_t find_head_end(std::string_view buf) {
  auto crlf = buf.find("\r\n\r\n");
  auto lf = buf.find("\n\n");
  if (crlf == std::string_view::npos && lf == std::string_view::npos) return std::string_view::npos;
  if (lf == std::string_view::npos || (crlf != std::string_view::npos && crlf < lf)) return crlf + 4;
  return lf + 2;
}

std::string serialize_response(const HttpResponse& resp) {
  std::string out;
  out.reserve(128 + (resp.head_only ? 0 : resp.body.size()));
  out += "HTTP/1.1 ";
  append_uint(out, static_cast<uint64_t>(resp.status));
  out += ' ';
  out += http_reason(resp.status);
  out += "\r\nContent-Type: ";
  out += resp.content_type;
  if (resp.status == 405) out += "\r\nAllow: GET, HEAD";
  out += "\r\nConnection: close\r\nContent-Length: ";
  append_uint(out, resp.body.size());
  out += "\r\n\r\n";
  if (!resp.head_only) out += resp.body;
  return out;
}

} // namespace ssample::app
