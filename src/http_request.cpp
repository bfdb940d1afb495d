/**
 * HTTP request parsing Implementation
 */

#include "http_request.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace logowatch {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string trim(const std::string& text) {
  size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return std::string();
  }
  size_t last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string unquote(const std::string& text) {
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

// Value of `key` inside a header such as: form-data; name="logo1_file"
std::string headerParameter(const std::string& header, const std::string& key) {
  std::string lowered = toLower(header);
  std::string needle = toLower(key) + "=";
  size_t pos = 0;
  while ((pos = lowered.find(needle, pos)) != std::string::npos) {
    // Reject matches inside a longer key (name= inside filename=)
    if (pos == 0 || lowered[pos - 1] == ';' || lowered[pos - 1] == ' ') {
      break;
    }
    pos += needle.size();
  }
  if (pos == std::string::npos) {
    return std::string();
  }

  size_t start = pos + needle.size();
  if (start < header.size() && header[start] == '"') {
    size_t end = header.find('"', start + 1);
    if (end == std::string::npos) {
      return header.substr(start + 1);
    }
    return header.substr(start + 1, end - start - 1);
  }
  size_t end = header.find(';', start);
  return trim(header.substr(start, end == std::string::npos ? std::string::npos
                                                            : end - start));
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(toLower(name));
  return it != headers.end() ? it->second : std::string();
}

size_t HttpRequest::contentLength() const {
  std::string value = header("content-length");
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return 0;
  }
  return static_cast<size_t>(std::strtoull(value.c_str(), nullptr, 10));
}

bool parseRequestHead(const std::string& head, HttpRequest& request) {
  std::istringstream stream(head);
  std::string line;

  if (!std::getline(stream, line)) {
    return false;
  }

  std::istringstream requestLine(trim(line));
  std::string target;
  requestLine >> request.method >> target >> request.version;
  if (requestLine.fail() || request.method.empty() || target.empty() ||
      request.version.compare(0, 5, "HTTP/") != 0) {
    return false;
  }

  size_t queryStart = target.find('?');
  request.target = target.substr(0, queryStart);
  request.query = queryStart == std::string::npos ? std::string()
                                                  : target.substr(queryStart + 1);

  while (std::getline(stream, line)) {
    line = trim(line);
    if (line.empty()) {
      break;
    }
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    request.headers[toLower(trim(line.substr(0, colon)))] =
      trim(line.substr(colon + 1));
  }
  return true;
}

std::string urlDecode(const std::string& text) {
  std::string decoded;
  decoded.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      decoded.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() &&
               hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 +
                                          hexValue(text[i + 2])));
      i += 2;
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

bool parseUrlEncoded(const std::string& body, std::vector<FormField>& fields) {
  size_t start = 0;
  while (start <= body.size()) {
    size_t end = body.find('&', start);
    std::string pair = body.substr(start, end == std::string::npos ? std::string::npos
                                                                   : end - start);
    if (!pair.empty()) {
      FormField field;
      size_t eq = pair.find('=');
      field.name = urlDecode(pair.substr(0, eq));
      field.value = eq == std::string::npos ? std::string()
                                            : urlDecode(pair.substr(eq + 1));
      fields.push_back(field);
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return true;
}

std::string multipartBoundary(const std::string& contentType) {
  if (toLower(contentType).find("multipart/form-data") == std::string::npos) {
    return std::string();
  }
  return unquote(headerParameter(contentType, "boundary"));
}

bool parseMultipart(const std::string& body, const std::string& boundary,
                    std::vector<FormField>& fields) {
  if (boundary.empty()) {
    return false;
  }

  const std::string delimiter = "--" + boundary;
  size_t pos = body.find(delimiter);
  if (pos == std::string::npos) {
    return false;
  }

  while (true) {
    pos += delimiter.size();
    if (body.compare(pos, 2, "--") == 0) {
      return true;  // closing delimiter
    }
    if (body.compare(pos, 2, "\r\n") != 0) {
      return false;
    }
    pos += 2;

    size_t headerEnd = body.find("\r\n\r\n", pos);
    if (headerEnd == std::string::npos) {
      return false;
    }

    FormField field;
    std::istringstream headerStream(body.substr(pos, headerEnd - pos));
    std::string line;
    while (std::getline(headerStream, line)) {
      size_t colon = line.find(':');
      if (colon == std::string::npos) {
        continue;
      }
      std::string name = toLower(trim(line.substr(0, colon)));
      std::string value = trim(line.substr(colon + 1));
      if (name == "content-disposition") {
        field.name = headerParameter(value, "name");
        field.filename = headerParameter(value, "filename");
      } else if (name == "content-type") {
        field.contentType = value;
      }
    }

    size_t contentStart = headerEnd + 4;
    size_t next = body.find("\r\n" + delimiter, contentStart);
    if (next == std::string::npos) {
      return false;
    }
    field.value = body.substr(contentStart, next - contentStart);
    if (!field.name.empty()) {
      fields.push_back(field);
    }
    pos = next + 2;
  }
}

bool parseForm(const HttpRequest& request, std::vector<FormField>& fields) {
  std::string contentType = request.header("content-type");
  std::string lowered = toLower(contentType);

  if (lowered.find("multipart/form-data") != std::string::npos) {
    return parseMultipart(request.body, multipartBoundary(contentType), fields);
  }
  if (lowered.empty() ||
      lowered.find("application/x-www-form-urlencoded") != std::string::npos) {
    return parseUrlEncoded(request.body, fields);
  }
  return false;
}

} // namespace logowatch
