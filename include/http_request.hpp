/**
 * HTTP request parsing - request line, headers, form bodies
 */

#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace logowatch {

struct HttpRequest {
  std::string method;
  std::string target;                         // path without query string
  std::string query;
  std::string version;
  std::map<std::string, std::string> headers; // lower-cased names
  std::string body;

  std::string header(const std::string& name) const;
  size_t contentLength() const;
};

/**
 * One field of a form submission. Multipart file fields carry a filename.
 */
struct FormField {
  std::string name;
  std::string filename;
  std::string contentType;
  std::string value;
};

// Parses the request line and headers of `head` (everything before the blank line)
bool parseRequestHead(const std::string& head, HttpRequest& request);

std::string urlDecode(const std::string& text);

bool parseUrlEncoded(const std::string& body, std::vector<FormField>& fields);

// Boundary from a Content-Type such as multipart/form-data; boundary=xyz
std::string multipartBoundary(const std::string& contentType);

bool parseMultipart(const std::string& body, const std::string& boundary,
                    std::vector<FormField>& fields);

// Dispatches on the Content-Type header
bool parseForm(const HttpRequest& request, std::vector<FormField>& fields);

} // namespace logowatch

#endif // HTTP_REQUEST_HPP
