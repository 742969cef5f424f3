#pragma once

#include <string>

#include "api/HttpTransport.h"

namespace QueryString {

std::string encode(const std::string& s);

// url + "?" + k1=v1&k2=v2 (url returned unchanged when params is empty).
std::string build(const std::string& url, const QueryParams& params);

} // namespace QueryString
