#pragma once

#include <json/json.h>
#include <chrono>
#include <map>
#include <string>

namespace agentrun {

// Random identifier: prefix + 32 hex chars (OpenSSL RAND_bytes)
std::string generate_id(const std::string& prefix);

// ISO-8601 UTC with milliseconds, e.g. 2025-07-10T17:17:08.461Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);
std::string now_timestamp();

// Single-line JSON
std::string to_json(const Json::Value& value);

// Strict parse; returns false on malformed input instead of throwing
bool parse_json(const std::string& text, Json::Value& out);

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// Query string helpers for "?a=1&b=two"
std::string url_decode(const std::string& s);
std::string url_encode(const std::string& s);
std::map<std::string, std::string> parse_query(const std::string& query);

} // namespace agentrun
