#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace io {

// Field readers shared by every JSON loader. `where` is the path of the
// enclosing value ("root.entries[3]"); errors are std::runtime_error naming
// the offending field.

void require_object(const nlohmann::json& j, const std::string& where);
void require_array(const nlohmann::json& j, const std::string& where);

const nlohmann::json& require_field(const nlohmann::json& j, const char* key, const std::string& where);
const nlohmann::json& require_array_field(const nlohmann::json& j, const char* key, const std::string& where);

std::string require_string(const nlohmann::json& j, const char* key, const std::string& where);
std::string optional_string(const nlohmann::json& j, const char* key, const std::string& where);

std::int64_t require_int64(const nlohmann::json& j, const char* key, const std::string& where);

// any value representable as int
int require_int(const nlohmann::json& j, const char* key, const std::string& where);
int optional_int(const nlohmann::json& j, const char* key, int fallback, const std::string& where);

// quantities: 0 .. INT_MAX
int require_count(const nlohmann::json& j, const char* key, const std::string& where);
int optional_count(const nlohmann::json& j, const char* key, int fallback, const std::string& where);

double require_number(const nlohmann::json& j, const char* key, const std::string& where);
double optional_double(const nlohmann::json& j, const char* key, double fallback, const std::string& where);

std::vector<std::string> optional_string_array(const nlohmann::json& j, const char* key, const std::string& where);

// Parses a whole file whose root must be an object.
nlohmann::json read_json_file(const std::string& path, const char* what);

}  // namespace io
