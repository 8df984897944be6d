#include "io/JsonUtil.hpp"

#include <climits>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace io {

void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

const json& require_array_field(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    require_array(v, where + "." + key);
    return v;
}

std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) return "";
    return require_string(j, key, where);
}

std::int64_t require_int64(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_number_integer() ||
        (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX))) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a 64-bit integer");
    }
    return v.get<std::int64_t>();
}

static int bounded_int(const json& j, const char* key, const std::string& where,
                       std::int64_t lo, std::int64_t hi) {
    const json& v = require_field(j, key, where);
    if (!v.is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }

    bool in_range = false;
    if (v.is_number_unsigned()) {
        in_range = v.get<std::uint64_t>() <= static_cast<std::uint64_t>(hi);
    } else {
        const std::int64_t n = v.get<std::int64_t>();
        in_range = n >= lo && n <= hi;
    }
    if (!in_range) {
        std::ostringstream oss;
        oss << where << "." << key << " must be between " << lo << " and " << hi;
        throw std::runtime_error(oss.str());
    }
    return static_cast<int>(v.get<std::int64_t>());
}

int require_int(const json& j, const char* key, const std::string& where) {
    return bounded_int(j, key, where, INT_MIN, INT_MAX);
}

int optional_int(const json& j, const char* key, int fallback, const std::string& where) {
    if (!j.contains(key)) return fallback;
    return require_int(j, key, where);
}

int require_count(const json& j, const char* key, const std::string& where) {
    return bounded_int(j, key, where, 0, INT_MAX);
}

int optional_count(const json& j, const char* key, int fallback, const std::string& where) {
    if (!j.contains(key)) return fallback;
    return require_count(j, key, where);
}

double require_number(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

double optional_double(const json& j, const char* key, double fallback, const std::string& where) {
    if (!j.contains(key)) return fallback;
    return require_number(j, key, where);
}

std::vector<std::string> optional_string_array(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;

    const json& arr = j.at(key);
    require_array(arr, where + "." + key);
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    require_object(j, "root");
    return j;
}

}  // namespace io
