#pragma once
#include <string>

int cacheDump(const std::string& cachePath);
