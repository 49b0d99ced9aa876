#ifndef KIVG_CORE_H
#define KIVG_CORE_H

// Glm
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/mat3x3.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/epsilon.hpp>
#include <glm/common.hpp>
#include <glm/exponential.hpp>
#include <glm/trigonometric.hpp>
#include <glm/matrix.hpp>

// My stuff
#include <cppUtils/cppUtils.hpp>

// Standard
#include <cstring>
#include <cstdio>
#include <cmath>
#include <cfloat>
#include <array>
#include <vector>
#include <unordered_map>
#include <string>
#include <optional>
#include <functional>
#include <limits>
#include <memory>

// Core library stuff
#include "math/DataStructures.h"

// Color helpers
Kivg::Vec4 toHex(const std::string& str);
Kivg::Vec4 toHex(const char* hex, size_t length);
std::string toHexString(const Kivg::Vec4& color);

// Returns true if the string is a well-formed #rgb, #rgba, #rrggbb or #rrggbbaa color
bool isHexColor(const char* str, size_t length);

// Array helpers taken from https://stackoverflow.com/a/57524328
template <typename T, std::size_t N, class ...Args>
constexpr std::array<T, N> fixedSizeArray(Args&&... values)
{
	static_assert(sizeof...(values) == N);
	return std::array<T, N>{values...};
}

#endif
