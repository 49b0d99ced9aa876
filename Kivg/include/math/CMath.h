#ifndef KIVG_C_MATH_H
#define KIVG_C_MATH_H

#include "core.h"

#include <nlohmann/json_fwd.hpp>

namespace Kivg
{
	enum class EaseType : uint8
	{
		None,
		Linear,
		Sine,
		Quad,
		Cubic,
		Quart,
		Quint,
		Exponential,
		Circular,
		Back,
		Elastic,
		Bounce,
		Length
	};

	constexpr auto easeTypeNames = fixedSizeArray<const char*, (size_t)EaseType::Length>(
		"None",
		"Linear",
		"Sine",
		"Quad",
		"Cubic",
		"Quart",
		"Quint",
		"Exponential",
		"Circular",
		"Back",
		"Elastic",
		"Bounce"
	);

	// Short names used in easing identifiers like "in_out_quad"
	constexpr auto easeTypeIdentifiers = fixedSizeArray<const char*, (size_t)EaseType::Length>(
		"none",
		"linear",
		"sine",
		"quad",
		"cubic",
		"quart",
		"quint",
		"expo",
		"circ",
		"back",
		"elastic",
		"bounce"
	);

	enum class EaseDirection : uint8
	{
		None,
		In,
		Out,
		InOut,
		Length
	};

	constexpr auto easeDirectionNames = fixedSizeArray<const char*, (size_t)EaseDirection::Length>(
		"None",
		"In",
		"Out",
		"In-Out"
	);

	constexpr auto easeDirectionPrefixes = fixedSizeArray<const char*, (size_t)EaseDirection::Length>(
		"",
		"in_",
		"out_",
		"in_out_"
	);

	namespace CMath
	{
		constexpr float PI = 3.1415926535897932384626433832795028841971693993751058209749445923078164062f;

		// Float Comparison functions, using custom epsilon
		bool compare(float x, float y, float epsilon = std::numeric_limits<float>::min());
		bool compare(const Vec2& vec1, const Vec2& vec2, float epsilon = std::numeric_limits<float>::min());
		bool compare(const Vec4& vec1, const Vec4& vec2, float epsilon = std::numeric_limits<float>::min());

		// ----------- Geometry helpers -----------

		constexpr inline float toRadians(float degrees) { return degrees * PI / 180.0f; }
		constexpr inline float toDegrees(float radians) { return radians * 180.0f / PI; }

		inline float dot(const Vec2& a, const Vec2& b) { return a.x * b.x + a.y * b.y; }
		// Z component of the 3D cross product of a and b
		inline float cross(const Vec2& a, const Vec2& b) { return a.x * b.y - a.y * b.x; }

		inline float abs(float a) { return a > 0 ? a : -a; }

		/**
		 * @brief Signed area of a closed polygon using the shoelace formula. Positive when
		 *        the points wind counter-clockwise in a y-up frame.
		 * @param points Polygon points, the closing edge is implicit
		 * @return The signed area
		*/
		float signedArea(const std::vector<Vec2>& points);

		// ----------- Max/min helpers -----------

		/**
		 * @brief Returns the component-wise max of a and b
		 * @param a Vector a
		 * @param b Vector b
		 * @return Vec2{max(a.x, b.x), max(a.y, b.y)}
		*/
		Vec2 max(const Vec2& a, const Vec2& b);
		/**
		 * @brief Returns the component-wise min of a and b
		 * @param a Vector a
		 * @param b Vector b
		 * @return Vec2{min(a.x, b.x), min(a.y, b.y)}
		*/
		Vec2 min(const Vec2& a, const Vec2& b);

		// ----------- Bezier Helpers -----------

		Vec2 bezier2(const Vec2& p0, const Vec2& p1, const Vec2& p2, float t);
		Vec2 bezier3(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3, float t);

		/**
		 * @brief Finds bezier extremities for a quadratic bezier curve
		 * @param p0 Start point quadratic curve
		 * @param p1 Handle point
		 * @param p2 End point quadratic curve
		 * @return Pair Vec2{ xRoot, yRoot } in tValues. -1.0f indicates an invalid root.
		*/
		Vec2 tRootBezier2(const Vec2& p0, const Vec2& p1, const Vec2& p2);

		/**
		 * @brief Finds bezier extremities for a cubic bezier curve
		 * @param p0 Start point cubic curve
		 * @param p1 First handle point
		 * @param p2 Second handle point
		 * @param p3 End point cubic curve
		 * @return Pair Vec4{ xRoot, yRoot, xRootNeg, yRootNeg } in tValues. -1.0f indicates an invalid root.
		*/
		Vec4 tRootsBezier3(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3);

		BBox bezier1BBox(const Vec2& p0, const Vec2& p1);
		BBox bezier2BBox(const Vec2& p0, const Vec2& p1, const Vec2& p2);
		BBox bezier3BBox(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3);

		// ----------- Easing Functions -----------

		float ease(float t, EaseType type, EaseDirection direction);

		// ----------- Interpolation Functions -----------

		Vec4 interpolate(float t, const Vec4& src, const Vec4& target);
		Vec2 interpolate(float t, const Vec2& src, const Vec2& target);
		float interpolate(float t, float src, float target);

		// ----------- (De)Serialization -----------

		void serialize(nlohmann::json& j, const char* propertyName, const Vec4& vec);

		/**
		 * @brief Reads a color either as an [r, g, b, a] array or as an object with
		 *        X, Y, Z, W properties. Missing components keep the default.
		*/
		Vec4 deserializeVec4(const nlohmann::json& j, const Vec4& defaultValue);
	}
}

#endif
