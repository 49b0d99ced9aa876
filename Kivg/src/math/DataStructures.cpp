#include "math/DataStructures.h"
#include "core.h"

namespace Kivg
{
	Vec2 operator+(const Vec2& a, const Vec2& b)
	{
		return {
			a.x + b.x,
			a.y + b.y
		};
	}

	Vec2 operator-(const Vec2& a, const Vec2& b)
	{
		return {
			a.x - b.x,
			a.y - b.y
		};
	}

	Vec2 operator-(const Vec2& a)
	{
		return {
			-a.x,
			-a.y
		};
	}

	Vec2 operator*(const Vec2& a, float scale)
	{
		return {
			a.x * scale,
			a.y * scale
		};
	}

	Vec2 operator/(const Vec2& a, float scale)
	{
		return {
			a.x / scale,
			a.y / scale
		};
	}

	Vec2 operator*(float scale, const Vec2& a)
	{
		return a * scale;
	}

	Vec2 operator*(const Vec2& a, const Vec2& scale)
	{
		return Vec2{
			a.x * scale.x,
			a.y * scale.y
		};
	}

	Vec2 operator/(const Vec2& a, const Vec2& scale)
	{
		return Vec2{
			a.x / scale.x,
			a.y / scale.y
		};
	}

	Vec2& operator*=(Vec2& a, float scale)
	{
		a = a * scale;
		return a;
	}

	Vec2& operator/=(Vec2& a, float scale)
	{
		a = a / scale;
		return a;
	}

	Vec2& operator+=(Vec2& a, const Vec2& b)
	{
		a = a + b;
		return a;
	}

	Vec2& operator-=(Vec2& a, const Vec2& b)
	{
		a = a - b;
		return a;
	}

	Vec4 operator*(const Vec4& a, float scale)
	{
		return Vec4{
			a.x * scale,
			a.y * scale,
			a.z * scale,
			a.w * scale
		};
	}

	Vec4 operator*(const Vec4& a, const Vec4& scale)
	{
		return Vec4{
			a.x * scale.x,
			a.y * scale.y,
			a.z * scale.z,
			a.w * scale.w
		};
	}

	bool operator==(const Vec4& a, const Vec4& b)
	{
		return a.x == b.x && a.y == b.y && a.z == b.z && a.w == b.w;
	}

	bool operator==(const Vec2& a, const Vec2& b)
	{
		return a.x == b.x && a.y == b.y;
	}

	bool operator!=(const Vec4& a, const Vec4& b)
	{
		return !(a == b);
	}

	bool operator!=(const Vec2& a, const Vec2& b)
	{
		return !(a == b);
	}

	namespace CMath
	{
		float lengthSquared(const Vec2& vec)
		{
			return vec.x * vec.x + vec.y * vec.y;
		}

		float length(const Vec2& vec)
		{
			return glm::sqrt(vec.x * vec.x + vec.y * vec.y);
		}

		Vec2 normalize(const Vec2& vec)
		{
			float lengthSq = lengthSquared(vec);
			if (lengthSq == 0.0f)
			{
				return Vec2{ 0.0f, 0.0f };
			}

			return vec * glm::inversesqrt(lengthSq);
		}
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::Vec2& vec2)
{
	ostream << "(" << vec2.x << ", " << vec2.y << ")";
	return ostream;
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::Vec4& vec4)
{
	ostream << "(" << vec4.x << ", " << vec4.y << ", " << vec4.z << ", " << vec4.w << ")";
	return ostream;
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::BBox& bbox)
{
	ostream << "{min: " << bbox.min << ", max: " << bbox.max << "}";
	return ostream;
}
