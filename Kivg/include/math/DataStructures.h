#ifndef KIVG_DATA_STRUCTURES_H
#define KIVG_DATA_STRUCTURES_H

#include <cppUtils/cppPrint.hpp>
#include <cppUtils/cppUtils.hpp>

#pragma warning( push )
#pragma warning( disable : 4201 )

namespace Kivg
{
	union Vec2
	{
		float values[2];
		struct
		{
			float x;
			float y;
		};
		struct
		{
			float min;
			float max;
		};
	};

	union Vec4
	{
		float values[4];
		struct
		{
			float x;
			float y;
			float z;
			float w;
		};
		struct
		{
			float r;
			float g;
			float b;
			float a;
		};
	};

	struct BBox
	{
		Vec2 min;
		Vec2 max;
	};

	Vec2 operator+(const Vec2& a, const Vec2& b);
	Vec2 operator-(const Vec2& a, const Vec2& b);
	Vec2 operator-(const Vec2& a);
	Vec2 operator*(const Vec2& a, float scale);
	Vec2 operator/(const Vec2& a, float scale);
	Vec2 operator*(float scale, const Vec2& a);
	Vec2 operator*(const Vec2& a, const Vec2& scale);
	Vec2 operator/(const Vec2& a, const Vec2& scale);
	Vec2& operator*=(Vec2& a, float scale);
	Vec2& operator/=(Vec2& a, float scale);
	Vec2& operator+=(Vec2& a, const Vec2& b);
	Vec2& operator-=(Vec2& a, const Vec2& b);

	Vec4 operator*(const Vec4& a, float scale);
	Vec4 operator*(const Vec4& a, const Vec4& scale);

	bool operator==(const Vec4& a, const Vec4& b);
	bool operator==(const Vec2& a, const Vec2& b);
	bool operator!=(const Vec4& a, const Vec4& b);
	bool operator!=(const Vec2& a, const Vec2& b);

	namespace CMath
	{
		float lengthSquared(const Vec2& vec);
		float length(const Vec2& vec);
		Vec2 normalize(const Vec2& vec);
	}
}

// Print functions
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::Vec2& vec2);
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::Vec4& vec4);
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::BBox& bbox);

#pragma warning( pop )

#endif
