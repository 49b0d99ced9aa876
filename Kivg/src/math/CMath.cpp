#include "math/CMath.h"

#include <nlohmann/json.hpp>

namespace Kivg
{
	namespace CMath
	{
		// ------------------ Internal Functions ------------------
		static float easeIn(float t, EaseType type);
		static float bounceOut(float t);

		static inline float quadraticFormulaPos(float a, float b, float c)
		{
			return (-b + glm::sqrt(b * b - 4 * a * c)) / (2.0f * a);
		}

		static inline float quadraticFormulaNeg(float a, float b, float c)
		{
			return (-b - glm::sqrt(b * b - 4 * a * c)) / (2.0f * a);
		}

		// ------------------ Public Functions ------------------
		bool compare(float x, float y, float epsilon)
		{
			return abs(x - y) <= epsilon * glm::max(1.0f, glm::max(abs(x), abs(y)));
		}

		bool compare(const Vec2& vec1, const Vec2& vec2, float epsilon)
		{
			return compare(vec1.x, vec2.x, epsilon) && compare(vec1.y, vec2.y, epsilon);
		}

		bool compare(const Vec4& vec1, const Vec4& vec2, float epsilon)
		{
			return compare(vec1.x, vec2.x, epsilon) && compare(vec1.y, vec2.y, epsilon) && compare(vec1.z, vec2.z, epsilon) && compare(vec1.w, vec2.w, epsilon);
		}

		float signedArea(const std::vector<Vec2>& points)
		{
			if (points.size() < 3)
			{
				return 0.0f;
			}

			// Accumulate in double, long flattened outlines lose precision quickly otherwise
			double area = 0.0;
			for (size_t i = 0; i < points.size(); i++)
			{
				const Vec2& a = points[i];
				const Vec2& b = points[(i + 1) % points.size()];
				area += (double)a.x * (double)b.y - (double)b.x * (double)a.y;
			}

			return (float)(area * 0.5);
		}

		Vec2 max(const Vec2& a, const Vec2& b)
		{
			return Vec2{ glm::max(a.x, b.x), glm::max(a.y, b.y) };
		}

		Vec2 min(const Vec2& a, const Vec2& b)
		{
			return Vec2{ glm::min(a.x, b.x), glm::min(a.y, b.y) };
		}

		Vec2 bezier2(const Vec2& p0, const Vec2& p1, const Vec2& p2, float t)
		{
			return (1.0f - t) * ((1.0f - t) * p0 + t * p1) + t * ((1.0f - t) * p1 + t * p2);
		}

		Vec2 bezier3(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3, float t)
		{
			return
				glm::pow(1.0f - t, 3.0f) * p0 +
				3.0f * (1.0f - t) * (1.0f - t) * t * p1 +
				(3.0f * (1.0f - t) * t * t) * p2 +
				t * t * t * p3;
		}

		Vec2 tRootBezier2(const Vec2& p0, const Vec2& p1, const Vec2& p2)
		{
			Vec2 w0 = 2.0f * (p1 - p0);
			Vec2 w1 = 2.0f * (p2 - p1);
			Vec2 tValues;

			// If the denominator is 0, then return invalid t-value
			tValues.x = CMath::compare(w1.x - w0.x, 0.0f)
				? -1.0f
				: (-w0.x) / (w1.x - w0.x);
			tValues.y = CMath::compare(w1.y - w0.y, 0.0f)
				? -1.0f
				: (-w0.y) / (w1.y - w0.y);

			return tValues;
		}

		Vec4 tRootsBezier3(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3)
		{
			Vec2 v0 = 3.0f * (p1 - p0);
			Vec2 v1 = 3.0f * (p2 - p1);
			Vec2 v2 = 3.0f * (p3 - p2);

			Vec2 a = v0 - (2.0f * v1) + v2;
			Vec2 b = 2.0f * (v1 - v0);
			Vec2 c = v0;

			Vec4 res;
			// res[0] is + case in quadratic curve
			// res[2] is - case in quadratic curve
			if (CMath::compare(a.x, 0.0f) || b.x * b.x - 4.0f * a.x * c.x < 0.0f)
			{
				res.values[0] = -1.0f;
				res.values[2] = -1.0f;
			}
			else
			{
				res.values[0] = quadraticFormulaPos(a.x, b.x, c.x);
				res.values[2] = quadraticFormulaNeg(a.x, b.x, c.x);
			}

			if (CMath::compare(a.y, 0.0f) || b.y * b.y - 4.0f * a.y * c.y < 0.0f)
			{
				res.values[1] = -1.0f;
				res.values[3] = -1.0f;
			}
			else
			{
				res.values[1] = quadraticFormulaPos(a.y, b.y, c.y);
				res.values[3] = quadraticFormulaNeg(a.y, b.y, c.y);
			}

			return res;
		}

		BBox bezier1BBox(const Vec2& p0, const Vec2& p1)
		{
			BBox res;
			res.min = min(p0, p1);
			res.max = max(p0, p1);
			return res;
		}

		BBox bezier2BBox(const Vec2& p0, const Vec2& p1, const Vec2& p2)
		{
			// Initialize it to the min/max of the endpoints
			BBox res;
			res.min = min(p0, p2);
			res.max = max(p0, p2);

			Vec2 roots = tRootBezier2(p0, p1, p2);
			for (int i = 0; i < 2; i++)
			{
				// Root is in range of the bezier curve
				if (roots.values[i] > 0.0f && roots.values[i] < 1.0f)
				{
					Vec2 pos = bezier2(p0, p1, p2, roots.values[i]);
					res.min = min(res.min, pos);
					res.max = max(res.max, pos);
				}
			}

			return res;
		}

		BBox bezier3BBox(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3)
		{
			// Initialize it to the min/max of the endpoints
			BBox res;
			res.min = min(p0, p3);
			res.max = max(p0, p3);

			Vec4 roots = tRootsBezier3(p0, p1, p2, p3);
			for (int i = 0; i < 4; i++)
			{
				if (roots.values[i] > 0.0f && roots.values[i] < 1.0f)
				{
					Vec2 pos = bezier3(p0, p1, p2, p3, roots.values[i]);
					res.min = min(res.min, pos);
					res.max = max(res.max, pos);
				}
			}

			return res;
		}

		// Out and InOut are built by mirroring the In curve
		float ease(float t, EaseType type, EaseDirection direction)
		{
			if (type == EaseType::Linear)
			{
				return t;
			}

			if (type == EaseType::None || direction == EaseDirection::None)
			{
				g_logger_warning("Ease type or direction was set to none.");
				return t;
			}

			switch (direction)
			{
			case EaseDirection::In:
				return easeIn(t, type);
			case EaseDirection::Out:
				return 1.0f - easeIn(1.0f - t, type);
			case EaseDirection::InOut:
				return t < 0.5f
					? easeIn(2.0f * t, type) / 2.0f
					: 1.0f - easeIn(2.0f - 2.0f * t, type) / 2.0f;
			case EaseDirection::None:
			case EaseDirection::Length:
				break;
			}

			return t;
		}

		// Animation functions
		Vec4 interpolate(float t, const Vec4& src, const Vec4& target)
		{
			return Vec4{
				(target.x - src.x) * t + src.x,
				(target.y - src.y) * t + src.y,
				(target.z - src.z) * t + src.z,
				(target.w - src.w) * t + src.w
			};
		}

		Vec2 interpolate(float t, const Vec2& src, const Vec2& target)
		{
			return Vec2{
				(target.x - src.x) * t + src.x,
				(target.y - src.y) * t + src.y
			};
		}

		float interpolate(float t, float src, float target)
		{
			return (target - src) * t + src;
		}

		// (de)Serialization functions
		void serialize(nlohmann::json& j, const char* propertyName, const Vec4& vec)
		{
			j[propertyName] = nlohmann::json::array({ vec.x, vec.y, vec.z, vec.w });
		}

		Vec4 deserializeVec4(const nlohmann::json& j, const Vec4& defaultValue)
		{
			Vec4 res = defaultValue;
			if (j.is_array())
			{
				for (size_t i = 0; i < j.size() && i < 4; i++)
				{
					if (j[i].is_number())
					{
						res.values[i] = j[i];
					}
				}
				return res;
			}

			if (j.contains("X"))
			{
				res.x = j["X"];
			}
			if (j.contains("Y"))
			{
				res.y = j["Y"];
			}
			if (j.contains("Z"))
			{
				res.z = j["Z"];
			}
			if (j.contains("W"))
			{
				res.w = j["W"];
			}
			return res;
		}

		// ------------------ Internal Functions ------------------
		// In curves from https://easings.net
		static float easeIn(float t, EaseType type)
		{
			switch (type)
			{
			case EaseType::Sine:
				return 1.0f - glm::cos((t * PI) / 2.0f);
			case EaseType::Quad:
				return t * t;
			case EaseType::Cubic:
				return t * t * t;
			case EaseType::Quart:
				return t * t * t * t;
			case EaseType::Quint:
				return t * t * t * t * t;
			case EaseType::Exponential:
				return t <= 0.0f ? 0.0f : glm::pow(2.0f, 10.0f * t - 10.0f);
			case EaseType::Circular:
				return 1.0f - glm::sqrt(glm::max(1.0f - t * t, 0.0f));
			case EaseType::Back:
			{
				constexpr float c1 = 1.70158f;
				constexpr float c3 = c1 + 1.0f;
				return c3 * t * t * t - c1 * t * t;
			}
			case EaseType::Elastic:
			{
				constexpr float c4 = (2.0f * PI) / 3.0f;
				if (t <= 0.0f)
				{
					return 0.0f;
				}
				if (t >= 1.0f)
				{
					return 1.0f;
				}
				return -glm::pow(2.0f, 10.0f * t - 10.0f) * glm::sin((t * 10.0f - 10.75f) * c4);
			}
			case EaseType::Bounce:
				return 1.0f - bounceOut(1.0f - t);
			case EaseType::Linear:
			case EaseType::None:
			case EaseType::Length:
				break;
			}

			return t;
		}

		static float bounceOut(float t)
		{
			constexpr float n1 = 7.5625f;
			constexpr float d1 = 2.75f;

			if (t < 1.0f / d1)
			{
				return n1 * t * t;
			}
			else if (t < 2.0f / d1)
			{
				t -= 1.5f / d1;
				return n1 * t * t + 0.75f;
			}
			else if (t < 2.5f / d1)
			{
				t -= 2.25f / d1;
				return n1 * t * t + 0.9375f;
			}

			t -= 2.625f / d1;
			return n1 * t * t + 0.984375f;
		}
	}
}
