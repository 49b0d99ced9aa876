#include "animation/Animation.h"
#include "core/Serialization.hpp"
#include "svg/Svg.h"

namespace Kivg
{
	// Half plane used by the growth mask, keeps points with (axis value) <= bound
	// or >= bound when keepGreater is set
	struct ClipPlane
	{
		int axis;
		float bound;
		bool keepGreater;
	};

	static void clipPolygon(const std::vector<Vec2>& polygon, const ClipPlane& plane, std::vector<Vec2>& out);
	static bool isInside(const Vec2& point, const ClipPlane& plane);
	static Vec2 intersect(const Vec2& a, const Vec2& b, const ClipPlane& plane);
	static int getClipPlanes(const BBox& bbox, GrowthOrigin origin, float progress, ClipPlane planes[2]);

	KivgError AnimationSpec::validate() const
	{
		if (id.empty())
		{
			g_logger_error("Animation spec is missing the required 'id' property.");
			return KivgError::InvalidConfiguration;
		}

		if (!std::isfinite(duration) || duration <= 0.0f)
		{
			g_logger_error("Invalid duration '{}' for animation '{}'. The duration must be a positive number.", duration, id);
			return KivgError::InvalidConfiguration;
		}

		if (growthOrigin >= GrowthOrigin::Length)
		{
			g_logger_error("Invalid growth origin '{}' for animation '{}'.", (int)growthOrigin, id);
			return KivgError::InvalidConfiguration;
		}

		if (!Animation::parseEasing(easing).has_value())
		{
			g_logger_error("Unknown easing '{}' for animation '{}'.", easing, id);
			return KivgError::InvalidConfiguration;
		}

		return KivgError::None;
	}

	void AnimationSpec::serialize(nlohmann::json& j) const
	{
		SERIALIZE_NON_NULL_PROP(j, this, id);
		SERIALIZE_ENUM_AS(j, this, growthOrigin, "growth_origin", growthOriginNames);
		SERIALIZE_NON_NULL_PROP(j, this, easing);
		SERIALIZE_NON_NULL_PROP(j, this, duration);
	}

	KivgError AnimationSpec::deserialize(const nlohmann::json& j, AnimationSpec& out)
	{
		if (!j.is_object())
		{
			g_logger_error("Animation spec must be a JSON object.");
			return KivgError::InvalidConfiguration;
		}

		AnimationSpec res = {};
		res.id = DESERIALIZE_VALUE_INLINE(j, id, res.id);
		res.easing = DESERIALIZE_VALUE_INLINE(j, easing, res.easing);
		res.duration = DESERIALIZE_VALUE_INLINE(j, duration, res.duration);

		std::optional<GrowthOrigin> origin = readJsonEnum(j, "growth_origin", growthOriginNames, res.growthOrigin);
		if (!origin.has_value())
		{
			g_logger_error("Unknown growth origin for animation '{}'.", res.id);
			return KivgError::InvalidConfiguration;
		}
		res.growthOrigin = *origin;

		KivgError error = res.validate();
		if (error == KivgError::None)
		{
			out = res;
		}
		return error;
	}

	namespace Animation
	{
		std::optional<Easing> parseEasing(const std::string& name)
		{
			if (name == easeTypeIdentifiers[(size_t)EaseType::Linear])
			{
				return linearEasing;
			}

			for (size_t dir = (size_t)EaseDirection::In; dir < (size_t)EaseDirection::Length; dir++)
			{
				const char* prefix = easeDirectionPrefixes[dir];
				size_t prefixLength = std::strlen(prefix);
				if (name.compare(0, prefixLength, prefix) != 0)
				{
					continue;
				}

				// "in_" is a prefix of "in_out_", so the whole remainder has to match a curve name
				std::string curve = name.substr(prefixLength);
				for (size_t type = (size_t)EaseType::Sine; type < (size_t)EaseType::Length; type++)
				{
					if (curve == easeTypeIdentifiers[type])
					{
						return Easing{ (EaseType)type, (EaseDirection)dir };
					}
				}
			}

			return std::nullopt;
		}

		std::string easingToString(const Easing& easing)
		{
			if (easing.type == EaseType::Linear)
			{
				return easeTypeIdentifiers[(size_t)EaseType::Linear];
			}

			if (easing.type >= EaseType::Length || easing.direction >= EaseDirection::Length)
			{
				return "unknown";
			}

			return std::string(easeDirectionPrefixes[(size_t)easing.direction]) + easeTypeIdentifiers[(size_t)easing.type];
		}

		std::vector<Easing> getRegisteredEasings()
		{
			std::vector<Easing> res = { linearEasing };
			for (size_t dir = (size_t)EaseDirection::In; dir < (size_t)EaseDirection::Length; dir++)
			{
				for (size_t type = (size_t)EaseType::Sine; type < (size_t)EaseType::Length; type++)
				{
					res.push_back(Easing{ (EaseType)type, (EaseDirection)dir });
				}
			}

			return res;
		}

		float computeProgress(float elapsed, float duration, const Easing& easing)
		{
			if (duration <= 0.0f || elapsed >= duration)
			{
				return 1.0f;
			}

			if (elapsed <= 0.0f)
			{
				return 0.0f;
			}

			return CMath::ease(elapsed / duration, easing.type, easing.direction);
		}

		float growthAlpha(GrowthOrigin origin, float progress)
		{
			if (origin == GrowthOrigin::None)
			{
				return glm::clamp(progress, 0.0f, 1.0f);
			}

			return 1.0f;
		}

		void applyGrowthMask(const Mesh& mesh, const BBox& bbox, GrowthOrigin origin, float progress, Mesh& out)
		{
			out.clear();
			float p = glm::clamp(progress, 0.0f, 1.0f);
			if (origin == GrowthOrigin::None || p >= 1.0f)
			{
				out = mesh;
				return;
			}

			if (p <= 0.0f)
			{
				return;
			}

			ClipPlane planes[2];
			int numPlanes = getClipPlanes(bbox, origin, p, planes);

			std::vector<Vec2> polygon;
			std::vector<Vec2> clipped;
			for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3)
			{
				polygon = {
					mesh.vertices[mesh.indices[i]],
					mesh.vertices[mesh.indices[i + 1]],
					mesh.vertices[mesh.indices[i + 2]]
				};

				for (int plane = 0; plane < numPlanes && polygon.size() >= 3; plane++)
				{
					clipPolygon(polygon, planes[plane], clipped);
					polygon.swap(clipped);
				}

				if (polygon.size() < 3)
				{
					continue;
				}

				// Clipping a triangle by half planes leaves a convex polygon, so a fan covers it
				uint32 firstVertex = (uint32)out.vertices.size();
				out.vertices.insert(out.vertices.end(), polygon.begin(), polygon.end());
				for (uint32 v = 1; v + 1 < (uint32)polygon.size(); v++)
				{
					out.indices.push_back(firstVertex);
					out.indices.push_back(firstVertex + v);
					out.indices.push_back(firstVertex + v + 1);
				}
			}
		}

		AnimationState createState(PathModel* path, RevealPhase phase, const Easing& easing, GrowthOrigin origin, float startOffset, float duration)
		{
			AnimationState res;
			res.path = path;
			res.phase = phase;
			res.easing = easing;
			res.growthOrigin = origin;
			res.startOffset = startOffset;
			res.duration = duration;
			res.elapsed = 0.0f;
			res.progress = 0.0f;
			res.status = AnimationStatus::Pending;
			res.repeat = false;
			res.passes = 0;
			res.onComplete = nullptr;
			res.callbackFired = false;
			return res;
		}

		bool update(AnimationState& state, float runTime)
		{
			if (state.status == AnimationStatus::Completed)
			{
				return false;
			}

			state.elapsed = runTime - state.startOffset;
			if (state.elapsed < 0.0f)
			{
				state.elapsed = 0.0f;
				return false;
			}

			if (state.repeat && state.duration > 0.0f)
			{
				uint32 passes = (uint32)glm::floor(state.elapsed / state.duration);
				float passTime = state.elapsed - (float)passes * state.duration;
				state.progress = computeProgress(passTime, state.duration, state.easing);
				state.status = AnimationStatus::Running;

				bool finishedPass = passes > state.passes;
				state.passes = passes;
				return finishedPass;
			}

			state.progress = computeProgress(state.elapsed, state.duration, state.easing);
			if (state.elapsed >= state.duration)
			{
				state.elapsed = state.duration;
				state.progress = 1.0f;
				state.status = AnimationStatus::Completed;
				return true;
			}

			state.status = AnimationStatus::Running;
			return false;
		}

		KivgError loadAnimationSpecs(const nlohmann::json& j, std::vector<AnimationSpec>& out)
		{
			if (!j.is_array())
			{
				g_logger_error("Animation config must be a JSON array of animation specs.");
				return KivgError::InvalidConfiguration;
			}

			std::vector<AnimationSpec> res;
			res.reserve(j.size());
			try
			{
				for (size_t i = 0; i < j.size(); i++)
				{
					AnimationSpec spec = {};
					KivgError error = AnimationSpec::deserialize(j[i], spec);
					if (error != KivgError::None)
					{
						g_logger_error("Animation spec at index {} is invalid.", i);
						return error;
					}
					res.emplace_back(spec);
				}
			}
			catch (const nlohmann::json::exception& e)
			{
				g_logger_error("Animation config has a property of the wrong type: '{}'", e.what());
				return KivgError::InvalidConfiguration;
			}

			out = res;
			return KivgError::None;
		}
	}

	// ------------- Internal Functions -------------
	static void clipPolygon(const std::vector<Vec2>& polygon, const ClipPlane& plane, std::vector<Vec2>& out)
	{
		out.clear();
		for (size_t i = 0; i < polygon.size(); i++)
		{
			const Vec2& current = polygon[i];
			const Vec2& next = polygon[(i + 1) % polygon.size()];
			bool currentInside = isInside(current, plane);
			bool nextInside = isInside(next, plane);

			if (currentInside)
			{
				out.push_back(current);
			}

			if (currentInside != nextInside)
			{
				out.push_back(intersect(current, next, plane));
			}
		}
	}

	static bool isInside(const Vec2& point, const ClipPlane& plane)
	{
		float value = plane.axis == 0 ? point.x : point.y;
		return plane.keepGreater
			? value >= plane.bound
			: value <= plane.bound;
	}

	static Vec2 intersect(const Vec2& a, const Vec2& b, const ClipPlane& plane)
	{
		float aValue = plane.axis == 0 ? a.x : a.y;
		float bValue = plane.axis == 0 ? b.x : b.y;
		float t = (plane.bound - aValue) / (bValue - aValue);
		Vec2 res = CMath::interpolate(t, a, b);

		// Snap onto the plane so neighbouring triangles share the cut exactly
		if (plane.axis == 0)
		{
			res.x = plane.bound;
		}
		else
		{
			res.y = plane.bound;
		}
		return res;
	}

	static int getClipPlanes(const BBox& bbox, GrowthOrigin origin, float progress, ClipPlane planes[2])
	{
		float width = bbox.max.x - bbox.min.x;
		float height = bbox.max.y - bbox.min.y;
		float midX = (bbox.min.x + bbox.max.x) / 2.0f;
		float midY = (bbox.min.y + bbox.max.y) / 2.0f;

		switch (origin)
		{
		case GrowthOrigin::Left:
			planes[0] = { 0, bbox.min.x + progress * width, false };
			return 1;
		case GrowthOrigin::Right:
			planes[0] = { 0, bbox.max.x - progress * width, true };
			return 1;
		case GrowthOrigin::Top:
			planes[0] = { 1, bbox.min.y + progress * height, false };
			return 1;
		case GrowthOrigin::Bottom:
			planes[0] = { 1, bbox.max.y - progress * height, true };
			return 1;
		case GrowthOrigin::CenterX:
			planes[0] = { 0, midX - progress * width / 2.0f, true };
			planes[1] = { 0, midX + progress * width / 2.0f, false };
			return 2;
		case GrowthOrigin::CenterY:
			planes[0] = { 1, midY - progress * height / 2.0f, true };
			planes[1] = { 1, midY + progress * height / 2.0f, false };
			return 2;
		case GrowthOrigin::None:
		case GrowthOrigin::Length:
			break;
		}

		return 0;
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::Easing& easing)
{
	ostream << "Easing{" << Kivg::Animation::easingToString(easing).c_str() << "}";
	return ostream;
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::GrowthOrigin& origin)
{
	ostream << (origin < Kivg::GrowthOrigin::Length ? Kivg::growthOriginNames[(size_t)origin] : "unknown");
	return ostream;
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::AnimationStatus& status)
{
	ostream << (status < Kivg::AnimationStatus::Length ? Kivg::animationStatusNames[(size_t)status] : "unknown");
	return ostream;
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::RevealPhase& phase)
{
	ostream << (phase < Kivg::RevealPhase::Length ? Kivg::revealPhaseNames[(size_t)phase] : "unknown");
	return ostream;
}
