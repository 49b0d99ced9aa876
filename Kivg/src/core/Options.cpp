#include "core/Options.h"
#include "core/Serialization.hpp"
#include "animation/Animation.h"
#include "math/CMath.h"

namespace Kivg
{
	static bool isPositive(float value)
	{
		return std::isfinite(value) && value > 0.0f;
	}

	KivgError ParseOptions::validate() const
	{
		if (!isPositive(arcTolerance))
		{
			g_logger_error("Invalid arc tolerance '{}'. The tolerance must be a positive number.", arcTolerance);
			return KivgError::InvalidConfiguration;
		}

		return KivgError::None;
	}

	void ParseOptions::serialize(nlohmann::json& j) const
	{
		SERIALIZE_PROP_AS(j, this, expandArcs, "expand_arcs");
		SERIALIZE_PROP_AS(j, this, arcTolerance, "arc_tolerance");
	}

	KivgError ParseOptions::deserialize(const nlohmann::json& j, ParseOptions& out)
	{
		ParseOptions res = {};
		DESERIALIZE_PROP_AS(&res, expandArcs, j, "expand_arcs", res.expandArcs);
		DESERIALIZE_PROP_AS(&res, arcTolerance, j, "arc_tolerance", res.arcTolerance);

		KivgError error = res.validate();
		if (error == KivgError::None)
		{
			out = res;
		}
		return error;
	}

	KivgError LoadOptions::validate() const
	{
		if (resolution <= 0)
		{
			g_logger_error("Invalid curve resolution '{}'. Curves need at least one line segment.", resolution);
			return KivgError::InvalidConfiguration;
		}

		if (malformedPathPolicy >= MalformedPathPolicy::Length)
		{
			g_logger_error("Invalid malformed path policy '{}'.", (int)malformedPathPolicy);
			return KivgError::InvalidConfiguration;
		}

		return parse.validate();
	}

	void LoadOptions::serialize(nlohmann::json& j) const
	{
		parse.serialize(j["parse"]);
		SERIALIZE_NON_NULL_PROP(j, this, resolution);
		SERIALIZE_ENUM_AS(j, this, malformedPathPolicy, "malformed_path_policy", malformedPathPolicyNames);
	}

	KivgError LoadOptions::deserialize(const nlohmann::json& j, LoadOptions& out)
	{
		LoadOptions res = {};
		if (j.contains("parse") && !j["parse"].is_null())
		{
			KivgError parseError = ParseOptions::deserialize(j["parse"], res.parse);
			if (parseError != KivgError::None)
			{
				return parseError;
			}
		}

		res.resolution = DESERIALIZE_VALUE_INLINE(j, resolution, res.resolution);

		std::optional<MalformedPathPolicy> policy = readJsonEnum(j, "malformed_path_policy", malformedPathPolicyNames, res.malformedPathPolicy);
		if (!policy.has_value())
		{
			g_logger_error("Unknown malformed path policy. Expected one of 'skip' or 'abort'.");
			return KivgError::InvalidConfiguration;
		}
		res.malformedPathPolicy = *policy;

		KivgError error = res.validate();
		if (error == KivgError::None)
		{
			out = res;
		}
		return error;
	}

	KivgError DrawOptions::validate() const
	{
		if (!isPositive(lineWidth))
		{
			g_logger_error("Invalid line width '{}'. The line width must be a positive number.", lineWidth);
			return KivgError::InvalidConfiguration;
		}

		if (!isPositive(durationPerStep))
		{
			g_logger_error("Invalid duration per step '{}'. The duration must be a positive number.", durationPerStep);
			return KivgError::InvalidConfiguration;
		}

		if (!isPositive(fillDuration))
		{
			g_logger_error("Invalid fill duration '{}'. The duration must be a positive number.", fillDuration);
			return KivgError::InvalidConfiguration;
		}

		if (animType >= RevealMode::Length)
		{
			g_logger_error("Invalid reveal mode '{}'.", (int)animType);
			return KivgError::InvalidConfiguration;
		}

		return KivgError::None;
	}

	void DrawOptions::serialize(nlohmann::json& j) const
	{
		SERIALIZE_NON_NULL_PROP(j, this, fill);
		SERIALIZE_NON_NULL_PROP(j, this, animate);
		SERIALIZE_ENUM_AS(j, this, animType, "anim_type", revealModeNames);
		SERIALIZE_PROP_AS(j, this, lineWidth, "line_width");
		SERIALIZE_VEC_AS(j, this, lineColor, "line_color");
		SERIALIZE_PROP_AS(j, this, durationPerStep, "duration_per_step");
		SERIALIZE_PROP_AS(j, this, fillDuration, "fill_duration");
	}

	KivgError DrawOptions::deserialize(const nlohmann::json& j, DrawOptions& out)
	{
		DrawOptions res = {};
		res.fill = DESERIALIZE_VALUE_INLINE(j, fill, res.fill);
		res.animate = DESERIALIZE_VALUE_INLINE(j, animate, res.animate);
		DESERIALIZE_PROP_AS(&res, lineWidth, j, "line_width", res.lineWidth);
		DESERIALIZE_PROP_AS(&res, durationPerStep, j, "duration_per_step", res.durationPerStep);
		DESERIALIZE_PROP_AS(&res, fillDuration, j, "fill_duration", res.fillDuration);

		if (j.contains("line_color") && j["line_color"].is_string())
		{
			const std::string colorStr = j["line_color"].get<std::string>();
			if (!isHexColor(colorStr.c_str(), colorStr.length()))
			{
				g_logger_error("Invalid line color '{}'. Expected a hex color or an [r, g, b, a] array.", colorStr);
				return KivgError::InvalidConfiguration;
			}
			res.lineColor = toHex(colorStr);
		}
		else
		{
			DESERIALIZE_VEC4_AS(&res, lineColor, j, "line_color", res.lineColor);
		}

		if (j.contains("anim_type") && !j["anim_type"].is_null())
		{
			std::optional<RevealMode> mode = j["anim_type"].is_string()
				? parseRevealMode(j["anim_type"].get<std::string>())
				: std::nullopt;
			if (!mode.has_value())
			{
				g_logger_error("Unknown anim_type. Expected one of 'sequential', 'parallel', 'seq' or 'par'.");
				return KivgError::InvalidConfiguration;
			}
			res.animType = *mode;
		}

		KivgError error = res.validate();
		if (error == KivgError::None)
		{
			out = res;
		}
		return error;
	}

	KivgError TrackOptions::validate() const
	{
		if (!isPositive(duration))
		{
			g_logger_error("Invalid tracking duration '{}'. The duration must be a positive number.", duration);
			return KivgError::InvalidConfiguration;
		}

		if (!isPositive(markerSize))
		{
			g_logger_error("Invalid marker size '{}'. The size must be a positive number.", markerSize);
			return KivgError::InvalidConfiguration;
		}

		if (!Animation::parseEasing(easing).has_value())
		{
			g_logger_error("Unknown easing '{}' for path tracking.", easing);
			return KivgError::InvalidConfiguration;
		}

		return KivgError::None;
	}

	void TrackOptions::serialize(nlohmann::json& j) const
	{
		SERIALIZE_NON_NULL_PROP(j, this, duration);
		SERIALIZE_NON_NULL_PROP(j, this, easing);
		SERIALIZE_NON_NULL_PROP(j, this, repeat);
		SERIALIZE_NON_NULL_PROP(j, this, rotate);
		SERIALIZE_PROP_AS(j, this, showPath, "show_path");
		SERIALIZE_PROP_AS(j, this, keepOthers, "keep_others");
		SERIALIZE_PROP_AS(j, this, markerId, "marker_id");
		SERIALIZE_PROP_AS(j, this, markerSize, "marker_size");
		SERIALIZE_VEC_AS(j, this, markerColor, "marker_color");
	}

	KivgError TrackOptions::deserialize(const nlohmann::json& j, TrackOptions& out)
	{
		TrackOptions res = {};
		res.duration = DESERIALIZE_VALUE_INLINE(j, duration, res.duration);
		res.easing = DESERIALIZE_VALUE_INLINE(j, easing, res.easing);
		res.repeat = DESERIALIZE_VALUE_INLINE(j, repeat, res.repeat);
		res.rotate = DESERIALIZE_VALUE_INLINE(j, rotate, res.rotate);
		DESERIALIZE_PROP_AS(&res, showPath, j, "show_path", res.showPath);
		DESERIALIZE_PROP_AS(&res, keepOthers, j, "keep_others", res.keepOthers);
		DESERIALIZE_PROP_AS(&res, markerId, j, "marker_id", res.markerId);
		DESERIALIZE_PROP_AS(&res, markerSize, j, "marker_size", res.markerSize);

		if (j.contains("marker_color") && j["marker_color"].is_string())
		{
			const std::string colorStr = j["marker_color"].get<std::string>();
			if (!isHexColor(colorStr.c_str(), colorStr.length()))
			{
				g_logger_error("Invalid marker color '{}'. Expected a hex color or an [r, g, b, a] array.", colorStr);
				return KivgError::InvalidConfiguration;
			}
			res.markerColor = toHex(colorStr);
		}
		else
		{
			DESERIALIZE_VEC4_AS(&res, markerColor, j, "marker_color", res.markerColor);
		}

		KivgError error = res.validate();
		if (error == KivgError::None)
		{
			out = res;
		}
		return error;
	}

	std::optional<RevealMode> parseRevealMode(const std::string& name)
	{
		std::optional<RevealMode> mode = findMatchingEnum<RevealMode, (size_t)RevealMode::Length>(revealModeNames, name);
		if (mode.has_value())
		{
			return mode;
		}

		return findMatchingEnum<RevealMode, (size_t)RevealMode::Length>(revealModeShortNames, name);
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::RevealMode& mode)
{
	ostream << (mode < Kivg::RevealMode::Length ? Kivg::revealModeNames[(size_t)mode] : "unknown");
	return ostream;
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::MalformedPathPolicy& policy)
{
	ostream << (policy < Kivg::MalformedPathPolicy::Length ? Kivg::malformedPathPolicyNames[(size_t)policy] : "unknown");
	return ostream;
}
