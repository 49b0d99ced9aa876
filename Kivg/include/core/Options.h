#ifndef KIVG_OPTIONS_H
#define KIVG_OPTIONS_H
#include "core.h"
#include "core/Errors.h"
#include "svg/Svg.h"

#include <nlohmann/json_fwd.hpp>

namespace Kivg
{
	enum class RevealMode : uint8
	{
		Sequential = 0,
		Parallel,
		Length
	};

	constexpr auto revealModeNames = fixedSizeArray<const char*, (size_t)RevealMode::Length>(
		"sequential",
		"parallel"
	);

	// Short forms accepted by the configuration surface
	constexpr auto revealModeShortNames = fixedSizeArray<const char*, (size_t)RevealMode::Length>(
		"seq",
		"par"
	);

	enum class MalformedPathPolicy : uint8
	{
		Skip = 0,
		Abort,
		Length
	};

	constexpr auto malformedPathPolicyNames = fixedSizeArray<const char*, (size_t)MalformedPathPolicy::Length>(
		"skip",
		"abort"
	);

	struct ParseOptions
	{
		// Replace arcs with their cubic approximation while parsing
		bool expandArcs = false;
		float arcTolerance = defaultArcTolerance;

		KivgError validate() const;

		void serialize(nlohmann::json& j) const;
		static KivgError deserialize(const nlohmann::json& j, ParseOptions& out);
	};

	struct LoadOptions
	{
		ParseOptions parse = {};
		// Line segments per curve when flattening
		int resolution = defaultResolution;
		MalformedPathPolicy malformedPathPolicy = MalformedPathPolicy::Skip;

		KivgError validate() const;

		void serialize(nlohmann::json& j) const;
		static KivgError deserialize(const nlohmann::json& j, LoadOptions& out);
	};

	struct DrawOptions
	{
		bool fill = true;
		bool animate = false;
		RevealMode animType = RevealMode::Sequential;
		float lineWidth = 2.0f;
		Vec4 lineColor = Vec4{ 0.0f, 0.0f, 0.0f, 1.0f };
		float durationPerStep = 0.02f;
		float fillDuration = 0.4f;

		KivgError validate() const;

		void serialize(nlohmann::json& j) const;
		static KivgError deserialize(const nlohmann::json& j, DrawOptions& out);
	};

	// Moves a marker along a path of the document
	struct TrackOptions
	{
		// Seconds for one pass over the whole path
		float duration = 2.0f;
		std::string easing = "linear";
		// Start over from the beginning of the path after every pass
		bool repeat = false;
		// Turn the marker to follow the direction of the path
		bool rotate = false;
		// Draw the followed path underneath the marker
		bool showPath = true;
		// Keep drawing the fills of the other paths
		bool keepOthers = true;
		// Document path drawn as the marker, a square marker is used when empty
		std::string markerId = "";
		// Side of the square marker in document units
		float markerSize = 4.0f;
		Vec4 markerColor = Vec4{ 1.0f, 0.0f, 0.0f, 1.0f };

		KivgError validate() const;

		void serialize(nlohmann::json& j) const;
		static KivgError deserialize(const nlohmann::json& j, TrackOptions& out);
	};

	// Accepts the full names and the short forms ("seq", "par")
	std::optional<RevealMode> parseRevealMode(const std::string& name);
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::RevealMode& mode);
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::MalformedPathPolicy& policy);

#endif
