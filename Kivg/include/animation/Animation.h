#ifndef KIVG_ANIMATION_H
#define KIVG_ANIMATION_H
#include "core.h"
#include "core/Errors.h"
#include "math/CMath.h"

#include <nlohmann/json_fwd.hpp>

namespace Kivg
{
	struct PathModel;
	struct Mesh;

	typedef std::function<void()> CompletionCallback;

	enum class GrowthOrigin : uint8
	{
		None = 0,
		Left,
		Right,
		Top,
		Bottom,
		CenterX,
		CenterY,
		Length
	};

	constexpr auto growthOriginNames = fixedSizeArray<const char*, (size_t)GrowthOrigin::Length>(
		"none",
		"left",
		"right",
		"top",
		"bottom",
		"center_x",
		"center_y"
	);

	enum class AnimationStatus : uint8
	{
		Pending = 0,
		Running,
		Completed,
		Length
	};

	constexpr auto animationStatusNames = fixedSizeArray<const char*, (size_t)AnimationStatus::Length>(
		"Pending",
		"Running",
		"Completed"
	);

	// What part of a path an animation state reveals
	enum class RevealPhase : uint8
	{
		Shape = 0,
		Stroke,
		Fill,
		// Position of a marker along the path
		Track,
		Length
	};

	constexpr auto revealPhaseNames = fixedSizeArray<const char*, (size_t)RevealPhase::Length>(
		"Shape",
		"Stroke",
		"Fill",
		"Track"
	);

	struct Easing
	{
		EaseType type;
		EaseDirection direction;

		inline bool operator==(const Easing& other) const { return type == other.type && direction == other.direction; }
		inline bool operator!=(const Easing& other) const { return !(*this == other); }
	};

	constexpr Easing linearEasing = { EaseType::Linear, EaseDirection::None };

	struct AnimationSpec
	{
		// Id of the PathModel this animates
		std::string id;
		GrowthOrigin growthOrigin = GrowthOrigin::None;
		std::string easing = "out_sine";
		float duration = 0.3f;
		CompletionCallback onComplete = nullptr;

		KivgError validate() const;

		void serialize(nlohmann::json& j) const;
		static KivgError deserialize(const nlohmann::json& j, AnimationSpec& out);
	};

	struct AnimationState
	{
		// Not owned, lives as long as the document the run was started on
		PathModel* path;
		RevealPhase phase;
		Easing easing;
		GrowthOrigin growthOrigin;

		float startOffset;
		float duration;
		float elapsed;
		float progress;
		AnimationStatus status;
		// Repeating states start over after every pass and never complete
		bool repeat;
		uint32 passes;

		CompletionCallback onComplete;
		bool callbackFired;
	};

	namespace Animation
	{
		/**
		 * @brief Resolves an easing identifier such as "linear", "out_sine" or "in_out_bounce".
		 * @return The easing, or nullopt when the name is not a registered easing
		*/
		std::optional<Easing> parseEasing(const std::string& name);
		std::string easingToString(const Easing& easing);

		// Every registered easing, "linear" first
		std::vector<Easing> getRegisteredEasings();

		/**
		 * @brief Eased progress of an animation. Returns exactly 0 at or before the start and
		 *        exactly 1 at or after the end, a zero duration is immediately terminal.
		 *        In between the eased value is returned as is and may overshoot [0, 1].
		*/
		float computeProgress(float elapsed, float duration, const Easing& easing);

		// Opacity multiplier for the origin, only GrowthOrigin::None fades
		float growthAlpha(GrowthOrigin origin, float progress);

		/**
		 * @brief Clips the mesh to the region revealed at progress p, growing out of the
		 *        origin across the bounding box. GrowthOrigin::None copies the whole mesh.
		 * @param mesh Source triangles
		 * @param bbox Bounding box the growth is measured against
		 * @param origin Where the growth starts
		 * @param progress Reveal progress, clamped to [0, 1] for the spatial mask
		 * @param out Receives the clipped triangles
		*/
		void applyGrowthMask(const Mesh& mesh, const BBox& bbox, GrowthOrigin origin, float progress, Mesh& out);

		AnimationState createState(PathModel* path, RevealPhase phase, const Easing& easing, GrowthOrigin origin, float startOffset, float duration);

		/**
		 * @brief Moves the state to the given time since its run started. A repeating state
		 *        wraps its progress back to the start after every pass and stays Running.
		 * @return True when the state became Completed during this update, or finished
		 *         another pass when it repeats
		*/
		bool update(AnimationState& state, float runTime);

		/**
		 * @brief Reads a list of animation specs from a JSON array and validates every entry.
		 * @return KivgError::None, or InvalidConfiguration when the JSON is not an array or
		 *         any entry is invalid. The output is untouched on failure.
		*/
		KivgError loadAnimationSpecs(const nlohmann::json& j, std::vector<AnimationSpec>& out);
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::Easing& easing);
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::GrowthOrigin& origin);
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::AnimationStatus& status);
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::RevealPhase& phase);

#endif
