#ifndef KIVG_DRAWING_MANAGER_H
#define KIVG_DRAWING_MANAGER_H
#include "core.h"
#include "core/Options.h"
#include "animation/Animation.h"

namespace Kivg
{
	struct SvgDocument;
	struct PathModel;

	struct RevealPlanEntry
	{
		PathModel* path;
		// Start of the whole reveal of this path and its length, stroke and fill together
		float startOffset;
		float duration;

		float strokeStart;
		float strokeDuration;
		float fillStart;
		float fillDuration;
	};

	namespace DrawingManager
	{
		/**
		 * @brief Plans the stroke and fill reveal of every path in the document.
		 *
		 *        In sequential mode a path starts once the previous path's reveal, fill
		 *        included, has finished. In parallel mode every path starts at zero. The
		 *        fill of a path always starts when its own stroke finishes. Without
		 *        animation every offset and duration is zero.
		 *
		 * @param document The document, must outlive the plan
		 * @param options Draw options, expected to be validated
		 * @return One entry per path in document order
		*/
		std::vector<RevealPlanEntry> planReveal(SvgDocument& document, const DrawOptions& options);

		// Stroke duration of one path, one step per drawable segment
		float strokeDuration(const PathModel& path, const DrawOptions& options);

		// Total time until the last path of the plan is fully revealed
		float planDuration(const std::vector<RevealPlanEntry>& plan);

		// One linear Stroke state per entry, plus a Fill state when fill is enabled
		std::vector<AnimationState> createRevealStates(const std::vector<RevealPlanEntry>& plan, const DrawOptions& options);
	}
}

#endif
