#include "animation/DrawingManager.h"
#include "svg/Svg.h"

namespace Kivg
{
	namespace DrawingManager
	{
		std::vector<RevealPlanEntry> planReveal(SvgDocument& document, const DrawOptions& options)
		{
			std::vector<RevealPlanEntry> plan;
			plan.reserve(document.paths.size());

			float offset = 0.0f;
			for (PathModel& path : document.paths)
			{
				RevealPlanEntry entry;
				entry.path = &path;
				entry.strokeDuration = options.animate ? strokeDuration(path, options) : 0.0f;
				entry.fillDuration = options.animate && options.fill ? options.fillDuration : 0.0f;

				entry.startOffset = options.animate && options.animType == RevealMode::Sequential
					? offset
					: 0.0f;
				entry.strokeStart = entry.startOffset;
				entry.fillStart = entry.strokeStart + entry.strokeDuration;
				entry.duration = entry.strokeDuration + entry.fillDuration;

				offset += entry.duration;
				plan.emplace_back(entry);
			}

			return plan;
		}

		float strokeDuration(const PathModel& path, const DrawOptions& options)
		{
			return options.durationPerStep * (float)path.numDrawableSegments();
		}

		float planDuration(const std::vector<RevealPlanEntry>& plan)
		{
			float res = 0.0f;
			for (const RevealPlanEntry& entry : plan)
			{
				res = glm::max(res, entry.startOffset + entry.duration);
			}

			return res;
		}

		std::vector<AnimationState> createRevealStates(const std::vector<RevealPlanEntry>& plan, const DrawOptions& options)
		{
			std::vector<AnimationState> states;
			states.reserve(plan.size() * 2);
			for (const RevealPlanEntry& entry : plan)
			{
				states.emplace_back(Animation::createState(entry.path, RevealPhase::Stroke, linearEasing, GrowthOrigin::None, entry.strokeStart, entry.strokeDuration));
				if (options.fill)
				{
					states.emplace_back(Animation::createState(entry.path, RevealPhase::Fill, linearEasing, GrowthOrigin::None, entry.fillStart, entry.fillDuration));
				}
			}

			return states;
		}
	}
}
