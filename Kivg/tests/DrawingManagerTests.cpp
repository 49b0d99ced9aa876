#ifdef _KIVG_TESTS
#include "DrawingManagerTests.h"

#include "core.h"
#include "animation/DrawingManager.h"
#include "svg/Svg.h"
#include "svg/SvgParser.h"
#include "math/CMath.h"

#include <cppUtils/cppTests.hpp>

using namespace CppUtils;

namespace Kivg
{
	namespace DrawingManagerTests
	{
		// -------------------- Constants --------------------
		constexpr float timeEpsilon = 0.0001f;

		// Three squares with four drawable segments each
		static const char* threeSquaresSvg = R"(
			<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100" viewBox="0 0 100 100">
				<path id="first" d="M0,0 H10 V10 H0 Z" fill="#ff0000"/>
				<path id="second" d="M20,0 H30 V10 H20 Z" fill="#00ff00"/>
				<path id="third" d="M40,0 H50 V10 H40 Z" fill="#0000ff"/>
			</svg>
		)";

		// -------------------- Private functions --------------------
		static SvgDocument loadThreeSquares();
		static DrawOptions animatedOptions(RevealMode mode, bool fill);

		// -------------------- Planning --------------------
		DEFINE_TEST(strokeDurationScalesWithDrawableSegments)
		{
			SvgDocument document = loadThreeSquares();
			ASSERT_EQUAL(document.paths.size(), (size_t)3);
			ASSERT_EQUAL(document.paths[0].numDrawableSegments(), 4);

			DrawOptions options = animatedOptions(RevealMode::Sequential, true);
			ASSERT_TRUE(CMath::compare(DrawingManager::strokeDuration(document.paths[0], options), 0.4f, timeEpsilon));

			END_TEST;
		}

		DEFINE_TEST(sequentialPathsWaitForThePreviousFill)
		{
			SvgDocument document = loadThreeSquares();
			DrawOptions options = animatedOptions(RevealMode::Sequential, true);
			std::vector<RevealPlanEntry> plan = DrawingManager::planReveal(document, options);
			ASSERT_EQUAL(plan.size(), (size_t)3);

			const float expectedStarts[] = { 0.0f, 0.8f, 1.6f };
			for (size_t i = 0; i < plan.size(); i++)
			{
				ASSERT_TRUE(plan[i].path == &document.paths[i]);
				ASSERT_TRUE(CMath::compare(plan[i].startOffset, expectedStarts[i], timeEpsilon));
				ASSERT_TRUE(CMath::compare(plan[i].strokeStart, plan[i].startOffset, timeEpsilon));
				ASSERT_TRUE(CMath::compare(plan[i].strokeDuration, 0.4f, timeEpsilon));
				ASSERT_TRUE(CMath::compare(plan[i].fillStart, plan[i].strokeStart + plan[i].strokeDuration, timeEpsilon));
				ASSERT_TRUE(CMath::compare(plan[i].fillDuration, 0.4f, timeEpsilon));
			}

			for (size_t i = 1; i < plan.size(); i++)
			{
				ASSERT_TRUE(plan[i].strokeStart >= plan[i - 1].fillStart + plan[i - 1].fillDuration - timeEpsilon);
			}

			ASSERT_TRUE(CMath::compare(DrawingManager::planDuration(plan), 2.4f, timeEpsilon));

			END_TEST;
		}

		DEFINE_TEST(parallelPathsAllStartAtZero)
		{
			SvgDocument document = loadThreeSquares();
			DrawOptions options = animatedOptions(RevealMode::Parallel, true);
			std::vector<RevealPlanEntry> plan = DrawingManager::planReveal(document, options);
			ASSERT_EQUAL(plan.size(), (size_t)3);

			for (const RevealPlanEntry& entry : plan)
			{
				ASSERT_TRUE(entry.startOffset == 0.0f);
				ASSERT_TRUE(entry.strokeStart == 0.0f);
				ASSERT_TRUE(CMath::compare(entry.fillStart, entry.strokeDuration, timeEpsilon));
			}

			ASSERT_TRUE(CMath::compare(DrawingManager::planDuration(plan), 0.8f, timeEpsilon));

			END_TEST;
		}

		DEFINE_TEST(disablingFillShortensTheSequence)
		{
			SvgDocument document = loadThreeSquares();
			DrawOptions options = animatedOptions(RevealMode::Sequential, false);
			std::vector<RevealPlanEntry> plan = DrawingManager::planReveal(document, options);

			const float expectedStarts[] = { 0.0f, 0.4f, 0.8f };
			for (size_t i = 0; i < plan.size(); i++)
			{
				ASSERT_TRUE(CMath::compare(plan[i].startOffset, expectedStarts[i], timeEpsilon));
				ASSERT_TRUE(plan[i].fillDuration == 0.0f);
			}

			std::vector<AnimationState> states = DrawingManager::createRevealStates(plan, options);
			ASSERT_EQUAL(states.size(), (size_t)3);
			for (const AnimationState& state : states)
			{
				ASSERT_EQUAL(state.phase, RevealPhase::Stroke);
				ASSERT_TRUE(state.easing == linearEasing);
			}

			END_TEST;
		}

		DEFINE_TEST(nonAnimatedPlanHasNoDurations)
		{
			SvgDocument document = loadThreeSquares();
			DrawOptions options = {};
			options.animate = false;
			options.fill = true;
			std::vector<RevealPlanEntry> plan = DrawingManager::planReveal(document, options);
			ASSERT_EQUAL(plan.size(), (size_t)3);

			for (const RevealPlanEntry& entry : plan)
			{
				ASSERT_TRUE(entry.startOffset == 0.0f);
				ASSERT_TRUE(entry.duration == 0.0f);
				ASSERT_TRUE(entry.strokeDuration == 0.0f);
				ASSERT_TRUE(entry.fillStart == 0.0f);
				ASSERT_TRUE(entry.fillDuration == 0.0f);
			}
			ASSERT_TRUE(DrawingManager::planDuration(plan) == 0.0f);

			// Stroke before fill for every path so fills are submitted over their outlines
			std::vector<AnimationState> states = DrawingManager::createRevealStates(plan, options);
			ASSERT_EQUAL(states.size(), (size_t)6);
			for (size_t i = 0; i < states.size(); i += 2)
			{
				ASSERT_EQUAL(states[i].phase, RevealPhase::Stroke);
				ASSERT_EQUAL(states[i + 1].phase, RevealPhase::Fill);
				ASSERT_TRUE(states[i].path == states[i + 1].path);
				ASSERT_TRUE(Animation::update(states[i], 0.0f));
				ASSERT_TRUE(Animation::update(states[i + 1], 0.0f));
			}

			END_TEST;
		}

		DEFINE_TEST(revealStatesFollowThePlan)
		{
			SvgDocument document = loadThreeSquares();
			DrawOptions options = animatedOptions(RevealMode::Sequential, true);
			std::vector<RevealPlanEntry> plan = DrawingManager::planReveal(document, options);
			std::vector<AnimationState> states = DrawingManager::createRevealStates(plan, options);
			ASSERT_EQUAL(states.size(), (size_t)6);

			for (size_t i = 0; i < plan.size(); i++)
			{
				const AnimationState& stroke = states[i * 2];
				const AnimationState& fill = states[i * 2 + 1];
				ASSERT_TRUE(CMath::compare(stroke.startOffset, plan[i].strokeStart, timeEpsilon));
				ASSERT_TRUE(CMath::compare(stroke.duration, plan[i].strokeDuration, timeEpsilon));
				ASSERT_TRUE(CMath::compare(fill.startOffset, plan[i].fillStart, timeEpsilon));
				ASSERT_TRUE(CMath::compare(fill.duration, plan[i].fillDuration, timeEpsilon));
				ASSERT_EQUAL(stroke.status, AnimationStatus::Pending);
				ASSERT_EQUAL(fill.status, AnimationStatus::Pending);
			}

			END_TEST;
		}

		// -------------------- Public functions --------------------
		void setupTestSuite()
		{
			Tests::TestSuite& testSuite = Tests::addTestSuite("DrawingManager");

			ADD_TEST(testSuite, strokeDurationScalesWithDrawableSegments);
			ADD_TEST(testSuite, sequentialPathsWaitForThePreviousFill);
			ADD_TEST(testSuite, parallelPathsAllStartAtZero);
			ADD_TEST(testSuite, disablingFillShortensTheSequence);
			ADD_TEST(testSuite, nonAnimatedPlanHasNoDurations);
			ADD_TEST(testSuite, revealStatesFollowThePlan);
		}

		// -------------------- Private functions --------------------
		static SvgDocument loadThreeSquares()
		{
			SvgDocument document = {};
			KivgError error = SvgParser::parseSvgDoc(threeSquaresSvg, std::strlen(threeSquaresSvg), LoadOptions{}, document);
			g_logger_assert(error == KivgError::None, "Failed to load the test document.");
			return document;
		}

		static DrawOptions animatedOptions(RevealMode mode, bool fill)
		{
			DrawOptions options = {};
			options.animate = true;
			options.fill = fill;
			options.animType = mode;
			options.durationPerStep = 0.1f;
			options.fillDuration = 0.4f;
			return options;
		}
	}
}

#endif
