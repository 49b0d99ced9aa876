#ifdef _KIVG_TESTS
#include "SvgAnimatorTests.h"
#include "RecordingSurface.h"

#include "core.h"
#include "core/SvgAnimator.h"
#include "renderer/LoggingSurface.h"
#include "svg/Svg.h"
#include "svg/Tessellator.h"
#include "math/CMath.h"

#include <cppUtils/cppTests.hpp>

using namespace CppUtils;

namespace Kivg
{
	namespace SvgAnimatorTests
	{
		// -------------------- Constants --------------------
		static const char* squaresSvg = R"(
			<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100" viewBox="0 0 100 100">
				<path id="first" d="M0,0 H10 V10 H0 Z" fill="#ff0000"/>
				<path id="second" d="M20,0 H30 V10 H20 Z" fill="#00ff00"/>
				<path id="third" d="M40,0 H50 V10 H40 Z" fill="#0000ff"/>
			</svg>
		)";

		static const char* trackSvg = R"(
			<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100" viewBox="0 0 100 100">
				<path id="track" d="M0,0 H10 V10 H0 Z" fill="#ff0000"/>
				<path id="arrow" d="M60,60 H66 V62 H60 Z" fill="#000000"/>
			</svg>
		)";

		static const Vec2 surfacePosition = Vec2{ 0.0f, 0.0f };
		static const Vec2 surfaceSize = Vec2{ 200.0f, 200.0f };

		// -------------------- Private functions --------------------
		static SvgAnimatorData* createWithSquares(RecordingSurface& surface);
		static SvgAnimatorData* createWithDocument(RecordingSurface& surface, const char* svg);
		static TrackOptions markerOnlyOptions(float duration);
		static Vec2 submissionCenter(const RecordedMesh& mesh);
		static DrawOptions animatedOptions();
		static AnimationSpec makeSpec(const char* id, float duration, GrowthOrigin origin = GrowthOrigin::None);
		static void advanceFor(SvgAnimatorData* animator, float seconds, float step);
		static BBox submissionBounds(const RecordedMesh& mesh);

		// -------------------- Documents --------------------
		DEFINE_TEST(animatingWithoutDocumentFails)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = SvgAnimator::create(&surface);

			g_logger_level oldLevel = g_logger_get_level();
			g_logger_set_level(g_logger_level_None);
			KivgError drawError = SvgAnimator::draw(animator, DrawOptions{});
			KivgError shapeError = SvgAnimator::shapeAnimate(animator, { makeSpec("first", 0.3f) });
			KivgError loadError = SvgAnimator::loadDocument(animator, "<svg><path", 10);
			g_logger_set_level(oldLevel);

			ASSERT_EQUAL(drawError, KivgError::NoDocumentLoaded);
			ASSERT_EQUAL(shapeError, KivgError::NoDocumentLoaded);
			ASSERT_EQUAL(loadError, KivgError::MalformedDocument);
			ASSERT_TRUE(SvgAnimator::getDocument(animator) == nullptr);
			ASSERT_EQUAL(surface.frameCount, (uint32)0);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(loadingNewDocumentCancelsTheRun)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			ASSERT_EQUAL(SvgAnimator::draw(animator, animatedOptions(), [&fired]() { fired++; }), KivgError::None);
			SvgAnimator::advance(animator, 0.1f);
			ASSERT_TRUE(SvgAnimator::isAnimating(animator));

			ASSERT_EQUAL(SvgAnimator::loadDocument(animator, squaresSvg, std::strlen(squaresSvg)), KivgError::None);
			ASSERT_FALSE(SvgAnimator::isAnimating(animator));
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Cancelled);
			ASSERT_TRUE(SvgAnimator::getAnimationStates(animator).empty());

			advanceFor(animator, 10.0f, 0.1f);
			ASSERT_EQUAL(fired, 0);

			SvgAnimator::free(animator);

			END_TEST;
		}

		// -------------------- Drawing --------------------
		DEFINE_TEST(nonAnimatedDrawRendersImmediately)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			DrawOptions options = {};
			options.animate = false;
			ASSERT_EQUAL(SvgAnimator::draw(animator, options, [&fired]() { fired++; }), KivgError::None);

			ASSERT_EQUAL(fired, 1);
			ASSERT_EQUAL(surface.frameCount, (uint32)1);
			ASSERT_EQUAL(surface.nestedFrames, (uint32)0);
			// Stroke then fill for each of the three paths
			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)6);
			ASSERT_TRUE(CMath::compare(surface.lastFrame[0].color, options.lineColor));
			ASSERT_TRUE(CMath::compare(surface.lastFrame[1].color, Vec4{ 1.0f, 0.0f, 0.0f, 1.0f }));
			ASSERT_TRUE(CMath::compare(surface.lastFrame[3].color, Vec4{ 0.0f, 1.0f, 0.0f, 1.0f }));
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Completed);

			// Nothing left to animate
			SvgAnimator::advance(animator, 1.0f);
			ASSERT_EQUAL(surface.frameCount, (uint32)1);
			ASSERT_EQUAL(fired, 1);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(documentIsMappedOntoTheSurface)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			ASSERT_TRUE(CMath::compare(SvgAnimator::toSurfaceSpace(animator, Vec2{ 0.0f, 0.0f }), Vec2{ 0.0f, 200.0f }));
			ASSERT_TRUE(CMath::compare(SvgAnimator::toSurfaceSpace(animator, Vec2{ 100.0f, 100.0f }), Vec2{ 200.0f, 0.0f }));
			ASSERT_TRUE(CMath::compare(SvgAnimator::toSurfaceSpace(animator, Vec2{ 25.0f, 75.0f }), Vec2{ 50.0f, 50.0f }));

			DrawOptions options = {};
			options.animate = false;
			ASSERT_EQUAL(SvgAnimator::draw(animator, options), KivgError::None);

			BBox fillBounds = submissionBounds(surface.lastFrame[1]);
			ASSERT_TRUE(CMath::compare(fillBounds.min, Vec2{ 0.0f, 180.0f }, 0.0001f));
			ASSERT_TRUE(CMath::compare(fillBounds.max, Vec2{ 20.0f, 200.0f }, 0.0001f));

			SvgAnimator::free(animator);

			// The surface position offsets everything
			RecordingSurface offsetSurface = RecordingSurface(Vec2{ 10.0f, 20.0f }, Vec2{ 100.0f, 100.0f });
			SvgAnimatorData* offsetAnimator = createWithSquares(offsetSurface);
			ASSERT_TRUE(CMath::compare(SvgAnimator::toSurfaceSpace(offsetAnimator, Vec2{ 0.0f, 0.0f }), Vec2{ 10.0f, 120.0f }));
			ASSERT_TRUE(CMath::compare(SvgAnimator::toSurfaceSpace(offsetAnimator, Vec2{ 50.0f, 100.0f }), Vec2{ 60.0f, 20.0f }));
			SvgAnimator::free(offsetAnimator);

			END_TEST;
		}

		DEFINE_TEST(animatedDrawRevealsStrokeThenFill)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			// Stroke of the first path takes 0.4 seconds, its fill another 0.4
			ASSERT_EQUAL(SvgAnimator::draw(animator, animatedOptions(), [&fired]() { fired++; }), KivgError::None);
			ASSERT_EQUAL(surface.frameCount, (uint32)0);

			SvgAnimator::advance(animator, 0.2f);
			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)1);
			ASSERT_TRUE(CMath::compare(surface.lastFrame[0].color, animatedOptions().lineColor));
			const std::vector<AnimationState>& states = SvgAnimator::getAnimationStates(animator);
			ASSERT_EQUAL(states[0].status, AnimationStatus::Running);
			ASSERT_TRUE(CMath::compare(states[0].progress, 0.5f, 0.001f));
			ASSERT_EQUAL(states[1].status, AnimationStatus::Pending);

			SvgAnimator::advance(animator, 0.4f);
			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)2);
			ASSERT_EQUAL(states[0].status, AnimationStatus::Completed);
			ASSERT_EQUAL(states[1].status, AnimationStatus::Running);
			ASSERT_TRUE(CMath::compare(surface.lastFrame[1].color.a, 0.5f, 0.01f));
			ASSERT_EQUAL(fired, 0);

			advanceFor(animator, 3.0f, 0.1f);
			ASSERT_EQUAL(fired, 1);
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Completed);
			ASSERT_EQUAL(surface.nestedFrames, (uint32)0);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(partialStrokeCoversLessThanTheFullOutline)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			ASSERT_EQUAL(SvgAnimator::draw(animator, animatedOptions()), KivgError::None);
			// A quarter of the first square's outline is its top edge
			SvgAnimator::advance(animator, 0.1f);
			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)1);
			BBox partial = submissionBounds(surface.lastFrame[0]);

			SvgAnimator::advance(animator, 0.3f);
			BBox full = submissionBounds(surface.lastFrame[0]);

			float partialHeight = partial.max.y - partial.min.y;
			float fullHeight = full.max.y - full.min.y;
			ASSERT_TRUE(partialHeight < fullHeight);
			ASSERT_TRUE(fullHeight >= 20.0f);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(restartingDrawOnlyFiresTheNewCallback)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int firstFired = 0;
			int secondFired = 0;
			ASSERT_EQUAL(SvgAnimator::draw(animator, animatedOptions(), [&firstFired]() { firstFired++; }), KivgError::None);
			SvgAnimator::advance(animator, 0.5f);

			ASSERT_EQUAL(SvgAnimator::draw(animator, animatedOptions(), [&secondFired]() { secondFired++; }), KivgError::None);
			ASSERT_TRUE(SvgAnimator::getAnimationStates(animator)[0].elapsed == 0.0f);
			advanceFor(animator, 5.0f, 0.1f);

			ASSERT_EQUAL(firstFired, 0);
			ASSERT_EQUAL(secondFired, 1);

			SvgAnimator::cancel(animator);
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Completed);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(invalidDrawOptionsAreRejected)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			DrawOptions options = animatedOptions();
			options.lineWidth = -1.0f;

			g_logger_level oldLevel = g_logger_get_level();
			g_logger_set_level(g_logger_level_None);
			KivgError error = SvgAnimator::draw(animator, options);
			g_logger_set_level(oldLevel);

			ASSERT_EQUAL(error, KivgError::InvalidConfiguration);
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Idle);

			SvgAnimator::free(animator);

			END_TEST;
		}

		// -------------------- Shape animations --------------------
		DEFINE_TEST(shapeAnimationsRunOneAfterAnother)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			std::vector<AnimationSpec> specs = {
				makeSpec("first", 0.5f),
				makeSpec("second", 0.25f),
				makeSpec("third", 1.0f)
			};
			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, specs), KivgError::None);

			const std::vector<AnimationState>& states = SvgAnimator::getAnimationStates(animator);
			ASSERT_EQUAL(states.size(), (size_t)3);
			ASSERT_TRUE(CMath::compare(states[0].startOffset, 0.0f));
			ASSERT_TRUE(CMath::compare(states[1].startOffset, 0.5f, 0.0001f));
			ASSERT_TRUE(CMath::compare(states[2].startOffset, 0.75f, 0.0001f));
			ASSERT_EQUAL(states[0].phase, RevealPhase::Shape);
			ASSERT_TRUE(states[0].path == SvgAnimator::findPath(animator, "first"));

			// Only started shapes are drawn
			SvgAnimator::advance(animator, 0.25f);
			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)1);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(leftGrowthRevealsHalfTheShapeHalfway)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			AnimationSpec spec = makeSpec("first", 1.0f, GrowthOrigin::Left);
			spec.easing = "linear";
			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, { spec }), KivgError::None);

			SvgAnimator::advance(animator, 0.5f);
			const PathModel* path = SvgAnimator::findPath(animator, "first");
			ASSERT_TRUE(path != nullptr);
			ASSERT_TRUE(CMath::compare(Tessellator::meshArea(path->visibleMesh), 50.0f, 0.001f));

			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)1);
			BBox bounds = submissionBounds(surface.lastFrame[0]);
			ASSERT_TRUE(CMath::compare(bounds.min.x, 0.0f, 0.0001f));
			ASSERT_TRUE(CMath::compare(bounds.max.x, 10.0f, 0.0001f));
			ASSERT_TRUE(CMath::compare(surface.lastFrame[0].color.a, 1.0f));

			SvgAnimator::advance(animator, 0.5f);
			ASSERT_TRUE(CMath::compare(Tessellator::meshArea(path->visibleMesh), 100.0f, 0.001f));

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(unresolvedTargetsAreSkipped)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			std::vector<AnimationSpec> specs = { makeSpec("missing", 2.0f), makeSpec("second", 0.5f) };

			g_logger_level oldLevel = g_logger_get_level();
			g_logger_set_level(g_logger_level_None);
			KivgError error = SvgAnimator::shapeAnimate(animator, specs, [&fired]() { fired++; });
			g_logger_set_level(oldLevel);

			ASSERT_EQUAL(error, KivgError::None);
			const std::vector<AnimationState>& states = SvgAnimator::getAnimationStates(animator);
			ASSERT_EQUAL(states.size(), (size_t)1);
			ASSERT_TRUE(states[0].startOffset == 0.0f);
			ASSERT_TRUE(states[0].path == SvgAnimator::findPath(animator, "second"));

			advanceFor(animator, 1.0f, 0.1f);
			ASSERT_EQUAL(fired, 1);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(noResolvedTargetsCompletesImmediately)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			g_logger_level oldLevel = g_logger_get_level();
			g_logger_set_level(g_logger_level_None);
			KivgError error = SvgAnimator::shapeAnimate(animator, { makeSpec("missing", 1.0f), makeSpec("gone", 1.0f) }, [&fired]() { fired++; });
			g_logger_set_level(oldLevel);

			ASSERT_EQUAL(error, KivgError::None);
			ASSERT_EQUAL(fired, 1);
			ASSERT_FALSE(SvgAnimator::isAnimating(animator));
			ASSERT_EQUAL(surface.frameCount, (uint32)0);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(emptySpecListOnlyCancels)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int previousFired = 0;
			int emptyFired = 0;
			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, { makeSpec("first", 1.0f) }, [&previousFired]() { previousFired++; }), KivgError::None);
			SvgAnimator::advance(animator, 0.5f);

			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, {}, [&emptyFired]() { emptyFired++; }), KivgError::None);
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Cancelled);
			ASSERT_TRUE(SvgAnimator::findPath(animator, "first")->visibleMesh.empty());

			advanceFor(animator, 2.0f, 0.1f);
			ASSERT_EQUAL(previousFired, 0);
			ASSERT_EQUAL(emptyFired, 0);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(invalidSpecLeavesTheCurrentRunAlone)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, { makeSpec("first", 1.0f) }, [&fired]() { fired++; }), KivgError::None);
			SvgAnimator::advance(animator, 0.25f);

			AnimationSpec invalid = makeSpec("second", 1.0f);
			invalid.easing = "out_wobble";

			g_logger_level oldLevel = g_logger_get_level();
			g_logger_set_level(g_logger_level_None);
			KivgError error = SvgAnimator::shapeAnimate(animator, { makeSpec("third", 1.0f), invalid });
			g_logger_set_level(oldLevel);

			ASSERT_EQUAL(error, KivgError::InvalidConfiguration);
			ASSERT_TRUE(SvgAnimator::isAnimating(animator));
			ASSERT_EQUAL(SvgAnimator::getAnimationStates(animator).size(), (size_t)1);

			advanceFor(animator, 1.0f, 0.1f);
			ASSERT_EQUAL(fired, 1);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(pathCallbacksFireBeforeTheDocumentCallback)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			std::vector<int> fired;
			AnimationSpec first = makeSpec("first", 0.3f);
			first.onComplete = [&fired]() { fired.push_back(1); };
			AnimationSpec second = makeSpec("second", 0.3f);
			second.onComplete = [&fired]() { fired.push_back(2); };

			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, { first, second }, [&fired]() { fired.push_back(0); }), KivgError::None);
			advanceFor(animator, 2.0f, 0.05f);

			ASSERT_EQUAL(fired.size(), (size_t)3);
			ASSERT_EQUAL(fired[0], 1);
			ASSERT_EQUAL(fired[1], 2);
			ASSERT_EQUAL(fired[2], 0);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(callbackStartingNewRunSilencesTheOldRun)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int oldRunFired = 0;
			int newRunFired = 0;
			AnimationSpec spec = makeSpec("first", 0.5f);
			spec.onComplete = [animator, &newRunFired]() {
				SvgAnimator::shapeAnimate(animator, { makeSpec("second", 0.5f) }, [&newRunFired]() { newRunFired++; });
			};

			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, { spec }, [&oldRunFired]() { oldRunFired++; }), KivgError::None);

			// The path and the run complete in the same frame
			SvgAnimator::advance(animator, 1.0f);
			ASSERT_EQUAL(oldRunFired, 0);
			ASSERT_TRUE(SvgAnimator::isAnimating(animator));
			ASSERT_TRUE(SvgAnimator::getAnimationStates(animator)[0].path == SvgAnimator::findPath(animator, "second"));

			SvgAnimator::advance(animator, 1.0f);
			ASSERT_EQUAL(oldRunFired, 0);
			ASSERT_EQUAL(newRunFired, 1);

			SvgAnimator::free(animator);

			END_TEST;
		}

		// -------------------- Scheduling and queries --------------------
		DEFINE_TEST(boundSchedulerDrivesTheAnimation)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			ManualScheduler scheduler;
			SvgAnimatorData* animator = createWithSquares(surface);
			SvgAnimator::bindScheduler(animator, &scheduler);

			int fired = 0;
			ASSERT_EQUAL(SvgAnimator::draw(animator, animatedOptions(), [&fired]() { fired++; }), KivgError::None);

			int ticks = 0;
			while (SvgAnimator::isAnimating(animator) && ticks < 1000)
			{
				ASSERT_TRUE(scheduler.tick(1.0f / 60.0f));
				ticks++;
			}

			ASSERT_FALSE(SvgAnimator::isAnimating(animator));
			ASSERT_EQUAL(fired, 1);
			ASSERT_EQUAL(surface.frameCount, (uint32)ticks);

			SvgAnimator::free(animator);
			ASSERT_FALSE(scheduler.tick(1.0f / 60.0f));

			END_TEST;
		}

		DEFINE_TEST(headlessSurfaceCountsFrames)
		{
			LoggingSurface surface = LoggingSurface(surfacePosition, surfaceSize, false);
			FixedStepScheduler scheduler = FixedStepScheduler(10.0f);
			ASSERT_TRUE(CMath::compare(scheduler.getFrameTime(), 0.1f));
			ASSERT_FALSE(scheduler.step());

			SvgAnimatorData* animator = SvgAnimator::create(&surface);
			g_logger_level oldLevel = g_logger_get_level();
			g_logger_set_level(g_logger_level_None);
			KivgError error = SvgAnimator::loadDocument(animator, squaresSvg, std::strlen(squaresSvg));
			g_logger_set_level(oldLevel);
			ASSERT_EQUAL(error, KivgError::None);
			SvgAnimator::bindScheduler(animator, &scheduler);

			// One square grows over five frames
			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, { makeSpec("third", 0.45f) }), KivgError::None);
			while (SvgAnimator::isAnimating(animator) && surface.getFrameCount() < 100)
			{
				scheduler.step();
			}

			ASSERT_EQUAL(surface.getFrameCount(), (uint32)5);
			ASSERT_EQUAL(surface.getLastFrameSubmissions(), (size_t)1);
			ASSERT_EQUAL(surface.getLastFrameTriangles(), (size_t)2);
			ASSERT_EQUAL(surface.getTotalSubmissions(), (size_t)5);

			SvgAnimator::free(animator);
			ASSERT_FALSE(scheduler.step());

			END_TEST;
		}

		DEFINE_TEST(pathsCanBeSampledThroughTheAnimator)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			// Samples come back in surface space, with y pointing up
			std::optional<PathSample> start = SvgAnimator::samplePath(animator, "first", 0.0f);
			ASSERT_TRUE(start.has_value());
			ASSERT_TRUE(CMath::compare(start->position, Vec2{ 0.0f, 200.0f }, 0.0001f));
			ASSERT_TRUE(CMath::compare(start->angleDegrees, 0.0f, 0.0001f));

			std::optional<PathSample> topEdge = SvgAnimator::samplePath(animator, "second", 0.125f);
			ASSERT_TRUE(topEdge.has_value());
			ASSERT_TRUE(CMath::compare(topEdge->position, Vec2{ 50.0f, 200.0f }, 0.0001f));

			// Moving down the document is moving down the surface as well
			std::optional<PathSample> rightEdge = SvgAnimator::samplePath(animator, "first", 0.375f);
			ASSERT_TRUE(rightEdge.has_value());
			ASSERT_TRUE(CMath::compare(rightEdge->position, Vec2{ 20.0f, 190.0f }, 0.0001f));
			ASSERT_TRUE(CMath::compare(rightEdge->angleDegrees, -90.0f, 0.0001f));

			ASSERT_TRUE(SvgAnimator::findPath(animator, "nope") == nullptr);
			ASSERT_FALSE(SvgAnimator::samplePath(animator, "nope", 0.5f).has_value());

			SvgAnimator::unloadDocument(animator);
			ASSERT_TRUE(SvgAnimator::findPath(animator, "first") == nullptr);

			SvgAnimator::free(animator);

			END_TEST;
		}

		// -------------------- Path tracking --------------------
		DEFINE_TEST(markerFollowsThePathOnTheSurface)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "first", markerOnlyOptions(1.0f)), KivgError::None);
			const std::vector<AnimationState>& states = SvgAnimator::getAnimationStates(animator);
			ASSERT_EQUAL(states.size(), (size_t)1);
			ASSERT_EQUAL(states[0].phase, RevealPhase::Track);

			// Three eighths of the way round is the middle of the right edge, (10, 5) in the document
			SvgAnimator::advance(animator, 0.375f);
			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)1);
			BBox bounds = submissionBounds(surface.lastFrame[0]);
			ASSERT_TRUE(CMath::compare(bounds.min, Vec2{ 16.0f, 186.0f }, 0.001f));
			ASSERT_TRUE(CMath::compare(bounds.max, Vec2{ 24.0f, 194.0f }, 0.001f));
			ASSERT_TRUE(CMath::compare(surface.lastFrame[0].color, Vec4{ 1.0f, 0.0f, 0.0f, 1.0f }));

			SvgAnimator::advance(animator, 0.125f);
			ASSERT_TRUE(CMath::compare(submissionCenter(surface.lastFrame[0]), Vec2{ 20.0f, 180.0f }, 0.001f));

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(trackingDrawsThePathAndTheOtherShapes)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			TrackOptions options = {};
			options.duration = 1.0f;
			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "first", options), KivgError::None);
			SvgAnimator::advance(animator, 0.25f);

			// The other fills, the followed outline, then the marker on top
			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)4);
			ASSERT_TRUE(CMath::compare(surface.lastFrame[0].color, Vec4{ 0.0f, 1.0f, 0.0f, 1.0f }));
			ASSERT_TRUE(CMath::compare(surface.lastFrame[1].color, Vec4{ 0.0f, 0.0f, 1.0f, 1.0f }));
			ASSERT_TRUE(CMath::compare(surface.lastFrame[2].color, Vec4{ 0.7f, 0.7f, 0.7f, 0.5f }));
			ASSERT_TRUE(CMath::compare(surface.lastFrame[3].color, options.markerColor));
			ASSERT_TRUE(CMath::compare(submissionCenter(surface.lastFrame[3]), Vec2{ 20.0f, 200.0f }, 0.001f));

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(rotatedMarkerFollowsTheDirectionOfTravel)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithDocument(surface, trackSvg);

			// The 6 by 2 marker lies flat without rotation
			TrackOptions options = markerOnlyOptions(1.0f);
			options.markerId = "arrow";
			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "track", options), KivgError::None);
			SvgAnimator::advance(animator, 0.375f);
			ASSERT_EQUAL(surface.lastFrame.size(), (size_t)1);
			BBox flat = submissionBounds(surface.lastFrame[0]);
			ASSERT_TRUE(CMath::compare(flat.min, Vec2{ 14.0f, 188.0f }, 0.001f));
			ASSERT_TRUE(CMath::compare(flat.max, Vec2{ 26.0f, 192.0f }, 0.001f));
			ASSERT_TRUE(CMath::compare(surface.lastFrame[0].color, Vec4{ 0.0f, 0.0f, 0.0f, 1.0f }));

			// Going down the right edge turns it upright
			options.rotate = true;
			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "track", options), KivgError::None);
			SvgAnimator::advance(animator, 0.375f);
			BBox upright = submissionBounds(surface.lastFrame[0]);
			ASSERT_TRUE(CMath::compare(upright.min, Vec2{ 18.0f, 184.0f }, 0.001f));
			ASSERT_TRUE(CMath::compare(upright.max, Vec2{ 22.0f, 196.0f }, 0.001f));

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(trackingCallbackFiresOnce)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "first", markerOnlyOptions(1.0f), [&fired]() { fired++; }), KivgError::None);

			advanceFor(animator, 0.5f, 0.1f);
			ASSERT_EQUAL(fired, 0);

			advanceFor(animator, 3.0f, 0.1f);
			ASSERT_EQUAL(fired, 1);
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Completed);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(repeatingTrackWrapsAndFiresOnce)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			TrackOptions options = markerOnlyOptions(1.0f);
			options.repeat = true;
			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "first", options, [&fired]() { fired++; }), KivgError::None);

			// One pass and an eighth puts the marker back on the top edge at (5, 0)
			SvgAnimator::advance(animator, 1.125f);
			ASSERT_EQUAL(fired, 1);
			ASSERT_TRUE(SvgAnimator::isAnimating(animator));
			ASSERT_EQUAL(SvgAnimator::getAnimationStates(animator)[0].status, AnimationStatus::Running);
			ASSERT_TRUE(CMath::compare(SvgAnimator::getAnimationStates(animator)[0].progress, 0.125f, 0.0001f));
			ASSERT_TRUE(CMath::compare(submissionCenter(surface.lastFrame[0]), Vec2{ 10.0f, 200.0f }, 0.001f));

			advanceFor(animator, 5.0f, 0.1f);
			ASSERT_EQUAL(fired, 1);
			ASSERT_TRUE(SvgAnimator::isAnimating(animator));

			SvgAnimator::cancel(animator);
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Cancelled);
			ASSERT_EQUAL(fired, 1);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(restartingCancelsTheTrackingRun)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int firstFired = 0;
			int secondFired = 0;
			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "first", markerOnlyOptions(1.0f), [&firstFired]() { firstFired++; }), KivgError::None);
			SvgAnimator::advance(animator, 0.5f);

			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "second", markerOnlyOptions(0.5f), [&secondFired]() { secondFired++; }), KivgError::None);
			const std::vector<AnimationState>& states = SvgAnimator::getAnimationStates(animator);
			ASSERT_EQUAL(states.size(), (size_t)1);
			ASSERT_TRUE(states[0].path == SvgAnimator::findPath(animator, "second"));

			advanceFor(animator, 2.0f, 0.1f);
			ASSERT_EQUAL(firstFired, 0);
			ASSERT_EQUAL(secondFired, 1);

			// Any other run cancels tracking too
			int trackFired = 0;
			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "third", markerOnlyOptions(1.0f), [&trackFired]() { trackFired++; }), KivgError::None);
			SvgAnimator::advance(animator, 0.5f);
			ASSERT_EQUAL(SvgAnimator::shapeAnimate(animator, { makeSpec("first", 0.3f) }), KivgError::None);
			advanceFor(animator, 2.0f, 0.1f);
			ASSERT_EQUAL(trackFired, 0);
			ASSERT_EQUAL(SvgAnimator::getRunStatus(animator), RunStatus::Completed);

			SvgAnimator::free(animator);

			END_TEST;
		}

		DEFINE_TEST(invalidTrackingLeavesTheCurrentRunAlone)
		{
			RecordingSurface surface = RecordingSurface(surfacePosition, surfaceSize);
			SvgAnimatorData* animator = createWithSquares(surface);

			int fired = 0;
			ASSERT_EQUAL(SvgAnimator::animateAlongPath(animator, "first", markerOnlyOptions(1.0f), [&fired]() { fired++; }), KivgError::None);
			SvgAnimator::advance(animator, 0.25f);

			TrackOptions badEasing = markerOnlyOptions(1.0f);
			badEasing.easing = "out_wobble";
			TrackOptions missingMarker = markerOnlyOptions(1.0f);
			missingMarker.markerId = "nope";

			g_logger_level oldLevel = g_logger_get_level();
			g_logger_set_level(g_logger_level_None);
			KivgError missingPathError = SvgAnimator::animateAlongPath(animator, "nope", markerOnlyOptions(1.0f));
			KivgError missingMarkerError = SvgAnimator::animateAlongPath(animator, "second", missingMarker);
			KivgError easingError = SvgAnimator::animateAlongPath(animator, "second", badEasing);
			g_logger_set_level(oldLevel);

			ASSERT_EQUAL(missingPathError, KivgError::UnresolvedAnimationTarget);
			ASSERT_EQUAL(missingMarkerError, KivgError::UnresolvedAnimationTarget);
			ASSERT_EQUAL(easingError, KivgError::InvalidConfiguration);
			ASSERT_TRUE(SvgAnimator::isAnimating(animator));
			ASSERT_TRUE(SvgAnimator::getAnimationStates(animator)[0].path == SvgAnimator::findPath(animator, "first"));

			advanceFor(animator, 1.0f, 0.1f);
			ASSERT_EQUAL(fired, 1);

			SvgAnimator::unloadDocument(animator);
			g_logger_set_level(g_logger_level_None);
			KivgError noDocumentError = SvgAnimator::animateAlongPath(animator, "first", markerOnlyOptions(1.0f));
			g_logger_set_level(oldLevel);
			ASSERT_EQUAL(noDocumentError, KivgError::NoDocumentLoaded);

			SvgAnimator::free(animator);

			END_TEST;
		}

		// -------------------- Public functions --------------------
		void setupTestSuite()
		{
			Tests::TestSuite& testSuite = Tests::addTestSuite("SvgAnimator");

			ADD_TEST(testSuite, animatingWithoutDocumentFails);
			ADD_TEST(testSuite, loadingNewDocumentCancelsTheRun);

			ADD_TEST(testSuite, nonAnimatedDrawRendersImmediately);
			ADD_TEST(testSuite, documentIsMappedOntoTheSurface);
			ADD_TEST(testSuite, animatedDrawRevealsStrokeThenFill);
			ADD_TEST(testSuite, partialStrokeCoversLessThanTheFullOutline);
			ADD_TEST(testSuite, restartingDrawOnlyFiresTheNewCallback);
			ADD_TEST(testSuite, invalidDrawOptionsAreRejected);

			ADD_TEST(testSuite, shapeAnimationsRunOneAfterAnother);
			ADD_TEST(testSuite, leftGrowthRevealsHalfTheShapeHalfway);
			ADD_TEST(testSuite, unresolvedTargetsAreSkipped);
			ADD_TEST(testSuite, noResolvedTargetsCompletesImmediately);
			ADD_TEST(testSuite, emptySpecListOnlyCancels);
			ADD_TEST(testSuite, invalidSpecLeavesTheCurrentRunAlone);
			ADD_TEST(testSuite, pathCallbacksFireBeforeTheDocumentCallback);
			ADD_TEST(testSuite, callbackStartingNewRunSilencesTheOldRun);

			ADD_TEST(testSuite, boundSchedulerDrivesTheAnimation);
			ADD_TEST(testSuite, headlessSurfaceCountsFrames);
			ADD_TEST(testSuite, pathsCanBeSampledThroughTheAnimator);

			ADD_TEST(testSuite, markerFollowsThePathOnTheSurface);
			ADD_TEST(testSuite, trackingDrawsThePathAndTheOtherShapes);
			ADD_TEST(testSuite, rotatedMarkerFollowsTheDirectionOfTravel);
			ADD_TEST(testSuite, trackingCallbackFiresOnce);
			ADD_TEST(testSuite, repeatingTrackWrapsAndFiresOnce);
			ADD_TEST(testSuite, restartingCancelsTheTrackingRun);
			ADD_TEST(testSuite, invalidTrackingLeavesTheCurrentRunAlone);
		}

		// -------------------- Private functions --------------------
		static SvgAnimatorData* createWithSquares(RecordingSurface& surface)
		{
			return createWithDocument(surface, squaresSvg);
		}

		static SvgAnimatorData* createWithDocument(RecordingSurface& surface, const char* svg)
		{
			SvgAnimatorData* animator = SvgAnimator::create(&surface);

			g_logger_level oldLevel = g_logger_get_level();
			g_logger_set_level(g_logger_level_None);
			KivgError error = SvgAnimator::loadDocument(animator, svg, std::strlen(svg));
			g_logger_set_level(oldLevel);

			g_logger_assert(error == KivgError::None, "Failed to load the test document.");
			return animator;
		}

		static TrackOptions markerOnlyOptions(float duration)
		{
			TrackOptions options = {};
			options.duration = duration;
			options.showPath = false;
			options.keepOthers = false;
			return options;
		}

		static Vec2 submissionCenter(const RecordedMesh& mesh)
		{
			BBox bounds = submissionBounds(mesh);
			return (bounds.min + bounds.max) / 2.0f;
		}

		static DrawOptions animatedOptions()
		{
			DrawOptions options = {};
			options.animate = true;
			options.durationPerStep = 0.1f;
			options.fillDuration = 0.4f;
			options.lineWidth = 2.0f;
			return options;
		}

		static AnimationSpec makeSpec(const char* id, float duration, GrowthOrigin origin)
		{
			AnimationSpec spec = {};
			spec.id = id;
			spec.duration = duration;
			spec.growthOrigin = origin;
			return spec;
		}

		static void advanceFor(SvgAnimatorData* animator, float seconds, float step)
		{
			for (float time = 0.0f; time < seconds; time += step)
			{
				SvgAnimator::advance(animator, step);
			}
		}

		static BBox submissionBounds(const RecordedMesh& mesh)
		{
			BBox res = { Vec2{ FLT_MAX, FLT_MAX }, Vec2{ -FLT_MAX, -FLT_MAX } };
			for (uint32 index : mesh.indices)
			{
				res.min = CMath::min(res.min, mesh.vertices[index]);
				res.max = CMath::max(res.max, mesh.vertices[index]);
			}

			return res;
		}
	}
}

#endif
