#ifndef KIVG_SVG_ANIMATOR_H
#define KIVG_SVG_ANIMATOR_H
#include "core.h"
#include "core/Errors.h"
#include "core/Options.h"
#include "animation/Animation.h"
#include "animation/AnimationManager.h"

namespace Kivg
{
	class RenderSurface;
	class FrameScheduler;
	struct SvgDocument;
	struct PathModel;
	struct PathSample;

	struct SvgAnimatorData;

	namespace SvgAnimator
	{
		/**
		 * @brief Creates an animator drawing into the given surface.
		 * @param surface Not owned, must outlive the animator
		*/
		SvgAnimatorData* create(RenderSurface* surface);
		void free(SvgAnimatorData* animator);

		/**
		 * @brief Parses an SVG document and makes it the current one. The previous document
		 *        and any run on it are discarded, a failed load leaves no document loaded.
		*/
		KivgError loadDocument(SvgAnimatorData* animator, const char* svgText, size_t svgTextLength, const LoadOptions& options = LoadOptions{});
		KivgError loadDocumentFile(SvgAnimatorData* animator, const char* filepath, const LoadOptions& options = LoadOptions{});
		void unloadDocument(SvgAnimatorData* animator);
		const SvgDocument* getDocument(const SvgAnimatorData* animator);

		/**
		 * @brief Reveals the strokes, then the fills, of every path of the document. Starting
		 *        a draw cancels the run in flight. Without animation the document is drawn
		 *        right away and onComplete fires before this returns.
		 * @return NoDocumentLoaded, InvalidConfiguration, or KivgError::None
		*/
		KivgError draw(SvgAnimatorData* animator, const DrawOptions& options, CompletionCallback onComplete = nullptr);

		/**
		 * @brief Grows the fill of every targeted path, one after the other in list order.
		 *        Specs whose id is not in the document are skipped with a warning. If no spec
		 *        resolves, onComplete fires immediately. An empty list only cancels the
		 *        current run.
		 * @return NoDocumentLoaded, InvalidConfiguration, or KivgError::None
		*/
		KivgError shapeAnimate(SvgAnimatorData* animator, const std::vector<AnimationSpec>& specs, CompletionCallback onComplete = nullptr);

		/**
		 * @brief Moves a marker along the path, sampling its position with the configured easing
		 *        every frame. The marker is options.markerId centered on its bounding box, or a
		 *        square of options.markerSize. Starting the run cancels the run in flight.
		 *        onComplete fires once at the end of the first pass, a repeating run keeps going
		 *        until it is cancelled.
		 * @return NoDocumentLoaded, InvalidConfiguration, UnresolvedAnimationTarget when the
		 *         path or the marker is not in the document, or KivgError::None
		*/
		KivgError animateAlongPath(SvgAnimatorData* animator, const std::string& pathId, const TrackOptions& options, CompletionCallback onComplete = nullptr);

		// Updates every animation state, submits the frame, then fires completion callbacks
		void advance(SvgAnimatorData* animator, float deltaTime);
		void cancel(SvgAnimatorData* animator);

		RunStatus getRunStatus(const SvgAnimatorData* animator);
		bool isAnimating(const SvgAnimatorData* animator);
		const std::vector<AnimationState>& getAnimationStates(const SvgAnimatorData* animator);

		void bindScheduler(SvgAnimatorData* animator, FrameScheduler* scheduler);
		void unbindScheduler(SvgAnimatorData* animator);

		const PathModel* findPath(const SvgAnimatorData* animator, const std::string& id);
		// Position and direction of travel in surface space
		std::optional<PathSample> samplePath(const SvgAnimatorData* animator, const std::string& id, float fraction);

		// Maps a point from document space (y-down) to surface space (y-up)
		Vec2 toSurfaceSpace(const SvgAnimatorData* animator, const Vec2& documentPoint);
	}
}

#endif
