#include "core/SvgAnimator.h"
#include "animation/DrawingManager.h"
#include "renderer/RenderSurface.h"
#include "svg/Svg.h"
#include "svg/SvgParser.h"
#include "svg/Tessellator.h"

namespace Kivg
{
	enum class RunKind : uint8
	{
		None = 0,
		Draw,
		ShapeAnimate,
		Track
	};

	// Light gray outline drawn under a tracked marker
	static const Vec4 trackedPathColor = Vec4{ 0.7f, 0.7f, 0.7f, 0.5f };
	static const float trackedPathWidth = 1.0f;

	struct SvgAnimatorData
	{
		RenderSurface* surface;
		FrameScheduler* scheduler;
		AnimationManagerData* animations;

		SvgDocument document;
		bool hasDocument;

		RunKind runKind;
		DrawOptions drawOptions;

		TrackOptions trackOptions;
		// Centered on the origin in document units
		Mesh marker;
		Vec4 markerColor;
	};

	static void renderFrame(SvgAnimatorData* animator);
	static void submitStroke(SvgAnimatorData* animator, const PathModel& path, float progress, float lineWidth, const Vec4& color);
	static void submitFill(SvgAnimatorData* animator, const Mesh& mesh, const Vec4& color);
	static void submitTrack(SvgAnimatorData* animator, const AnimationState& state);
	static Mesh createMarker(const SvgDocument& document, const TrackOptions& options, Vec4& color);

	namespace SvgAnimator
	{
		SvgAnimatorData* create(RenderSurface* surface)
		{
			g_logger_assert(surface != nullptr, "Cannot create an SVG animator without a render surface.");

			void* animatorMemory = g_memory_allocate(sizeof(SvgAnimatorData));
			SvgAnimatorData* res = new (animatorMemory) SvgAnimatorData();

			res->surface = surface;
			res->scheduler = nullptr;
			res->animations = AnimationManager::create();
			res->hasDocument = false;
			res->runKind = RunKind::None;
			res->drawOptions = DrawOptions{};
			res->trackOptions = TrackOptions{};
			res->markerColor = Vec4{ 0.0f, 0.0f, 0.0f, 0.0f };

			return res;
		}

		void free(SvgAnimatorData* animator)
		{
			if (animator)
			{
				unbindScheduler(animator);
				AnimationManager::free(animator->animations);

				animator->~SvgAnimatorData();
				g_memory_free(animator);
			}
		}

		KivgError loadDocument(SvgAnimatorData* animator, const char* svgText, size_t svgTextLength, const LoadOptions& options)
		{
			g_logger_assert(animator != nullptr, "Null SVG animator.");

			unloadDocument(animator);

			SvgDocument document = {};
			KivgError error = SvgParser::parseSvgDoc(svgText, svgTextLength, options, document);
			if (error != KivgError::None)
			{
				return error;
			}

			animator->document = std::move(document);
			animator->hasDocument = true;
			g_logger_info("Loaded SVG document with {} paths ({} load errors).", animator->document.paths.size(), animator->document.errors.size());
			return KivgError::None;
		}

		KivgError loadDocumentFile(SvgAnimatorData* animator, const char* filepath, const LoadOptions& options)
		{
			g_logger_assert(animator != nullptr, "Null SVG animator.");

			unloadDocument(animator);

			SvgDocument document = {};
			KivgError error = SvgParser::parseSvgFile(filepath, options, document);
			if (error != KivgError::None)
			{
				return error;
			}

			animator->document = std::move(document);
			animator->hasDocument = true;
			g_logger_info("Loaded SVG file '{}' with {} paths ({} load errors).", filepath, animator->document.paths.size(), animator->document.errors.size());
			return KivgError::None;
		}

		void unloadDocument(SvgAnimatorData* animator)
		{
			// Animation states point into the document
			cancel(animator);
			animator->document = SvgDocument{};
			animator->hasDocument = false;
		}

		const SvgDocument* getDocument(const SvgAnimatorData* animator)
		{
			return animator->hasDocument ? &animator->document : nullptr;
		}

		KivgError draw(SvgAnimatorData* animator, const DrawOptions& options, CompletionCallback onComplete)
		{
			g_logger_assert(animator != nullptr, "Null SVG animator.");

			if (!animator->hasDocument)
			{
				g_logger_error("Cannot draw, no SVG document is loaded.");
				return KivgError::NoDocumentLoaded;
			}

			KivgError error = options.validate();
			if (error != KivgError::None)
			{
				return error;
			}

			std::vector<RevealPlanEntry> plan = DrawingManager::planReveal(animator->document, options);
			std::vector<AnimationState> states = DrawingManager::createRevealStates(plan, options);

			animator->drawOptions = options;
			animator->runKind = RunKind::Draw;
			AnimationManager::beginRun(animator->animations, std::move(states), onComplete);

			if (!options.animate)
			{
				// Every duration is zero so a single update completes the run
				advance(animator, 0.0f);
			}

			return KivgError::None;
		}

		KivgError shapeAnimate(SvgAnimatorData* animator, const std::vector<AnimationSpec>& specs, CompletionCallback onComplete)
		{
			g_logger_assert(animator != nullptr, "Null SVG animator.");

			if (!animator->hasDocument)
			{
				g_logger_error("Cannot animate shapes, no SVG document is loaded.");
				return KivgError::NoDocumentLoaded;
			}

			for (const AnimationSpec& spec : specs)
			{
				KivgError error = spec.validate();
				if (error != KivgError::None)
				{
					return error;
				}
			}

			cancel(animator);
			if (specs.empty())
			{
				return KivgError::None;
			}

			std::vector<AnimationState> states;
			float offset = 0.0f;
			for (const AnimationSpec& spec : specs)
			{
				std::optional<size_t> pathIndex = animator->document.findPath(spec.id);
				if (!pathIndex.has_value())
				{
					g_logger_warning("Skipping animation of '{}': {}. No path has this id.", spec.id, KivgError::UnresolvedAnimationTarget);
					continue;
				}

				// validate() already resolved the easing
				Easing easing = Animation::parseEasing(spec.easing).value();
				AnimationState state = Animation::createState(
					&animator->document.paths[*pathIndex],
					RevealPhase::Shape,
					easing,
					spec.growthOrigin,
					offset,
					spec.duration
				);
				state.onComplete = spec.onComplete;
				states.emplace_back(state);

				offset += spec.duration;
			}

			if (states.empty())
			{
				g_logger_warning("None of the {} animation specs matched a path in the document.", specs.size());
				if (onComplete)
				{
					onComplete();
				}
				return KivgError::None;
			}

			animator->runKind = RunKind::ShapeAnimate;
			AnimationManager::beginRun(animator->animations, std::move(states), onComplete);
			return KivgError::None;
		}

		KivgError animateAlongPath(SvgAnimatorData* animator, const std::string& pathId, const TrackOptions& options, CompletionCallback onComplete)
		{
			g_logger_assert(animator != nullptr, "Null SVG animator.");

			if (!animator->hasDocument)
			{
				g_logger_error("Cannot animate along '{}', no SVG document is loaded.", pathId);
				return KivgError::NoDocumentLoaded;
			}

			KivgError error = options.validate();
			if (error != KivgError::None)
			{
				return error;
			}

			std::optional<size_t> pathIndex = animator->document.findPath(pathId);
			if (!pathIndex.has_value())
			{
				g_logger_error("Cannot animate along '{}': {}. No path has this id.", pathId, KivgError::UnresolvedAnimationTarget);
				return KivgError::UnresolvedAnimationTarget;
			}

			if (!options.markerId.empty() && !animator->document.findPath(options.markerId).has_value())
			{
				g_logger_error("Cannot use '{}' as the marker: {}. No path has this id.", options.markerId, KivgError::UnresolvedAnimationTarget);
				return KivgError::UnresolvedAnimationTarget;
			}

			cancel(animator);

			// validate() already resolved the easing
			Easing easing = Animation::parseEasing(options.easing).value();
			AnimationState state = Animation::createState(
				&animator->document.paths[*pathIndex],
				RevealPhase::Track,
				easing,
				GrowthOrigin::None,
				0.0f,
				options.duration
			);
			state.repeat = options.repeat;
			state.onComplete = onComplete;

			animator->trackOptions = options;
			animator->marker = createMarker(animator->document, options, animator->markerColor);
			animator->runKind = RunKind::Track;
			AnimationManager::beginRun(animator->animations, { state }, nullptr);
			return KivgError::None;
		}

		void advance(SvgAnimatorData* animator, float deltaTime)
		{
			g_logger_assert(animator != nullptr, "Null SVG animator.");

			if (!AnimationManager::isAnimating(animator->animations))
			{
				return;
			}

			std::vector<PendingCallback> completed;
			AnimationManager::advance(animator->animations, deltaTime, completed);
			renderFrame(animator);
			AnimationManager::fireCallbacks(animator->animations, completed);
		}

		void cancel(SvgAnimatorData* animator)
		{
			AnimationManager::cancel(animator->animations);
			for (PathModel& path : animator->document.paths)
			{
				path.visibleMesh.clear();
			}
		}

		RunStatus getRunStatus(const SvgAnimatorData* animator)
		{
			return AnimationManager::getRunStatus(animator->animations);
		}

		bool isAnimating(const SvgAnimatorData* animator)
		{
			return AnimationManager::isAnimating(animator->animations);
		}

		const std::vector<AnimationState>& getAnimationStates(const SvgAnimatorData* animator)
		{
			return AnimationManager::getStates(animator->animations);
		}

		void bindScheduler(SvgAnimatorData* animator, FrameScheduler* scheduler)
		{
			unbindScheduler(animator);
			if (scheduler == nullptr)
			{
				return;
			}

			animator->scheduler = scheduler;
			scheduler->setFrameCallback([animator](float deltaTime) {
				advance(animator, deltaTime);
			});
		}

		void unbindScheduler(SvgAnimatorData* animator)
		{
			if (animator->scheduler)
			{
				animator->scheduler->setFrameCallback(nullptr);
				animator->scheduler = nullptr;
			}
		}

		const PathModel* findPath(const SvgAnimatorData* animator, const std::string& id)
		{
			if (!animator->hasDocument)
			{
				return nullptr;
			}

			std::optional<size_t> index = animator->document.findPath(id);
			return index.has_value() ? &animator->document.paths[*index] : nullptr;
		}

		std::optional<PathSample> samplePath(const SvgAnimatorData* animator, const std::string& id, float fraction)
		{
			const PathModel* path = findPath(animator, id);
			if (path == nullptr)
			{
				return std::nullopt;
			}

			std::optional<PathSample> sample = Svg::samplePath(*path, fraction);
			if (!sample.has_value())
			{
				return std::nullopt;
			}

			// The y flip mirrors the direction of travel as well
			float angle = CMath::toRadians(sample->angleDegrees);
			Vec2 position = toSurfaceSpace(animator, sample->position);
			Vec2 direction = toSurfaceSpace(animator, sample->position + Vec2{ glm::cos(angle), glm::sin(angle) }) - position;
			return PathSample{ position, CMath::toDegrees(glm::atan(direction.y, direction.x)) };
		}

		Vec2 toSurfaceSpace(const SvgAnimatorData* animator, const Vec2& documentPoint)
		{
			const Vec4& viewbox = animator->document.viewbox;
			Vec2 position = animator->surface->getPosition();
			Vec2 size = animator->surface->getSize();
			if (viewbox.z <= 0.0f || viewbox.w <= 0.0f)
			{
				return position + documentPoint;
			}

			return Vec2{
				position.x + size.x * (documentPoint.x - viewbox.x) / viewbox.z,
				position.y + size.y * (viewbox.y + viewbox.w - documentPoint.y) / viewbox.w
			};
		}
	}

	// ------------- Internal Functions -------------
	static void renderFrame(SvgAnimatorData* animator)
	{
		animator->surface->beginFrame();

		for (const AnimationState& state : AnimationManager::getStates(animator->animations))
		{
			if (state.status == AnimationStatus::Pending)
			{
				continue;
			}

			PathModel& path = *state.path;
			switch (state.phase)
			{
			case RevealPhase::Stroke:
				submitStroke(animator, path, state.progress, animator->drawOptions.lineWidth, animator->drawOptions.lineColor);
				break;
			case RevealPhase::Fill:
			{
				Vec4 color = path.fillColor;
				color.a *= glm::clamp(state.progress, 0.0f, 1.0f);
				submitFill(animator, path.fillMesh, color);
			}
			break;
			case RevealPhase::Shape:
			{
				Animation::applyGrowthMask(path.fillMesh, path.bbox, state.growthOrigin, state.progress, path.visibleMesh);
				Vec4 color = path.fillColor;
				color.a *= Animation::growthAlpha(state.growthOrigin, state.progress);
				submitFill(animator, path.visibleMesh, color);
			}
			break;
			case RevealPhase::Track:
				submitTrack(animator, state);
				break;
			case RevealPhase::Length:
				break;
			}
		}

		animator->surface->endFrame();
	}

	static void submitStroke(SvgAnimatorData* animator, const PathModel& path, float progress, float lineWidth, const Vec4& color)
	{
		std::vector<std::vector<Vec2>> outlines;
		outlines.reserve(path.outlines.size());
		float totalLength = 0.0f;
		for (const Polyline& outline : path.outlines)
		{
			std::vector<Vec2> mapped;
			mapped.reserve(outline.points.size());
			for (const Vec2& point : outline.points)
			{
				mapped.emplace_back(SvgAnimator::toSurfaceSpace(animator, point));
			}
			totalLength += Tessellator::polylineLength(mapped, outline.isClosed);
			outlines.emplace_back(mapped);
		}

		// Subpaths are traced one after the other along the path's total length
		float remaining = glm::clamp(progress, 0.0f, 1.0f) * totalLength;
		bool complete = progress >= 1.0f;
		Mesh stroke = {};
		for (size_t i = 0; i < outlines.size(); i++)
		{
			bool closed = path.outlines[i].isClosed;
			float length = Tessellator::polylineLength(outlines[i], closed);

			Mesh part;
			if (complete || remaining >= length)
			{
				part = Tessellator::strokePolyline(outlines[i], lineWidth, closed);
				remaining -= length;
			}
			else
			{
				float fraction = length > 0.0f ? remaining / length : 0.0f;
				std::vector<Vec2> visible = Tessellator::truncatePolyline(outlines[i], closed, fraction);
				part = Tessellator::strokePolyline(visible, lineWidth, false);
				remaining = 0.0f;
			}

			uint32 firstVertex = (uint32)stroke.vertices.size();
			stroke.vertices.insert(stroke.vertices.end(), part.vertices.begin(), part.vertices.end());
			for (uint32 index : part.indices)
			{
				stroke.indices.push_back(firstVertex + index);
			}

			if (!complete && remaining <= 0.0f)
			{
				break;
			}
		}

		if (!stroke.empty())
		{
			animator->surface->submitMesh(stroke.vertices, stroke.indices, color);
		}
	}

	static void submitFill(SvgAnimatorData* animator, const Mesh& mesh, const Vec4& color)
	{
		if (mesh.empty() || color.a <= 0.0f)
		{
			return;
		}

		std::vector<Vec2> vertices;
		vertices.reserve(mesh.vertices.size());
		for (const Vec2& vertex : mesh.vertices)
		{
			vertices.emplace_back(SvgAnimator::toSurfaceSpace(animator, vertex));
		}

		animator->surface->submitMesh(vertices, mesh.indices, color);
	}

	static void submitTrack(SvgAnimatorData* animator, const AnimationState& state)
	{
		const TrackOptions& options = animator->trackOptions;
		if (options.keepOthers)
		{
			for (const PathModel& path : animator->document.paths)
			{
				if (&path == state.path || (!options.markerId.empty() && path.id == options.markerId))
				{
					continue;
				}

				submitFill(animator, path.fillMesh, path.fillColor);
			}
		}

		if (options.showPath)
		{
			submitStroke(animator, *state.path, 1.0f, trackedPathWidth, trackedPathColor);
		}

		std::optional<PathSample> sample = Svg::samplePath(*state.path, state.progress);
		if (!sample.has_value())
		{
			return;
		}

		// Rotating in document space before the mapping keeps the marker aligned with the path on the surface
		float angle = options.rotate ? CMath::toRadians(sample->angleDegrees) : 0.0f;
		float cosAngle = glm::cos(angle);
		float sinAngle = glm::sin(angle);

		Mesh placed = {};
		placed.indices = animator->marker.indices;
		placed.vertices.reserve(animator->marker.vertices.size());
		for (const Vec2& vertex : animator->marker.vertices)
		{
			Vec2 rotated = Vec2{ vertex.x * cosAngle - vertex.y * sinAngle, vertex.x * sinAngle + vertex.y * cosAngle };
			placed.vertices.emplace_back(sample->position + rotated);
		}

		submitFill(animator, placed, animator->markerColor);
	}

	static Mesh createMarker(const SvgDocument& document, const TrackOptions& options, Vec4& color)
	{
		Mesh res = {};
		std::optional<size_t> markerIndex = std::nullopt;
		if (!options.markerId.empty())
		{
			markerIndex = document.findPath(options.markerId);
		}

		if (markerIndex.has_value())
		{
			const PathModel& markerPath = document.paths[*markerIndex];
			Vec2 center = (markerPath.bbox.min + markerPath.bbox.max) / 2.0f;
			for (const Vec2& vertex : markerPath.fillMesh.vertices)
			{
				res.vertices.emplace_back(vertex - center);
			}
			res.indices = markerPath.fillMesh.indices;
			color = markerPath.fillColor;
			return res;
		}

		float halfSize = options.markerSize / 2.0f;
		res.vertices = {
			Vec2{ -halfSize, -halfSize },
			Vec2{ halfSize, -halfSize },
			Vec2{ halfSize, halfSize },
			Vec2{ -halfSize, halfSize }
		};
		res.indices = { 0, 1, 2, 0, 2, 3 };
		color = options.markerColor;
		return res;
	}
}
