#ifndef KIVG_LOGGING_SURFACE_H
#define KIVG_LOGGING_SURFACE_H
#include "core.h"
#include "renderer/RenderSurface.h"

namespace Kivg
{
	// Headless surface that keeps statistics about what was submitted and logs a
	// summary of every frame
	class LoggingSurface : public RenderSurface
	{
	public:
		LoggingSurface(const Vec2& position, const Vec2& size, bool logFrames);

		Vec2 getPosition() const override { return position; }
		Vec2 getSize() const override { return size; }

		void beginFrame() override;
		void submitMesh(const std::vector<Vec2>& vertices, const std::vector<uint32>& indices, const Vec4& color) override;
		void endFrame() override;

		inline uint32 getFrameCount() const { return frameCount; }
		inline size_t getTotalSubmissions() const { return totalSubmissions; }
		inline size_t getLastFrameSubmissions() const { return frameSubmissions; }
		inline size_t getLastFrameTriangles() const { return frameTriangles; }

	private:
		Vec2 position;
		Vec2 size;
		bool logFrames;

		uint32 frameCount;
		size_t totalSubmissions;
		size_t frameSubmissions;
		size_t frameTriangles;
		BBox frameBounds;
	};

	// Scheduler that ticks at a fixed rate whenever the host calls step
	class FixedStepScheduler : public FrameScheduler
	{
	public:
		explicit FixedStepScheduler(float framesPerSecond);

		void setFrameCallback(FrameCallback callback) override;

		// Runs one frame, returns false when no callback is registered
		bool step();

		inline float getFrameTime() const { return frameTime; }

	private:
		float frameTime;
		FrameCallback callback;
	};
}

#endif
