#include "renderer/LoggingSurface.h"
#include "math/CMath.h"

namespace Kivg
{
	LoggingSurface::LoggingSurface(const Vec2& position, const Vec2& size, bool logFrames)
		: position(position), size(size), logFrames(logFrames),
		frameCount(0), totalSubmissions(0), frameSubmissions(0), frameTriangles(0),
		frameBounds({ Vec2{ FLT_MAX, FLT_MAX }, Vec2{ -FLT_MAX, -FLT_MAX } })
	{
	}

	void LoggingSurface::beginFrame()
	{
		frameSubmissions = 0;
		frameTriangles = 0;
		frameBounds = { Vec2{ FLT_MAX, FLT_MAX }, Vec2{ -FLT_MAX, -FLT_MAX } };
	}

	void LoggingSurface::submitMesh(const std::vector<Vec2>& vertices, const std::vector<uint32>& indices, const Vec4& color)
	{
		frameSubmissions++;
		totalSubmissions++;
		frameTriangles += indices.size() / 3;
		for (const Vec2& vertex : vertices)
		{
			frameBounds.min = CMath::min(frameBounds.min, vertex);
			frameBounds.max = CMath::max(frameBounds.max, vertex);
		}

		if (logFrames)
		{
			g_logger_info("  mesh: {} vertices, {} triangles, color {}", vertices.size(), indices.size() / 3, toHexString(color));
		}
	}

	void LoggingSurface::endFrame()
	{
		frameCount++;
		if (logFrames)
		{
			if (frameSubmissions > 0)
			{
				g_logger_info("Frame {}: {} meshes, {} triangles, bounds {} -> {}", frameCount, frameSubmissions, frameTriangles, frameBounds.min, frameBounds.max);
			}
			else
			{
				g_logger_info("Frame {}: empty", frameCount);
			}
		}
	}

	FixedStepScheduler::FixedStepScheduler(float framesPerSecond)
		: frameTime(framesPerSecond > 0.0f ? 1.0f / framesPerSecond : 1.0f / 60.0f), callback(nullptr)
	{
	}

	void FixedStepScheduler::setFrameCallback(FrameCallback callback)
	{
		this->callback = callback;
	}

	bool FixedStepScheduler::step()
	{
		if (!callback)
		{
			return false;
		}

		// Copy so the callback may unregister itself
		FrameCallback current = callback;
		current(frameTime);
		return true;
	}
}
