#ifndef KIVG_RENDER_SURFACE_H
#define KIVG_RENDER_SURFACE_H
#include "core.h"

namespace Kivg
{
	// Target the animator draws into. Vertices arrive in surface space (y-up),
	// three indices per triangle.
	class RenderSurface
	{
	public:
		virtual ~RenderSurface() = default;

		virtual Vec2 getPosition() const = 0;
		virtual Vec2 getSize() const = 0;

		virtual void beginFrame() = 0;
		virtual void submitMesh(const std::vector<Vec2>& vertices, const std::vector<uint32>& indices, const Vec4& color) = 0;
		virtual void endFrame() = 0;
	};

	typedef std::function<void(float deltaTime)> FrameCallback;

	// Host frame clock. Calls the registered callback once per frame with the
	// seconds elapsed since the previous frame.
	class FrameScheduler
	{
	public:
		virtual ~FrameScheduler() = default;

		// Replaces the registered callback, nullptr unregisters it
		virtual void setFrameCallback(FrameCallback callback) = 0;
	};
}

#endif
