#ifndef KIVG_ANIMATION_MANAGER_H
#define KIVG_ANIMATION_MANAGER_H
#include "core.h"
#include "animation/Animation.h"

namespace Kivg
{
	enum class RunStatus : uint8
	{
		Idle = 0,
		Running,
		Completed,
		Cancelled,
		Length
	};

	constexpr auto runStatusNames = fixedSizeArray<const char*, (size_t)RunStatus::Length>(
		"Idle",
		"Running",
		"Completed",
		"Cancelled"
	);

	// A callback whose run finished during an update. It only fires if the run it
	// belongs to is still current when the callbacks are flushed.
	struct PendingCallback
	{
		uint64 runId;
		CompletionCallback callback;
	};

	struct AnimationManagerData;

	namespace AnimationManager
	{
		AnimationManagerData* create();
		void free(AnimationManagerData* am);

		/**
		 * @brief Starts a new run from the given states. Any run still in flight is cancelled
		 *        first and its callbacks will never fire.
		 * @param am Animation Manager
		 * @param states The states of the run, the manager takes them over
		 * @param onComplete Fires once after the last state completes, may be null
		 * @return The id of the new run
		*/
		uint64 beginRun(AnimationManagerData* am, std::vector<AnimationState>&& states, CompletionCallback onComplete);

		// Drops the active run. Pending callbacks of that run are discarded.
		void cancel(AnimationManagerData* am);

		/**
		 * @brief Advances every state of the active run by deltaTime. Callbacks of states
		 *        and of the run completing during this update are appended to `completed`
		 *        in the order they should fire.
		*/
		void advance(AnimationManagerData* am, float deltaTime, std::vector<PendingCallback>& completed);

		/**
		 * @brief Invokes the collected callbacks. A callback is skipped as soon as its run
		 *        is no longer the current one, which covers callbacks that start a new run.
		*/
		void fireCallbacks(AnimationManagerData* am, const std::vector<PendingCallback>& callbacks);

		RunStatus getRunStatus(const AnimationManagerData* am);
		bool isAnimating(const AnimationManagerData* am);
		uint64 getCurrentRunId(const AnimationManagerData* am);
		float getRunTime(const AnimationManagerData* am);

		const std::vector<AnimationState>& getStates(const AnimationManagerData* am);
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::RunStatus& status);

#endif
