#include "animation/AnimationManager.h"

namespace Kivg
{
	struct AnimationManagerData
	{
		std::vector<AnimationState> states;
		CompletionCallback onComplete;
		uint64 runId;
		float runTime;
		RunStatus status;
	};

	namespace AnimationManager
	{
		AnimationManagerData* create()
		{
			void* animManagerMemory = g_memory_allocate(sizeof(AnimationManagerData));
			// Placement new so the vectors are constructed while still going through the memory tracker
			AnimationManagerData* res = new (animManagerMemory) AnimationManagerData();

			res->onComplete = nullptr;
			res->runId = 0;
			res->runTime = 0.0f;
			res->status = RunStatus::Idle;

			return res;
		}

		void free(AnimationManagerData* am)
		{
			if (am)
			{
				am->~AnimationManagerData();
				g_memory_free(am);
			}
		}

		uint64 beginRun(AnimationManagerData* am, std::vector<AnimationState>&& states, CompletionCallback onComplete)
		{
			g_logger_assert(am != nullptr, "Null animation manager.");

			if (am->status == RunStatus::Running)
			{
				cancel(am);
			}

			am->runId++;
			am->states = std::move(states);
			am->onComplete = onComplete;
			am->runTime = 0.0f;
			am->status = RunStatus::Running;

			return am->runId;
		}

		void cancel(AnimationManagerData* am)
		{
			g_logger_assert(am != nullptr, "Null animation manager.");

			if (am->status != RunStatus::Running)
			{
				return;
			}

			// Bumping the id invalidates callbacks that were collected but not flushed yet
			am->runId++;
			am->states.clear();
			am->onComplete = nullptr;
			am->status = RunStatus::Cancelled;
		}

		void advance(AnimationManagerData* am, float deltaTime, std::vector<PendingCallback>& completed)
		{
			g_logger_assert(am != nullptr, "Null animation manager.");

			if (am->status != RunStatus::Running)
			{
				return;
			}

			am->runTime += glm::max(deltaTime, 0.0f);

			bool allCompleted = true;
			for (AnimationState& state : am->states)
			{
				if (Animation::update(state, am->runTime) && state.onComplete && !state.callbackFired)
				{
					state.callbackFired = true;
					completed.push_back({ am->runId, state.onComplete });
				}

				allCompleted = allCompleted && state.status == AnimationStatus::Completed;
			}

			if (allCompleted)
			{
				am->status = RunStatus::Completed;
				if (am->onComplete)
				{
					completed.push_back({ am->runId, am->onComplete });
					am->onComplete = nullptr;
				}
			}
		}

		void fireCallbacks(AnimationManagerData* am, const std::vector<PendingCallback>& callbacks)
		{
			for (const PendingCallback& pending : callbacks)
			{
				if (pending.runId != am->runId)
				{
					continue;
				}

				pending.callback();
			}
		}

		RunStatus getRunStatus(const AnimationManagerData* am)
		{
			return am->status;
		}

		bool isAnimating(const AnimationManagerData* am)
		{
			return am->status == RunStatus::Running;
		}

		uint64 getCurrentRunId(const AnimationManagerData* am)
		{
			return am->runId;
		}

		float getRunTime(const AnimationManagerData* am)
		{
			return am->runTime;
		}

		const std::vector<AnimationState>& getStates(const AnimationManagerData* am)
		{
			return am->states;
		}
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::RunStatus& status)
{
	ostream << (status < Kivg::RunStatus::Length ? Kivg::runStatusNames[(size_t)status] : "Unknown");
	return ostream;
}
