#ifndef KIVG_ANIMATION_TESTS_H
#define KIVG_ANIMATION_TESTS_H

namespace Kivg
{
	namespace AnimationTests
	{
		void setupTestSuite();
	}
}

#endif
