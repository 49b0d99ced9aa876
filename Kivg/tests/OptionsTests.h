#ifndef KIVG_OPTIONS_TESTS_H
#define KIVG_OPTIONS_TESTS_H

namespace Kivg
{
	namespace OptionsTests
	{
		void setupTestSuite();
	}
}

#endif
