#ifndef KIVG_SVG_PARSER_TESTS_H
#define KIVG_SVG_PARSER_TESTS_H

namespace Kivg
{
	namespace SvgParserTests
	{
		void setupTestSuite();
	}
}

#endif
