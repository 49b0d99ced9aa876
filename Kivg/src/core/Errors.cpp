#include "core/Errors.h"

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::KivgError& error)
{
	ostream << Kivg::errorToString(error);
	return ostream;
}
