#ifndef KIVG_ERRORS_H
#define KIVG_ERRORS_H
#include "core.h"

namespace Kivg
{
	enum class KivgError : uint8
	{
		None = 0,
		MalformedPath,
		UnresolvedAnimationTarget,
		UnparseableColor,
		InvalidDimension,
		MalformedDocument,
		NoDrawablePaths,
		InvalidConfiguration,
		NoDocumentLoaded,
		Length
	};

	constexpr auto errorNames = fixedSizeArray<const char*, (size_t)KivgError::Length>(
		"None",
		"MalformedPathError",
		"UnresolvedAnimationTargetError",
		"UnparseableColorError",
		"InvalidDimensionError",
		"MalformedDocumentError",
		"NoDrawablePathsError",
		"InvalidConfigurationError",
		"NoDocumentLoadedError"
	);

	inline const char* errorToString(KivgError error)
	{
		return error < KivgError::Length ? errorNames[(size_t)error] : "Unknown";
	}
}

// Print functions
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::KivgError& error);

#endif
