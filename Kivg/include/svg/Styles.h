#ifndef KIVG_STYLES_H
#define KIVG_STYLES_H
#include "core.h"
#include "svg/Svg.h"

#include <cppUtils/cppPrint.hpp>
#include <cppUtils/cppUtils.hpp>

namespace Kivg
{
	enum class CssStyleType : uint8
	{
		Error = 0,
		Value,
		// The paint was the keyword "none"
		None,
		Length
	};

	constexpr auto cssStyleTypeNames = fixedSizeArray<const char*, (size_t)CssStyleType::Length>(
		"Error",
		"Value",
		"None"
	);

	struct CssColor
	{
		Vec4 color;
		CssStyleType styleType;
	};

	namespace Css
	{
		/**
		 * @brief Parses a paint attribute. Only hex colors are supported, anything else
		 *        (gradients, named colors, rgb() functions) is an error and carries the
		 *        fallback color.
		 * @param cssColorStr The attribute value
		 * @param strLength Length of the value, 0 means the string is null terminated
		 * @param fallback The color reported on error
		 * @return The parsed color and whether it was a value, "none" or an error
		*/
		CssColor colorFromString(const char* cssColorStr, size_t strLength, const Vec4& fallback);
		inline CssColor colorFromString(const std::string& cssColorStr, const Vec4& fallback) { return colorFromString(cssColorStr.c_str(), cssColorStr.length(), fallback); }

		std::optional<FillType> fillTypeFromString(const std::string& str);

		// Parses a plain number with an optional "px" unit. Other units are rejected.
		std::optional<float> lengthFromString(const char* str);
	}
}

// Print functions
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::CssStyleType& style);
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::CssColor& color);

#endif
