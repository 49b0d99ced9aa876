#include "svg/Styles.h"

#include <cctype>

namespace Kivg
{
	namespace Css
	{
		static std::string toLowerCase(const char* str, size_t length);
		static std::string trim(const char* str, size_t length);

		CssColor colorFromString(const char* cssColorStr, size_t strLength, const Vec4& fallback)
		{
			if (strLength == 0)
			{
				strLength = std::strlen(cssColorStr);
			}

			std::string value = trim(cssColorStr, strLength);
			if (value.length() > 0 && value[0] == '#' && isHexColor(value.c_str(), value.length()))
			{
				return {
					toHex(value),
					CssStyleType::Value
				};
			}

			if (toLowerCase(value.c_str(), value.length()) == "none")
			{
				return {
					Vec4{ 0.0f, 0.0f, 0.0f, 0.0f },
					CssStyleType::None
				};
			}

			return {
				fallback,
				CssStyleType::Error
			};
		}

		std::optional<FillType> fillTypeFromString(const std::string& str)
		{
			std::string lowerCase = toLowerCase(str.c_str(), str.length());
			lowerCase = trim(lowerCase.c_str(), lowerCase.length());
			for (size_t i = 0; i < fillTypeNames.size(); i++)
			{
				if (lowerCase == fillTypeNames[i])
				{
					return (FillType)i;
				}
			}

			return std::nullopt;
		}

		std::optional<float> lengthFromString(const char* str)
		{
			if (str == nullptr)
			{
				return std::nullopt;
			}

			std::string value = trim(str, std::strlen(str));
			if (value.length() > 2 && value.compare(value.length() - 2, 2, "px") == 0)
			{
				value = value.substr(0, value.length() - 2);
			}

			if (value.empty())
			{
				return std::nullopt;
			}

			char* end = nullptr;
			float result = std::strtof(value.c_str(), &end);
			if (end != value.c_str() + value.length() || !std::isfinite(result))
			{
				return std::nullopt;
			}

			return result;
		}

		static std::string toLowerCase(const char* str, size_t length)
		{
			std::string lowerCaseString = std::string(str, length);
			for (size_t i = 0; i < lowerCaseString.length(); i++)
			{
				if ((uint8)lowerCaseString[i] >= (uint8)'A' && (uint8)lowerCaseString[i] <= (uint8)'Z')
				{
					lowerCaseString[i] = (char)(((uint8)lowerCaseString[i] - (uint8)'A') + (uint8)'a');
				}
			}

			return lowerCaseString;
		}

		static std::string trim(const char* str, size_t length)
		{
			size_t start = 0;
			size_t end = length;
			while (start < end && std::isspace((uint8)str[start]))
			{
				start++;
			}
			while (end > start && std::isspace((uint8)str[end - 1]))
			{
				end--;
			}

			return std::string(str + start, end - start);
		}
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::CssStyleType& style)
{
	switch (style)
	{
	case Kivg::CssStyleType::Error:
		ostream << "<CssStyleType:error>";
		break;
	case Kivg::CssStyleType::Value:
		ostream << "<CssStyleType:value>";
		break;
	case Kivg::CssStyleType::None:
		ostream << "<CssStyleType:none>";
		break;
	case Kivg::CssStyleType::Length:
		break;
	};

	return ostream;
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::CssColor& color)
{
	ostream << "CssColor{" << color.styleType << ", " << color.color << "}";
	return ostream;
}
