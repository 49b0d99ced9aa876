#include "core.h"

constexpr char u4ToHex(uint8 val)
{
	if (val < 10)
	{
		return (char)(val + '0');
	}

	return (char)((val - 10) + 'A');
}

static std::string u8ToHex(uint8 val)
{
	uint8 low = val & 0xF;
	uint8 high = (val >> 4) & 0xF;
	return std::string() + u4ToHex(high) + u4ToHex(low);
}

constexpr int hexToInt(char hexCode)
{
	if (hexCode >= '0' && hexCode <= '9')
	{
		return hexCode - '0';
	}

	if (hexCode >= 'A' && hexCode <= 'F')
	{
		return hexCode - 'A' + 10;
	}

	if (hexCode >= 'a' && hexCode <= 'f')
	{
		return hexCode - 'a' + 10;
	}

	return -1;
}

constexpr float hexToFloat(char hexCode)
{
	return (float)hexToInt(hexCode);
}

Kivg::Vec4 toHex(const std::string& str)
{
	return toHex(str.c_str(), str.length());
}

bool isHexColor(const char* str, size_t length)
{
	if (str == nullptr || length < 2 || str[0] != '#')
	{
		return false;
	}

	size_t numDigits = length - 1;
	if (numDigits != 3 && numDigits != 4 && numDigits != 6 && numDigits != 8)
	{
		return false;
	}

	for (size_t i = 1; i < length; i++)
	{
		if (hexToInt(str[i]) < 0)
		{
			return false;
		}
	}

	return true;
}

Kivg::Vec4 toHex(const char* rawHexColor, size_t length)
{
	g_logger_assert(rawHexColor != nullptr, "Invalid hex color. Cannot be null.");

	const char* hexColor = rawHexColor;
	if (length > 0 && rawHexColor[0] == '#')
	{
		hexColor++;
		length--;
	}

	g_logger_assert(length >= 3, "Invalid hex color '{}', hex color must have at least 3 digits.", rawHexColor);

	// Shorthand like #fc0 -> #ffcc00
	if (length == 3)
	{
		float color1 = (hexToFloat(hexColor[0]) * 16 + hexToFloat(hexColor[0])) / 255.0f;
		float color2 = (hexToFloat(hexColor[1]) * 16 + hexToFloat(hexColor[1])) / 255.0f;
		float color3 = (hexToFloat(hexColor[2]) * 16 + hexToFloat(hexColor[2])) / 255.0f;
		return Kivg::Vec4{
			color1, color2, color3, 1.0f
		};
	}

	// Shorthand like #fc2e -> #ffcc22ee
	if (length == 4)
	{
		float color1 = (hexToFloat(hexColor[0]) * 16 + hexToFloat(hexColor[0])) / 255.0f;
		float color2 = (hexToFloat(hexColor[1]) * 16 + hexToFloat(hexColor[1])) / 255.0f;
		float color3 = (hexToFloat(hexColor[2]) * 16 + hexToFloat(hexColor[2])) / 255.0f;
		float color4 = (hexToFloat(hexColor[3]) * 16 + hexToFloat(hexColor[3])) / 255.0f;
		return Kivg::Vec4{
			color1, color2, color3, color4
		};
	}

	g_logger_assert(length >= 6, "Invalid hex color '{}'.", rawHexColor);
	float color1 = (hexToFloat(hexColor[0]) * 16 + hexToFloat(hexColor[1])) / 255.0f;
	float color2 = (hexToFloat(hexColor[2]) * 16 + hexToFloat(hexColor[3])) / 255.0f;
	float color3 = (hexToFloat(hexColor[4]) * 16 + hexToFloat(hexColor[5])) / 255.0f;

	if (length == 8)
	{
		float color4 = (hexToFloat(hexColor[6]) * 16 + hexToFloat(hexColor[7])) / 255.0f;
		return Kivg::Vec4{
			color1, color2, color3, color4
		};
	}

	// Default alpha to 1
	return Kivg::Vec4{
		color1, color2, color3, 1.0f
	};
}

std::string toHexString(const Kivg::Vec4& color)
{
	std::string hexString = "#";
	uint8 r = (uint8)(glm::clamp(color.r, 0.0f, 1.0f) * 255.0f + 0.5f);
	uint8 g = (uint8)(glm::clamp(color.g, 0.0f, 1.0f) * 255.0f + 0.5f);
	uint8 b = (uint8)(glm::clamp(color.b, 0.0f, 1.0f) * 255.0f + 0.5f);
	uint8 a = (uint8)(glm::clamp(color.a, 0.0f, 1.0f) * 255.0f + 0.5f);

	hexString += u8ToHex(r);
	hexString += u8ToHex(g);
	hexString += u8ToHex(b);
	hexString += u8ToHex(a);

	return hexString;
}
