#include "svg/SvgParser.h"
#include "svg/Svg.h"
#include "svg/Styles.h"
#include "svg/Tessellator.h"

#include <tinyxml2.h>

using namespace tinyxml2;

#define PANIC(parserInfo, formatStr, ...) \
	snprintf((parserInfo).errorBuffer, errorBufferSize, formatStr, __VA_ARGS__); \
	g_logger_error("{}", (parserInfo).errorBuffer);
#define PANIC_NOFMT(parserInfo, str) \
	snprintf((parserInfo).errorBuffer, errorBufferSize, "%s", str); \
	g_logger_error("{}", (parserInfo).errorBuffer);

namespace Kivg
{
	static constexpr size_t errorBufferSize = 512;

	struct ParserInfo
	{
		const char* text;
		size_t textLength;
		size_t cursor;
		char errorBuffer[errorBufferSize];
	};

	enum class PathTokenType : uint8
	{
		Panic = 0,
		MoveTo,
		ClosePath,
		LineTo,
		HzLineTo,
		VtLineTo,
		CurveTo,
		SmoothCurveTo,
		QuadCurveTo,
		SmoothQuadCurveTo,
		ArcTo,
		Number,
		EndOfFile,
		Length
	};

	struct PathToken
	{
		PathTokenType type;
		bool isAbsolute;
		union
		{
			float number;
		} as;
	};

	struct ArcParams
	{
		Vec2 radius;
		float xAxisRotation;
		bool largeArcFlag;
		bool sweepFlag;
		Vec2 endpoint;
	};

	namespace SvgParser
	{
		// ----------- Internal Functions -----------
		static KivgError parseXmlDocument(XMLDocument& doc, const char* documentName, const LoadOptions& options, SvgDocument& output);
		static void collectPathElements(const XMLElement* element, std::vector<const XMLElement*>& paths);
		static void parseDimensions(const XMLElement* svgElement, SvgDocument& output);
		static void applyPaintAttributes(const XMLElement* element, int pathIndex, PathModel& path, SvgDocument& output);
		static void applyPaintAttribute(const std::string& name, const std::string& value, int pathIndex, PathModel& path, SvgDocument& output);
		static void recordError(SvgDocument& output, int pathIndex, const std::string& id, KivgError error, const std::string& message);
		static void initParserInfo(ParserInfo& parserInfo, const char* text, size_t textLength);

		// -------- Path Parser --------
		static bool interpretCommand(const PathToken& token, ParserInfo& parserInfo, PathBuilder* res);
		static bool parseVec2List(std::vector<Vec2>& list, ParserInfo& parserInfo);
		static bool parseNumberList(std::vector<float>& list, ParserInfo& parserInfo);
		static bool parseArcParamsList(std::vector<ArcParams>& list, ParserInfo& parserInfo);
		static bool parseFlag(ParserInfo& parserInfo, bool* out);
		static bool parseViewbox(Vec4* out, const char* viewboxStr);
		static PathToken parseNextPathToken(ParserInfo& parserInfo);
		static PathToken consume(PathTokenType expected, ParserInfo& parserInfo);
		static const char* commandName(PathTokenType type);

		// -------- Generic Parser Stuff --------
		static bool parseNumber(ParserInfo& parserInfo, float* out);
		static void skipWhitespaceAndCommas(ParserInfo& parserInfo);

		// -------- Helpers --------
		static inline char advance(ParserInfo& parserInfo) { char c = parserInfo.cursor < parserInfo.textLength ? parserInfo.text[parserInfo.cursor] : '\0'; parserInfo.cursor++; return c; }
		static inline char peek(const ParserInfo& parserInfo, size_t advance = 0) { return parserInfo.cursor + advance >= parserInfo.textLength ? '\0' : parserInfo.text[parserInfo.cursor + advance]; }
		static inline bool isDigit(char c) { return (c >= '0' && c <= '9'); }
		static inline bool isNumberPart(char c) { return isDigit(c) || c == '-' || c == '+' || c == '.'; }
		static inline bool isAlpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
		static inline bool isWhitespace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }

		KivgError parseSvgPath(const char* pathText, size_t pathTextLength, std::vector<SubPath>& output, const ParseOptions& options, std::string* errorMessage)
		{
			ParserInfo parserInfo;
			initParserInfo(parserInfo, pathText, pathText == nullptr ? 0 : pathTextLength);

			KivgError optionsError = options.validate();
			if (optionsError != KivgError::None)
			{
				if (errorMessage)
				{
					*errorMessage = "Invalid parse options.";
				}
				return optionsError;
			}

			skipWhitespaceAndCommas(parserInfo);
			if (parserInfo.cursor >= parserInfo.textLength)
			{
				PANIC_NOFMT(parserInfo, "Cannot parse an SVG path that has no text.");
				if (errorMessage)
				{
					*errorMessage = parserInfo.errorBuffer;
				}
				return KivgError::MalformedPath;
			}

			PathBuilder builder = Svg::createBuilder();
			PathToken token = parseNextPathToken(parserInfo);
			bool panic = token.type == PathTokenType::Panic;
			if (!panic && token.type != PathTokenType::MoveTo)
			{
				PANIC(parserInfo, "SVG path must begin with a move to command. Instead it begins with '%s'.", commandName(token.type));
				panic = true;
			}

			while (!panic && token.type != PathTokenType::EndOfFile)
			{
				// panic if we fail to interpret a command
				panic = !interpretCommand(token, parserInfo, &builder);
				if (!panic)
				{
					token = parseNextPathToken(parserInfo);
					panic = token.type == PathTokenType::Panic;
				}
			}

			if (panic)
			{
				if (errorMessage)
				{
					*errorMessage = parserInfo.errorBuffer;
				}
				return KivgError::MalformedPath;
			}

			if (options.expandArcs)
			{
				Svg::expandArcs(builder.subpaths, options.arcTolerance);
			}

			output = std::move(builder.subpaths);
			return KivgError::None;
		}

		KivgError parseSvgDoc(const char* text, size_t textLength, const LoadOptions& options, SvgDocument& output)
		{
			XMLDocument doc;
			if (text == nullptr || doc.Parse(text, textLength) != XML_SUCCESS)
			{
				g_logger_error("Failed to parse XML in SVG document: {}", doc.ErrorStr() ? doc.ErrorStr() : "no text");
				return KivgError::MalformedDocument;
			}

			return parseXmlDocument(doc, "<memory>", options, output);
		}

		KivgError parseSvgFile(const char* filepath, const LoadOptions& options, SvgDocument& output)
		{
			XMLDocument doc;
			if (doc.LoadFile(filepath) != XML_SUCCESS)
			{
				g_logger_error("Failed to parse XML in SVG file '{}'.", filepath);
				return KivgError::MalformedDocument;
			}

			return parseXmlDocument(doc, filepath, options, output);
		}

		// ----------- Internal Functions -----------
		static KivgError parseXmlDocument(XMLDocument& doc, const char* documentName, const LoadOptions& options, SvgDocument& output)
		{
			KivgError optionsError = options.validate();
			if (optionsError != KivgError::None)
			{
				return optionsError;
			}

			const XMLElement* svgElement = doc.FirstChildElement("svg");
			if (!svgElement)
			{
				g_logger_error("No <svg> element found in document '{}'.", documentName);
				return KivgError::MalformedDocument;
			}

			SvgDocument res = {};
			parseDimensions(svgElement, res);

			std::vector<const XMLElement*> pathElements;
			collectPathElements(svgElement, pathElements);

			for (size_t i = 0; i < pathElements.size(); i++)
			{
				const XMLElement* element = pathElements[i];
				int pathIndex = (int)i;

				PathModel path = Svg::createDefaultPath();
				const char* idAttribute = element->Attribute("id");
				path.id = idAttribute != nullptr && idAttribute[0] != '\0'
					? std::string(idAttribute)
					: "path_" + std::to_string(i);

				if (res.findPath(path.id).has_value())
				{
					std::string newId = "path_" + std::to_string(i);
					g_logger_warning("Duplicate path id '{}' in document '{}'. Renaming path {} to '{}'.", path.id, documentName, i, newId);
					path.id = newId;
				}

				const char* pathData = element->Attribute("d");
				std::string errorMessage = "";
				KivgError pathError = pathData == nullptr
					? KivgError::MalformedPath
					: parseSvgPath(pathData, std::strlen(pathData), path.subpaths, options.parse, &errorMessage);
				if (pathData == nullptr)
				{
					errorMessage = "Path element has no d attribute.";
					g_logger_error("Path '{}' in document '{}' has no d attribute.", path.id, documentName);
				}

				if (pathError != KivgError::None)
				{
					recordError(res, pathIndex, path.id, pathError, errorMessage);
					if (options.malformedPathPolicy == MalformedPathPolicy::Abort)
					{
						g_logger_error("Aborting load of '{}', path '{}' is malformed.", documentName, path.id);
						output.errors = res.errors;
						return pathError;
					}

					g_logger_warning("Skipping malformed path '{}' in document '{}'.", path.id, documentName);
					continue;
				}

				applyPaintAttributes(element, pathIndex, path, res);
				Tessellator::tessellatePath(path, options.resolution, options.parse.arcTolerance);
				res.paths.emplace_back(std::move(path));
			}

			if (res.paths.empty())
			{
				g_logger_error("Document '{}' has no drawable paths. {} path elements failed to load.", documentName, pathElements.size());
				output.errors = res.errors;
				return KivgError::NoDrawablePaths;
			}

			output = std::move(res);
			return KivgError::None;
		}

		static void collectPathElements(const XMLElement* element, std::vector<const XMLElement*>& paths)
		{
			for (const XMLElement* child = element->FirstChildElement(); child != nullptr; child = child->NextSiblingElement())
			{
				if (std::strcmp(child->Name(), "path") == 0)
				{
					paths.emplace_back(child);
				}

				collectPathElements(child, paths);
			}
		}

		static void parseDimensions(const XMLElement* svgElement, SvgDocument& output)
		{
			bool hasViewbox = false;
			Vec4 viewbox = Vec4{ 0, 0, 0, 0 };
			const char* viewboxStr = svgElement->Attribute("viewBox");
			if (viewboxStr != nullptr)
			{
				hasViewbox = parseViewbox(&viewbox, viewboxStr) && viewbox.z > 0.0f && viewbox.w > 0.0f;
				if (!hasViewbox)
				{
					g_logger_warning("Invalid viewBox '{}'. Falling back to the document size.", viewboxStr);
					recordError(output, -1, "", KivgError::InvalidDimension, std::string("Invalid viewBox '") + viewboxStr + "'.");
				}
			}

			const char* widthStr = svgElement->Attribute("width");
			const char* heightStr = svgElement->Attribute("height");
			std::optional<float> width = Css::lengthFromString(widthStr);
			std::optional<float> height = Css::lengthFromString(heightStr);
			bool hasSize = width.has_value() && height.has_value() && *width > 0.0f && *height > 0.0f;
			if ((widthStr != nullptr || heightStr != nullptr) && !hasSize)
			{
				g_logger_warning("Invalid SVG dimensions width='{}' height='{}'.", widthStr ? widthStr : "", heightStr ? heightStr : "");
				recordError(output, -1, "", KivgError::InvalidDimension,
					std::string("Invalid dimensions width='") + (widthStr ? widthStr : "") + "' height='" + (heightStr ? heightStr : "") + "'.");
			}

			if (hasSize)
			{
				output.size = Vec2{ *width, *height };
			}
			else if (hasViewbox)
			{
				output.size = Vec2{ viewbox.z, viewbox.w };
			}
			else
			{
				if (viewboxStr == nullptr && widthStr == nullptr && heightStr == nullptr)
				{
					recordError(output, -1, "", KivgError::InvalidDimension, "Document has no width, height or viewBox.");
				}
				g_logger_warning("SVG has no usable dimensions. Falling back to a {}x{} canvas.", defaultCanvasSize, defaultCanvasSize);
				output.size = Vec2{ defaultCanvasSize, defaultCanvasSize };
			}

			output.viewbox = hasViewbox
				? viewbox
				: Vec4{ 0.0f, 0.0f, output.size.x, output.size.y };
		}

		static void applyPaintAttributes(const XMLElement* element, int pathIndex, PathModel& path, SvgDocument& output)
		{
			static const char* paintAttributes[] = { "fill", "fill-rule", "stroke", "stroke-width" };
			for (const char* attributeName : paintAttributes)
			{
				const char* value = element->Attribute(attributeName);
				if (value != nullptr)
				{
					applyPaintAttribute(attributeName, value, pathIndex, path, output);
				}
			}

			// Inline style declarations override presentation attributes
			const char* style = element->Attribute("style");
			if (style == nullptr)
			{
				return;
			}

			std::string styleStr = style;
			size_t declarationStart = 0;
			while (declarationStart < styleStr.length())
			{
				size_t declarationEnd = styleStr.find(';', declarationStart);
				if (declarationEnd == std::string::npos)
				{
					declarationEnd = styleStr.length();
				}

				std::string declaration = styleStr.substr(declarationStart, declarationEnd - declarationStart);
				size_t colon = declaration.find(':');
				if (colon != std::string::npos)
				{
					std::string name = declaration.substr(0, colon);
					std::string value = declaration.substr(colon + 1);
					name.erase(0, name.find_first_not_of(" \t\n\r"));
					name.erase(name.find_last_not_of(" \t\n\r") + 1);
					applyPaintAttribute(name, value, pathIndex, path, output);
				}

				declarationStart = declarationEnd + 1;
			}
		}

		static void applyPaintAttribute(const std::string& name, const std::string& value, int pathIndex, PathModel& path, SvgDocument& output)
		{
			if (name == "fill")
			{
				constexpr Vec4 defaultFill = Vec4{ 1.0f, 1.0f, 1.0f, 1.0f };
				CssColor color = Css::colorFromString(value, defaultFill);
				if (color.styleType == CssStyleType::Error)
				{
					g_logger_warning("Unsupported fill '{}' on path '{}'. Using opaque white.", value, path.id);
					recordError(output, pathIndex, path.id, KivgError::UnparseableColor, "Unsupported fill '" + value + "'.");
				}
				path.fillColor = color.color;
			}
			else if (name == "fill-rule")
			{
				std::optional<FillType> fillType = Css::fillTypeFromString(value);
				if (!fillType.has_value())
				{
					g_logger_warning("Unknown fill-rule '{}' on path '{}'. Using nonzero.", value, path.id);
				}
				path.fillType = fillType.value_or(FillType::NonZeroFillType);
			}
			else if (name == "stroke")
			{
				CssColor color = Css::colorFromString(value, path.strokeColor);
				if (color.styleType == CssStyleType::Error)
				{
					g_logger_warning("Unsupported stroke '{}' on path '{}'.", value, path.id);
					recordError(output, pathIndex, path.id, KivgError::UnparseableColor, "Unsupported stroke '" + value + "'.");
				}
				path.hasStroke = color.styleType == CssStyleType::Value;
				path.strokeColor = color.styleType == CssStyleType::Value ? color.color : path.strokeColor;
			}
			else if (name == "stroke-width")
			{
				std::optional<float> strokeWidth = Css::lengthFromString(value.c_str());
				if (!strokeWidth.has_value() || *strokeWidth <= 0.0f)
				{
					g_logger_warning("Invalid stroke-width '{}' on path '{}'.", value, path.id);
					recordError(output, pathIndex, path.id, KivgError::InvalidDimension, "Invalid stroke-width '" + value + "'.");
					return;
				}
				path.strokeWidth = *strokeWidth;
			}
		}

		static void recordError(SvgDocument& output, int pathIndex, const std::string& id, KivgError error, const std::string& message)
		{
			PathLoadError loadError = {};
			loadError.pathIndex = pathIndex;
			loadError.id = id;
			loadError.error = error;
			loadError.message = message;
			output.errors.emplace_back(loadError);
		}

		static void initParserInfo(ParserInfo& parserInfo, const char* text, size_t textLength)
		{
			parserInfo.text = text;
			parserInfo.textLength = textLength;
			parserInfo.cursor = 0;
			parserInfo.errorBuffer[0] = '\0';
		}

		// -------- Path Parser --------
		static bool interpretCommand(const PathToken& token, ParserInfo& parserInfo, PathBuilder* res)
		{
			PathTokenType commandType = token.type;
			bool isAbsolute = token.isAbsolute;

			// Parse as many {x, y} pairs as possible
			switch (commandType)
			{
			case PathTokenType::MoveTo:
			{
				std::vector<Vec2> vec2List;
				if (!parseVec2List(vec2List, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting move to command. Invalid coordinate encountered.");
					return false;
				}

				// A leading relative move to is relative to the origin
				Svg::moveTo(res, vec2List[0], isAbsolute || !Svg::hasCurrentPoint(res));
				// Extra coordinate pairs are implicit line to commands
				for (size_t i = 1; i < vec2List.size(); i++)
				{
					Svg::lineTo(res, vec2List[i], isAbsolute);
				}
			}
			break;
			case PathTokenType::ClosePath:
				Svg::closePath(res);
				break;
			case PathTokenType::LineTo:
			{
				std::vector<Vec2> vec2List;
				if (!parseVec2List(vec2List, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting line to command. Invalid coordinate encountered.");
					return false;
				}

				for (size_t i = 0; i < vec2List.size(); i++)
				{
					Svg::lineTo(res, vec2List[i], isAbsolute);
				}
			}
			break;
			case PathTokenType::HzLineTo:
			{
				std::vector<float> numberList;
				if (!parseNumberList(numberList, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting horizontal line to command. Invalid coordinate encountered.");
					return false;
				}

				for (size_t i = 0; i < numberList.size(); i++)
				{
					Svg::hzLineTo(res, numberList[i], isAbsolute);
				}
			}
			break;
			case PathTokenType::VtLineTo:
			{
				std::vector<float> numberList;
				if (!parseNumberList(numberList, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting vertical line to command. Invalid coordinate encountered.");
					return false;
				}

				for (size_t i = 0; i < numberList.size(); i++)
				{
					Svg::vtLineTo(res, numberList[i], isAbsolute);
				}
			}
			break;
			case PathTokenType::CurveTo:
			{
				std::vector<Vec2> vec2List;
				if (!parseVec2List(vec2List, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting curve to command. Invalid coordinate encountered.");
					return false;
				}

				if (vec2List.size() % 3 != 0)
				{
					PANIC_NOFMT(parserInfo, "Cubic polybezier curve must have a multiple of 3 coordinates, otherwise it's not a valid polybezier curve.");
					return false;
				}

				for (size_t i = 0; i < vec2List.size(); i += 3)
				{
					Svg::bezier3To(res, vec2List[i + 0], vec2List[i + 1], vec2List[i + 2], isAbsolute);
				}
			}
			break;
			case PathTokenType::SmoothCurveTo:
			{
				std::vector<Vec2> vec2List;
				if (!parseVec2List(vec2List, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting smooth curve to command. Invalid coordinate encountered.");
					return false;
				}

				if (vec2List.size() % 2 != 0)
				{
					PANIC_NOFMT(parserInfo, "Smooth cubic polybezier curve must have a multiple of 2 coordinates, otherwise it's not a valid polybezier curve.");
					return false;
				}

				for (size_t i = 0; i < vec2List.size(); i += 2)
				{
					Svg::smoothBezier3To(res, vec2List[i + 0], vec2List[i + 1], isAbsolute);
				}
			}
			break;
			case PathTokenType::QuadCurveTo:
			{
				std::vector<Vec2> vec2List;
				if (!parseVec2List(vec2List, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting quadratic curve to command. Invalid coordinate encountered.");
					return false;
				}

				if (vec2List.size() % 2 != 0)
				{
					PANIC_NOFMT(parserInfo, "Quadratic polybezier curve must have a multiple of 2 coordinates, otherwise it's not a valid polybezier curve.");
					return false;
				}

				for (size_t i = 0; i < vec2List.size(); i += 2)
				{
					Svg::bezier2To(res, vec2List[i + 0], vec2List[i + 1], isAbsolute);
				}
			}
			break;
			case PathTokenType::SmoothQuadCurveTo:
			{
				std::vector<Vec2> vec2List;
				if (!parseVec2List(vec2List, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting smooth quadratic curve to command. Invalid coordinate encountered.");
					return false;
				}

				for (size_t i = 0; i < vec2List.size(); i++)
				{
					Svg::smoothBezier2To(res, vec2List[i], isAbsolute);
				}
			}
			break;
			case PathTokenType::ArcTo:
			{
				std::vector<ArcParams> arcParamsList;
				if (!parseArcParamsList(arcParamsList, parserInfo))
				{
					PANIC_NOFMT(parserInfo, "Error interpreting arc to command. Invalid arc parameters encountered.");
					return false;
				}

				for (size_t i = 0; i < arcParamsList.size(); i++)
				{
					Svg::arcTo(
						res,
						arcParamsList[i].radius,
						arcParamsList[i].xAxisRotation,
						arcParamsList[i].largeArcFlag,
						arcParamsList[i].sweepFlag,
						arcParamsList[i].endpoint,
						isAbsolute
					);
				}
			}
			break;
			case PathTokenType::Number:
				PANIC_NOFMT(parserInfo, "Encountered a number where a path command was expected.");
				return false;
			case PathTokenType::EndOfFile:
				PANIC_NOFMT(parserInfo, "Interpreting SVG EOF as a command. Something must have gone wrong. Check logs.");
				return false;
			case PathTokenType::Length:
			case PathTokenType::Panic:
				return false;
			}

			return true;
		}

		static bool parseVec2List(std::vector<Vec2>& list, ParserInfo& parserInfo)
		{
			do
			{
				PathToken x = consume(PathTokenType::Number, parserInfo);
				PathToken y = consume(PathTokenType::Number, parserInfo);
				if (x.type == PathTokenType::Number && y.type == PathTokenType::Number)
				{
					list.emplace_back(Vec2{ x.as.number, y.as.number });
				}
				else
				{
					return false;
				}
			} while (isNumberPart(peek(parserInfo)));

			return true;
		}

		static bool parseNumberList(std::vector<float>& list, ParserInfo& parserInfo)
		{
			do
			{
				PathToken number = consume(PathTokenType::Number, parserInfo);
				if (number.type == PathTokenType::Number)
				{
					list.emplace_back(number.as.number);
				}
				else
				{
					return false;
				}
			} while (isNumberPart(peek(parserInfo)));

			return true;
		}

		static bool parseArcParamsList(std::vector<ArcParams>& list, ParserInfo& parserInfo)
		{
			do
			{
				PathToken rx = consume(PathTokenType::Number, parserInfo);
				PathToken ry = consume(PathTokenType::Number, parserInfo);
				PathToken xAxisRotation = consume(PathTokenType::Number, parserInfo);
				if (rx.type != PathTokenType::Number || ry.type != PathTokenType::Number ||
					xAxisRotation.type != PathTokenType::Number)
				{
					return false;
				}

				// Flags are single characters and can be packed together like "a1 1 0 00 10 10"
				ArcParams res;
				if (!parseFlag(parserInfo, &res.largeArcFlag) || !parseFlag(parserInfo, &res.sweepFlag))
				{
					return false;
				}

				PathToken dstX = consume(PathTokenType::Number, parserInfo);
				PathToken dstY = consume(PathTokenType::Number, parserInfo);
				if (dstX.type != PathTokenType::Number || dstY.type != PathTokenType::Number)
				{
					return false;
				}

				res.radius.x = rx.as.number;
				res.radius.y = ry.as.number;
				res.xAxisRotation = xAxisRotation.as.number;
				res.endpoint.x = dstX.as.number;
				res.endpoint.y = dstY.as.number;
				list.emplace_back(res);
			} while (isNumberPart(peek(parserInfo)));

			return true;
		}

		static bool parseFlag(ParserInfo& parserInfo, bool* out)
		{
			char c = peek(parserInfo);
			if (c != '0' && c != '1')
			{
				*out = false;
				return false;
			}

			advance(parserInfo);
			skipWhitespaceAndCommas(parserInfo);
			*out = c == '1';
			return true;
		}

		static bool parseViewbox(Vec4* out, const char* viewboxStr)
		{
			ParserInfo pi;
			initParserInfo(pi, viewboxStr, std::strlen(viewboxStr));
			skipWhitespaceAndCommas(pi);

			PathToken x = parseNextPathToken(pi);
			PathToken y = parseNextPathToken(pi);
			PathToken w = parseNextPathToken(pi);
			PathToken h = parseNextPathToken(pi);
			if (x.type != PathTokenType::Number || y.type != PathTokenType::Number || w.type != PathTokenType::Number || h.type != PathTokenType::Number)
			{
				return false;
			}

			if (parseNextPathToken(pi).type != PathTokenType::EndOfFile)
			{
				return false;
			}

			out->values[0] = x.as.number;
			out->values[1] = y.as.number;
			out->values[2] = w.as.number;
			out->values[3] = h.as.number;
			return true;
		}

		static PathToken parseNextPathToken(ParserInfo& parserInfo)
		{
			PathToken result;
			result.type = PathTokenType::Panic;
			result.isAbsolute = true;
			result.as.number = 0.0f;

			if (isAlpha(peek(parserInfo)))
			{
				char commandLetter = advance(parserInfo);
				switch (commandLetter)
				{
				case 'M':
				case 'm':
					result.type = PathTokenType::MoveTo;
					result.isAbsolute = commandLetter == 'M';
					break;
				case 'Z':
				case 'z':
					result.type = PathTokenType::ClosePath;
					break;
				case 'L':
				case 'l':
					result.type = PathTokenType::LineTo;
					result.isAbsolute = commandLetter == 'L';
					break;
				case 'H':
				case 'h':
					result.type = PathTokenType::HzLineTo;
					result.isAbsolute = commandLetter == 'H';
					break;
				case 'V':
				case 'v':
					result.type = PathTokenType::VtLineTo;
					result.isAbsolute = commandLetter == 'V';
					break;
				case 'C':
				case 'c':
					result.type = PathTokenType::CurveTo;
					result.isAbsolute = commandLetter == 'C';
					break;
				case 'S':
				case 's':
					result.type = PathTokenType::SmoothCurveTo;
					result.isAbsolute = commandLetter == 'S';
					break;
				case 'Q':
				case 'q':
					result.type = PathTokenType::QuadCurveTo;
					result.isAbsolute = commandLetter == 'Q';
					break;
				case 'T':
				case 't':
					result.type = PathTokenType::SmoothQuadCurveTo;
					result.isAbsolute = commandLetter == 'T';
					break;
				case 'A':
				case 'a':
					result.type = PathTokenType::ArcTo;
					result.isAbsolute = commandLetter == 'A';
					break;
				default:
					PANIC(parserInfo, "Unknown command '%c' encountered while parsing SVG path at %zu.", commandLetter, parserInfo.cursor - 1);
					break;
				}
			}
			else if (isNumberPart(peek(parserInfo)))
			{
				float number;
				size_t cursorStart = parserInfo.cursor;
				if (!parseNumber(parserInfo, &number))
				{
					size_t previewEnd = glm::min(cursorStart + 10, parserInfo.textLength);
					std::string errorPreview = std::string(&parserInfo.text[cursorStart], &parserInfo.text[previewEnd]);
					PANIC(parserInfo, "Could not parse number while parsing SVG path: '%s'", errorPreview.c_str());
				}
				else
				{
					result.type = PathTokenType::Number;
					result.as.number = number;
				}
			}
			else if (parserInfo.cursor >= parserInfo.textLength)
			{
				result.type = PathTokenType::EndOfFile;
			}
			else
			{
				PANIC(parserInfo, "Unknown symbol encountered while parsing SVG path. ParserInfo[%zu/%zu]:'%c'", parserInfo.cursor, parserInfo.textLength, peek(parserInfo));
			}

			skipWhitespaceAndCommas(parserInfo);
			return result;
		}

		static PathToken consume(PathTokenType expected, ParserInfo& parserInfo)
		{
			PathToken token = parseNextPathToken(parserInfo);
			if (token.type != expected)
			{
				if (token.type != PathTokenType::Panic)
				{
					PANIC(parserInfo, "Expected %s but got %s while parsing SVG path.", commandName(expected), commandName(token.type));
				}
				token.type = PathTokenType::Panic;
				parserInfo.cursor = parserInfo.textLength;
			}

			return token;
		}

		static const char* commandName(PathTokenType type)
		{
			switch (type)
			{
			case PathTokenType::MoveTo: return "move to";
			case PathTokenType::ClosePath: return "close path";
			case PathTokenType::LineTo: return "line to";
			case PathTokenType::HzLineTo: return "horizontal line to";
			case PathTokenType::VtLineTo: return "vertical line to";
			case PathTokenType::CurveTo: return "curve to";
			case PathTokenType::SmoothCurveTo: return "smooth curve to";
			case PathTokenType::QuadCurveTo: return "quadratic curve to";
			case PathTokenType::SmoothQuadCurveTo: return "smooth quadratic curve to";
			case PathTokenType::ArcTo: return "arc to";
			case PathTokenType::Number: return "a number";
			case PathTokenType::EndOfFile: return "end of path";
			case PathTokenType::Panic:
			case PathTokenType::Length:
				break;
			}

			return "an invalid token";
		}

		// -------- Generic Parser Stuff --------

		// number: [+-]? (digits '.'? digits* | '.' digits) ([eE] [+-]? digits)?
		static bool parseNumber(ParserInfo& parserInfo, float* out)
		{
			size_t numberStart = parserInfo.cursor;

			if (peek(parserInfo) == '-' || peek(parserInfo) == '+')
			{
				advance(parserInfo);
			}

			bool seenDigit = false;
			while (isDigit(peek(parserInfo)))
			{
				seenDigit = true;
				advance(parserInfo);
			}

			// A second dot starts a new number, so "0.5.5" is two numbers
			if (peek(parserInfo) == '.')
			{
				advance(parserInfo);
				while (isDigit(peek(parserInfo)))
				{
					seenDigit = true;
					advance(parserInfo);
				}
			}

			if (!seenDigit)
			{
				*out = 0.0f;
				return false;
			}

			// Only consume the exponent if digits follow it
			if (peek(parserInfo) == 'e' || peek(parserInfo) == 'E')
			{
				size_t exponentOffset = 1;
				if (peek(parserInfo, 1) == '-' || peek(parserInfo, 1) == '+')
				{
					exponentOffset++;
				}

				if (isDigit(peek(parserInfo, exponentOffset)))
				{
					for (size_t i = 0; i < exponentOffset; i++)
					{
						advance(parserInfo);
					}
					while (isDigit(peek(parserInfo)))
					{
						advance(parserInfo);
					}
				}
			}

			size_t numberEnd = parserInfo.cursor;
			constexpr size_t maxSmallBufferSize = 64;
			if (numberEnd - numberStart >= maxSmallBufferSize)
			{
				*out = 0.0f;
				return false;
			}

			char smallBuffer[maxSmallBufferSize];
			g_memory_copyMem(smallBuffer, (void*)(parserInfo.text + numberStart), sizeof(char) * (numberEnd - numberStart));
			smallBuffer[numberEnd - numberStart] = '\0';

			char* end = nullptr;
			*out = std::strtof(smallBuffer, &end);
			return end == smallBuffer + (numberEnd - numberStart) && std::isfinite(*out);
		}

		static void skipWhitespaceAndCommas(ParserInfo& parserInfo)
		{
			while (isWhitespace(peek(parserInfo)) || peek(parserInfo) == ',')
			{
				advance(parserInfo);
			}
		}
	}
}

#undef PANIC
#undef PANIC_NOFMT
