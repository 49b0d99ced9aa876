#ifndef KIVG_SVG_PARSER_H
#define KIVG_SVG_PARSER_H
#include "core.h"
#include "core/Errors.h"
#include "core/Options.h"

namespace Kivg
{
	struct SubPath;
	struct SvgDocument;

	// Canvas used when the document has no usable width, height or viewBox
	constexpr float defaultCanvasSize = 512.0f;

	namespace SvgParser
	{
		/**
		 * @brief Parses the contents of an SVG path's d attribute into normalized absolute
		 *        segments. On failure the output is left untouched.
		 * @param pathText The path string
		 * @param pathTextLength Length of the path string
		 * @param output Receives the subpaths
		 * @param options Arc handling options
		 * @param errorMessage Optional, receives a description of the failure
		 * @return KivgError::None on success, MalformedPath for grammar errors
		*/
		KivgError parseSvgPath(
			const char* pathText,
			size_t pathTextLength,
			std::vector<SubPath>& output,
			const ParseOptions& options = ParseOptions{},
			std::string* errorMessage = nullptr
		);
		inline KivgError parseSvgPath(const std::string& pathText, std::vector<SubPath>& output, const ParseOptions& options = ParseOptions{}, std::string* errorMessage = nullptr)
		{
			return parseSvgPath(pathText.c_str(), pathText.length(), output, options, errorMessage);
		}

		/**
		 * @brief Loads every <path> element of an SVG document, in document order. Errors
		 *        that affect a single path are collected in SvgDocument::errors.
		 * @return KivgError::None when at least one path loaded. MalformedDocument,
		 *         NoDrawablePaths, or MalformedPath under the abort policy otherwise.
		*/
		KivgError parseSvgDoc(const char* text, size_t textLength, const LoadOptions& options, SvgDocument& output);
		KivgError parseSvgFile(const char* filepath, const LoadOptions& options, SvgDocument& output);
	}
}

#endif
