#ifndef KIVG_SVG_OBJECT_H
#define KIVG_SVG_OBJECT_H
#include "core.h"
#include "core/Errors.h"

namespace Kivg
{
	enum class SegmentType : uint8
	{
		None = 0,
		MoveTo,
		LineTo,
		CubicCurveTo,
		QuadraticCurveTo,
		ArcTo,
		ClosePath,
		Length
	};

	constexpr auto segmentTypeNames = fixedSizeArray<const char*, (size_t)SegmentType::Length>(
		"None",
		"MoveTo",
		"LineTo",
		"CubicCurveTo",
		"QuadraticCurveTo",
		"ArcTo",
		"ClosePath"
	);

	enum class FillType : uint8
	{
		NonZeroFillType = 0,
		EvenOddFillType,
		Length
	};

	// Values of the SVG fill-rule attribute
	constexpr auto fillTypeNames = fixedSizeArray<const char*, (size_t)FillType::Length>(
		"nonzero",
		"evenodd"
	);

	constexpr float defaultArcTolerance = 0.1f;
	constexpr int defaultResolution = 16;

	struct Line
	{
		Vec2 p1;
	};

	struct Bezier2
	{
		Vec2 p1;
		Vec2 p2;
	};

	struct Bezier3
	{
		Vec2 p1;
		Vec2 p2;
		Vec2 p3;
	};

	struct Arc
	{
		Vec2 radius;
		// Degrees
		float xAxisRotation;
		bool largeArcFlag;
		bool sweepFlag;
		Vec2 p1;
	};

	struct Segment
	{
		SegmentType type;
		// The current point before this segment
		Vec2 p0;
		union
		{
			// MoveTo, LineTo and ClosePath
			Line line;
			Bezier2 bezier2;
			Bezier3 bezier3;
			Arc arc;
		} as;

		Vec2 endpoint() const;
	};

	struct SubPath
	{
		// The first segment is always a MoveTo
		std::vector<Segment> segments;
		bool isClosed;
	};

	struct Polyline
	{
		std::vector<Vec2> points;
		bool isClosed;
	};

	struct Mesh
	{
		std::vector<Vec2> vertices;
		std::vector<uint32> indices;

		inline bool empty() const { return indices.empty(); }
		inline void clear() { vertices.clear(); indices.clear(); }
	};

	struct PathModel
	{
		std::string id;
		std::vector<SubPath> subpaths;
		Vec4 fillColor;
		Vec4 strokeColor;
		float strokeWidth;
		bool hasStroke;
		FillType fillType;

		Mesh fillMesh;
		// One flattened polyline per subpath with at least two distinct points
		std::vector<Polyline> outlines;
		// Rewritten by the animation engine every frame
		Mesh visibleMesh;

		BBox bbox;
		float approximatePerimeter;

		int numDrawableSegments() const;
	};

	struct PathLoadError
	{
		int pathIndex;
		std::string id;
		KivgError error;
		std::string message;
	};

	struct SvgDocument
	{
		std::vector<PathModel> paths;
		// x, y, width, height
		Vec4 viewbox;
		Vec2 size;
		std::vector<PathLoadError> errors;

		std::optional<size_t> findPath(const std::string& id) const;
	};

	struct PathSample
	{
		Vec2 position;
		float angleDegrees;
	};

	// Tracks the cursor while a path string is turned into segments
	struct PathBuilder
	{
		std::vector<SubPath> subpaths;
		Vec2 _cursor;
		Vec2 _subpathStart;
	};

	namespace Svg
	{
		PathBuilder createBuilder();
		PathModel createDefaultPath();

		// This begins a new subpath
		void moveTo(PathBuilder* builder, const Vec2& point, bool absolute = true);
		void lineTo(PathBuilder* builder, const Vec2& point, bool absolute = true);
		void hzLineTo(PathBuilder* builder, float xPoint, bool absolute = true);
		void vtLineTo(PathBuilder* builder, float yPoint, bool absolute = true);
		void bezier2To(PathBuilder* builder, const Vec2& control, const Vec2& dest, bool absolute = true);
		void bezier3To(PathBuilder* builder, const Vec2& control0, const Vec2& control1, const Vec2& dest, bool absolute = true);
		void smoothBezier2To(PathBuilder* builder, const Vec2& dest, bool absolute = true);
		void smoothBezier3To(PathBuilder* builder, const Vec2& control1, const Vec2& dest, bool absolute = true);
		void arcTo(PathBuilder* builder, const Vec2& radius, float xAxisRot, bool largeArc, bool sweep, const Vec2& dst, bool absolute = true);
		void closePath(PathBuilder* builder);

		// True once a segment has been added, commands other than a MoveTo require this
		bool hasCurrentPoint(const PathBuilder* builder);

		/**
		 * @brief Approximates an ArcTo segment with cubic segments. The number of slices is
		 *        the smallest one that keeps the radial error under the tolerance, no slice
		 *        spans more than 90 degrees.
		 * @param arc The ArcTo segment
		 * @param tolerance Max distance between the cubic approximation and the real arc
		 * @param out Receives the segments. A degenerate arc produces a single LineTo.
		*/
		void arcToCubics(const Segment& arc, float tolerance, std::vector<Segment>& out);

		// Replaces every ArcTo segment with its cubic approximation
		void expandArcs(std::vector<SubPath>& subpaths, float tolerance);

		// Writes absolute M/L/C/Q/A/Z commands that parse back to the same segments
		std::string toPathString(const std::vector<SubPath>& subpaths);

		bool compare(const Segment& a, const Segment& b, float epsilon);
		bool compare(const std::vector<SubPath>& a, const std::vector<SubPath>& b, float epsilon);

		BBox calculateBBox(const std::vector<SubPath>& subpaths);
		float calculateApproximatePerimeter(const std::vector<Polyline>& outlines);

		/**
		 * @brief Finds the point at the given fraction of the path's arc length along its
		 *        flattened outlines. The angle is the direction of travel at that point.
		 * @return The sample, or nullopt when the path has no length
		*/
		std::optional<PathSample> samplePath(const PathModel& path, float fraction);
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::Segment& segment);
CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::SubPath& subpath);

#endif
