#include "svg/Svg.h"
#include "math/CMath.h"

namespace Kivg
{
	namespace Svg
	{
		// ----------------- Internal functions -----------------
		static Segment& pushSegment(PathBuilder* builder, SegmentType type);
		static void beginImplicitSubpathIfClosed(PathBuilder* builder);
		static void appendNumber(std::string& str, float value);
		static float arcApproximationError(float radius, float sliceAngle);

		PathBuilder createBuilder()
		{
			PathBuilder res = {};
			res._cursor = Vec2{ 0, 0 };
			res._subpathStart = Vec2{ 0, 0 };
			return res;
		}

		PathModel createDefaultPath()
		{
			PathModel res = {};
			res.fillColor = Vec4{ 1, 1, 1, 1 };
			res.strokeColor = Vec4{ 0, 0, 0, 1 };
			res.strokeWidth = 1.0f;
			res.hasStroke = false;
			res.fillType = FillType::NonZeroFillType;
			res.bbox.min = Vec2{ 0, 0 };
			res.bbox.max = Vec2{ 0, 0 };
			res.approximatePerimeter = 0.0f;
			return res;
		}

		void moveTo(PathBuilder* builder, const Vec2& point, bool absolute)
		{
			// Apparently having two move to commands in a row is valid, something like:
			//    M0, 0 M10, 10
			// Each one still begins its own subpath so the segments survive a round trip
			Vec2 dest = absolute ? point : builder->_cursor + point;

			SubPath subpath = {};
			subpath.isClosed = false;
			builder->subpaths.emplace_back(subpath);

			Segment& segment = pushSegment(builder, SegmentType::MoveTo);
			segment.as.line.p1 = dest;

			builder->_cursor = dest;
			builder->_subpathStart = dest;
		}

		void lineTo(PathBuilder* builder, const Vec2& point, bool absolute)
		{
			beginImplicitSubpathIfClosed(builder);
			Vec2 dest = absolute ? point : builder->_cursor + point;

			Segment& segment = pushSegment(builder, SegmentType::LineTo);
			segment.as.line.p1 = dest;

			builder->_cursor = dest;
		}

		void hzLineTo(PathBuilder* builder, float xPoint, bool absolute)
		{
			beginImplicitSubpathIfClosed(builder);
			Vec2 position = absolute
				? Vec2{ xPoint, builder->_cursor.y }
				: Vec2{ xPoint, 0.0f } + builder->_cursor;
			lineTo(builder, position, true);
		}

		void vtLineTo(PathBuilder* builder, float yPoint, bool absolute)
		{
			beginImplicitSubpathIfClosed(builder);
			Vec2 position = absolute
				? Vec2{ builder->_cursor.x, yPoint }
				: Vec2{ 0.0f, yPoint } + builder->_cursor;
			lineTo(builder, position, true);
		}

		void bezier2To(PathBuilder* builder, const Vec2& control, const Vec2& dest, bool absolute)
		{
			beginImplicitSubpathIfClosed(builder);
			Vec2 cursor = builder->_cursor;

			Segment& segment = pushSegment(builder, SegmentType::QuadraticCurveTo);
			segment.as.bezier2.p1 = absolute ? control : control + cursor;
			segment.as.bezier2.p2 = absolute ? dest : dest + cursor;

			// Only update the cursor to the final point of the curve
			builder->_cursor = segment.as.bezier2.p2;
		}

		void bezier3To(PathBuilder* builder, const Vec2& control0, const Vec2& control1, const Vec2& dest, bool absolute)
		{
			beginImplicitSubpathIfClosed(builder);
			Vec2 cursor = builder->_cursor;

			Segment& segment = pushSegment(builder, SegmentType::CubicCurveTo);
			segment.as.bezier3.p1 = absolute ? control0 : control0 + cursor;
			segment.as.bezier3.p2 = absolute ? control1 : control1 + cursor;
			segment.as.bezier3.p3 = absolute ? dest : dest + cursor;

			builder->_cursor = segment.as.bezier3.p3;
		}

		void smoothBezier2To(PathBuilder* builder, const Vec2& dest, bool absolute)
		{
			beginImplicitSubpathIfClosed(builder);
			Vec2 cursor = builder->_cursor;

			Vec2 control0 = cursor;
			const std::vector<Segment>& segments = builder->subpaths.back().segments;
			if (segments.back().type == SegmentType::QuadraticCurveTo)
			{
				Vec2 prevControl = segments.back().as.bezier2.p1;
				// Reflect the previous control point about the current cursor
				control0 = (-1.0f * (prevControl - cursor)) + cursor;
			}

			bezier2To(builder, control0, absolute ? dest : dest + cursor, true);
		}

		void smoothBezier3To(PathBuilder* builder, const Vec2& control1, const Vec2& dest, bool absolute)
		{
			beginImplicitSubpathIfClosed(builder);
			Vec2 cursor = builder->_cursor;

			Vec2 control0 = cursor;
			const std::vector<Segment>& segments = builder->subpaths.back().segments;
			if (segments.back().type == SegmentType::CubicCurveTo)
			{
				Vec2 prevControl1 = segments.back().as.bezier3.p2;
				// Reflect the previous c2 about the current cursor
				control0 = (-1.0f * (prevControl1 - cursor)) + cursor;
			}

			bezier3To(
				builder,
				control0,
				absolute ? control1 : control1 + cursor,
				absolute ? dest : dest + cursor,
				true
			);
		}

		void arcTo(PathBuilder* builder, const Vec2& radius, float xAxisRot, bool largeArc, bool sweep, const Vec2& inDst, bool absolute)
		{
			beginImplicitSubpathIfClosed(builder);
			Vec2 dst = absolute ? inDst : inDst + builder->_cursor;

			if (builder->_cursor == dst)
			{
				// If the endpoints (x, y) and (x0, y0) are identical, then this
				// is equivalent to omitting the elliptical arc segment entirely.
				return;
			}

			if (radius.x == 0.0f || radius.y == 0.0f)
			{
				// Handle degenerate case (behaves like a lineTo)
				lineTo(builder, dst, true);
				return;
			}

			Segment& segment = pushSegment(builder, SegmentType::ArcTo);
			segment.as.arc.radius = radius;
			segment.as.arc.xAxisRotation = xAxisRot;
			segment.as.arc.largeArcFlag = largeArc;
			segment.as.arc.sweepFlag = sweep;
			segment.as.arc.p1 = dst;

			builder->_cursor = dst;
		}

		void closePath(PathBuilder* builder)
		{
			g_logger_assert(builder->subpaths.size() > 0, "Cannot close a path when no subpath exists.");
			SubPath& subpath = builder->subpaths.back();
			if (subpath.isClosed)
			{
				return;
			}

			Segment& segment = pushSegment(builder, SegmentType::ClosePath);
			segment.as.line.p1 = builder->_subpathStart;
			subpath.isClosed = true;

			builder->_cursor = builder->_subpathStart;
		}

		bool hasCurrentPoint(const PathBuilder* builder)
		{
			return builder->subpaths.size() > 0;
		}

		// Slice handling adapted from https://github.com/BigBadaboom/androidsvg/blob/5db71ef0007b41644258c1f139f941017aef7de3/androidsvg/src/main/java/com/caverock/androidsvg/utils/SVGAndroidRenderer.java#L2889
		// with the center parameterization from the SVG implementation notes (F.6.5)
		void arcToCubics(const Segment& arcSegment, float tolerance, std::vector<Segment>& out)
		{
			g_logger_assert(arcSegment.type == SegmentType::ArcTo, "Cannot convert segment of type '{}' to cubics.", segmentTypeNames[(size_t)arcSegment.type]);
			const Arc& arc = arcSegment.as.arc;
			Vec2 src = arcSegment.p0;
			Vec2 dst = arc.p1;

			if (src == dst)
			{
				return;
			}

			using Precision = double;
			Precision rx = glm::abs((Precision)arc.radius.x);
			Precision ry = glm::abs((Precision)arc.radius.y);
			if (rx == 0.0 || ry == 0.0)
			{
				Segment line = {};
				line.type = SegmentType::LineTo;
				line.p0 = src;
				line.as.line.p1 = dst;
				out.emplace_back(line);
				return;
			}

			// Convert angle from degrees to radians
			Precision angleRad = glm::radians(glm::mod((Precision)arc.xAxisRotation, (Precision)360.0));
			Precision cosAngle = glm::cos(angleRad);
			Precision sinAngle = glm::sin(angleRad);

			// We simplify the calculations by transforming the arc so that the origin is at the
			// midpoint calculated above followed by a rotation to line up the coordinate axes
			// with the axes of the ellipse.

			// Compute the midpoint of the line between the current and the end point
			Precision dx2 = ((Precision)src.x - (Precision)dst.x) / 2.0;
			Precision dy2 = ((Precision)src.y - (Precision)dst.y) / 2.0;

			// Step 1 : Compute (x1', y1')
			Precision x1 = (cosAngle * dx2 + sinAngle * dy2);
			Precision y1 = (-sinAngle * dx2 + cosAngle * dy2);

			Precision rxSq = rx * rx;
			Precision rySq = ry * ry;
			Precision x1Sq = x1 * x1;
			Precision y1Sq = y1 * y1;

			// Check that radii are large enough.
			// If they are not, the SVG implementation notes scale them up so they are.
			Precision radiiCheck = x1Sq / rxSq + y1Sq / rySq;
			if (radiiCheck > 1.0)
			{
				rx = glm::sqrt(radiiCheck) * rx;
				ry = glm::sqrt(radiiCheck) * ry;
				rxSq = rx * rx;
				rySq = ry * ry;
			}

			// Step 2 : Compute (cx1, cy1) - the transformed centre point
			Precision sign = (arc.largeArcFlag == arc.sweepFlag) ? -1.0 : 1.0;
			Precision sq = ((rxSq * rySq) - (rxSq * y1Sq) - (rySq * x1Sq)) / ((rxSq * y1Sq) + (rySq * x1Sq));
			sq = (sq < 0) ? 0 : sq;
			Precision coef = (sign * glm::sqrt(sq));
			Precision cx1 = coef * ((rx * y1) / ry);
			Precision cy1 = coef * -((ry * x1) / rx);

			// Step 3 : Compute (cx, cy) from (cx1, cy1)
			Precision sx2 = ((Precision)src.x + (Precision)dst.x) / 2.0;
			Precision sy2 = ((Precision)src.y + (Precision)dst.y) / 2.0;
			Precision cx = sx2 + (cosAngle * cx1 - sinAngle * cy1);
			Precision cy = sy2 + (sinAngle * cx1 + cosAngle * cy1);

			// Step 4 : Compute the angleStart (angle1) and the angleExtent (dangle)
			Precision ux = (x1 - cx1) / rx;
			Precision uy = (y1 - cy1) / ry;
			Precision vx = (-x1 - cx1) / rx;
			Precision vy = (-y1 - cy1) / ry;
			Precision angleStart = glm::atan(uy, ux);
			Precision angleExtent = glm::atan(ux * vy - uy * vx, ux * vx + uy * vy);

			if (!arc.sweepFlag && angleExtent > 0)
			{
				angleExtent -= glm::pi<Precision>() * 2.0;
			}
			else if (arc.sweepFlag && angleExtent < 0)
			{
				angleExtent += glm::pi<Precision>() * 2.0;
			}

			// No slice is allowed to be wider than 90 degrees, after that keep adding slices
			// until the approximation is inside the tolerance
			constexpr int maxSlices = 64;
			Precision absExtent = glm::abs(angleExtent);
			int numSegments = (int)glm::ceil(absExtent * 2.0 / glm::pi<Precision>());
			numSegments = glm::max(numSegments, 1);
			float largestRadius = (float)glm::max(rx, ry);
			while (numSegments < maxSlices &&
				arcApproximationError(largestRadius, (float)(absExtent / (Precision)numSegments)) > tolerance)
			{
				numSegments++;
			}

			Precision angleIncrement = angleExtent / (Precision)numSegments;

			// The length of each control point vector is given by the following formula.
			Precision controlLength = 4.0 / 3.0 * glm::tan(angleIncrement / 4.0);

			// Calculate a transformation matrix that will move and scale the unit circle points
			// to the correct location.
			glm::mat3 scale = glm::mat3(1.0f);
			scale[0][0] = (float)rx;
			scale[1][1] = (float)ry;
			glm::mat3 rotation = glm::mat3(1.0f);
			rotation[0] = glm::vec3((float)cosAngle, (float)sinAngle, 0.0f);
			rotation[1] = glm::vec3((float)-sinAngle, (float)cosAngle, 0.0f);
			glm::mat3 translation = glm::mat3(1.0f);
			translation[2] = glm::vec3((float)cx, (float)cy, 1.0f);
			glm::mat3 transformation = translation * rotation * scale;

			Vec2 cursor = src;
			for (int i = 0; i < numSegments; i++)
			{
				Precision angle = angleStart + (Precision)i * angleIncrement;
				// Calculate the control vector at this angle
				Precision dx = glm::cos(angle);
				Precision dy = glm::sin(angle);
				// First control point
				glm::vec3 c1 = glm::vec3((float)(dx - controlLength * dy), (float)(dy + controlLength * dx), 1.0f);
				// Second control point
				angle += angleIncrement;
				dx = glm::cos(angle);
				dy = glm::sin(angle);
				glm::vec3 c2 = glm::vec3((float)(dx + controlLength * dy), (float)(dy - controlLength * dx), 1.0f);
				// Endpoint of bezier
				glm::vec3 p2 = glm::vec3((float)dx, (float)dy, 1.0f);

				c1 = transformation * c1;
				c2 = transformation * c2;
				p2 = transformation * p2;

				Segment cubic = {};
				cubic.type = SegmentType::CubicCurveTo;
				cubic.p0 = cursor;
				cubic.as.bezier3.p1 = Vec2{ c1.x, c1.y };
				cubic.as.bezier3.p2 = Vec2{ c2.x, c2.y };
				// The last point should match the arc's endpoint exactly, with all the
				// mathematical manipulation above it is bound to be off by a tiny fraction
				cubic.as.bezier3.p3 = i == numSegments - 1
					? dst
					: Vec2{ p2.x, p2.y };
				out.emplace_back(cubic);

				cursor = cubic.as.bezier3.p3;
			}
		}

		void expandArcs(std::vector<SubPath>& subpaths, float tolerance)
		{
			for (SubPath& subpath : subpaths)
			{
				std::vector<Segment> expanded;
				expanded.reserve(subpath.segments.size());
				for (const Segment& segment : subpath.segments)
				{
					if (segment.type == SegmentType::ArcTo)
					{
						arcToCubics(segment, tolerance, expanded);
					}
					else
					{
						expanded.emplace_back(segment);
					}
				}
				subpath.segments = std::move(expanded);
			}
		}

		std::string toPathString(const std::vector<SubPath>& subpaths)
		{
			std::string res;
			for (const SubPath& subpath : subpaths)
			{
				for (const Segment& segment : subpath.segments)
				{
					if (!res.empty())
					{
						res += ' ';
					}

					switch (segment.type)
					{
					case SegmentType::MoveTo:
						res += 'M';
						appendNumber(res, segment.as.line.p1.x);
						appendNumber(res, segment.as.line.p1.y);
						break;
					case SegmentType::LineTo:
						res += 'L';
						appendNumber(res, segment.as.line.p1.x);
						appendNumber(res, segment.as.line.p1.y);
						break;
					case SegmentType::CubicCurveTo:
						res += 'C';
						appendNumber(res, segment.as.bezier3.p1.x);
						appendNumber(res, segment.as.bezier3.p1.y);
						appendNumber(res, segment.as.bezier3.p2.x);
						appendNumber(res, segment.as.bezier3.p2.y);
						appendNumber(res, segment.as.bezier3.p3.x);
						appendNumber(res, segment.as.bezier3.p3.y);
						break;
					case SegmentType::QuadraticCurveTo:
						res += 'Q';
						appendNumber(res, segment.as.bezier2.p1.x);
						appendNumber(res, segment.as.bezier2.p1.y);
						appendNumber(res, segment.as.bezier2.p2.x);
						appendNumber(res, segment.as.bezier2.p2.y);
						break;
					case SegmentType::ArcTo:
						res += 'A';
						appendNumber(res, segment.as.arc.radius.x);
						appendNumber(res, segment.as.arc.radius.y);
						appendNumber(res, segment.as.arc.xAxisRotation);
						res += segment.as.arc.largeArcFlag ? " 1" : " 0";
						res += segment.as.arc.sweepFlag ? " 1" : " 0";
						appendNumber(res, segment.as.arc.p1.x);
						appendNumber(res, segment.as.arc.p1.y);
						break;
					case SegmentType::ClosePath:
						res += 'Z';
						break;
					case SegmentType::None:
					case SegmentType::Length:
						g_logger_warning("Skipping invalid segment type while serializing path.");
						break;
					}
				}
			}

			return res;
		}

		bool compare(const Segment& a, const Segment& b, float epsilon)
		{
			if (a.type != b.type || !CMath::compare(a.p0, b.p0, epsilon))
			{
				return false;
			}

			switch (a.type)
			{
			case SegmentType::MoveTo:
			case SegmentType::LineTo:
			case SegmentType::ClosePath:
				return CMath::compare(a.as.line.p1, b.as.line.p1, epsilon);
			case SegmentType::QuadraticCurveTo:
				return CMath::compare(a.as.bezier2.p1, b.as.bezier2.p1, epsilon) &&
					CMath::compare(a.as.bezier2.p2, b.as.bezier2.p2, epsilon);
			case SegmentType::CubicCurveTo:
				return CMath::compare(a.as.bezier3.p1, b.as.bezier3.p1, epsilon) &&
					CMath::compare(a.as.bezier3.p2, b.as.bezier3.p2, epsilon) &&
					CMath::compare(a.as.bezier3.p3, b.as.bezier3.p3, epsilon);
			case SegmentType::ArcTo:
				return CMath::compare(a.as.arc.radius, b.as.arc.radius, epsilon) &&
					CMath::compare(a.as.arc.xAxisRotation, b.as.arc.xAxisRotation, epsilon) &&
					a.as.arc.largeArcFlag == b.as.arc.largeArcFlag &&
					a.as.arc.sweepFlag == b.as.arc.sweepFlag &&
					CMath::compare(a.as.arc.p1, b.as.arc.p1, epsilon);
			case SegmentType::None:
			case SegmentType::Length:
				break;
			}

			return true;
		}

		bool compare(const std::vector<SubPath>& a, const std::vector<SubPath>& b, float epsilon)
		{
			if (a.size() != b.size())
			{
				return false;
			}

			for (size_t i = 0; i < a.size(); i++)
			{
				if (a[i].isClosed != b[i].isClosed || a[i].segments.size() != b[i].segments.size())
				{
					return false;
				}

				for (size_t j = 0; j < a[i].segments.size(); j++)
				{
					if (!compare(a[i].segments[j], b[i].segments[j], epsilon))
					{
						return false;
					}
				}
			}

			return true;
		}

		BBox calculateBBox(const std::vector<SubPath>& subpaths)
		{
			BBox bbox;
			bbox.min = Vec2{ FLT_MAX, FLT_MAX };
			bbox.max = Vec2{ -FLT_MAX, -FLT_MAX };
			bool hasPoints = false;

			std::vector<Segment> arcCubics;
			for (const SubPath& subpath : subpaths)
			{
				for (const Segment& segment : subpath.segments)
				{
					BBox subBbox = {};
					switch (segment.type)
					{
					case SegmentType::MoveTo:
						// Lone move to commands do not contribute any geometry
						if (subpath.segments.size() == 1)
						{
							continue;
						}
						subBbox = CMath::bezier1BBox(segment.as.line.p1, segment.as.line.p1);
						break;
					case SegmentType::LineTo:
					case SegmentType::ClosePath:
						subBbox = CMath::bezier1BBox(segment.p0, segment.as.line.p1);
						break;
					case SegmentType::QuadraticCurveTo:
						subBbox = CMath::bezier2BBox(segment.p0, segment.as.bezier2.p1, segment.as.bezier2.p2);
						break;
					case SegmentType::CubicCurveTo:
						subBbox = CMath::bezier3BBox(segment.p0, segment.as.bezier3.p1, segment.as.bezier3.p2, segment.as.bezier3.p3);
						break;
					case SegmentType::ArcTo:
					{
						arcCubics.clear();
						arcToCubics(segment, defaultArcTolerance, arcCubics);
						subBbox = CMath::bezier1BBox(segment.p0, segment.as.arc.p1);
						for (const Segment& cubic : arcCubics)
						{
							BBox cubicBbox = cubic.type == SegmentType::CubicCurveTo
								? CMath::bezier3BBox(cubic.p0, cubic.as.bezier3.p1, cubic.as.bezier3.p2, cubic.as.bezier3.p3)
								: CMath::bezier1BBox(cubic.p0, cubic.as.line.p1);
							subBbox.min = CMath::min(subBbox.min, cubicBbox.min);
							subBbox.max = CMath::max(subBbox.max, cubicBbox.max);
						}
					}
					break;
					case SegmentType::None:
					case SegmentType::Length:
						continue;
					}

					bbox.min = CMath::min(bbox.min, subBbox.min);
					bbox.max = CMath::max(bbox.max, subBbox.max);
					hasPoints = true;
				}
			}

			if (!hasPoints)
			{
				bbox.min = Vec2{ 0, 0 };
				bbox.max = Vec2{ 0, 0 };
			}

			return bbox;
		}

		float calculateApproximatePerimeter(const std::vector<Polyline>& outlines)
		{
			float perimeter = 0.0f;
			for (const Polyline& outline : outlines)
			{
				for (size_t i = 1; i < outline.points.size(); i++)
				{
					perimeter += CMath::length(outline.points[i] - outline.points[i - 1]);
				}

				if (outline.isClosed && outline.points.size() > 2)
				{
					perimeter += CMath::length(outline.points.front() - outline.points.back());
				}
			}

			return perimeter;
		}

		std::optional<PathSample> samplePath(const PathModel& path, float fraction)
		{
			float perimeter = calculateApproximatePerimeter(path.outlines);
			if (perimeter <= 0.0f)
			{
				return std::nullopt;
			}

			float targetLength = glm::clamp(fraction, 0.0f, 1.0f) * perimeter;
			float walked = 0.0f;
			PathSample lastSample = {};
			for (const Polyline& outline : path.outlines)
			{
				size_t numEdges = outline.points.size() - 1;
				if (outline.isClosed && outline.points.size() > 2)
				{
					numEdges++;
				}

				for (size_t i = 0; i < numEdges; i++)
				{
					const Vec2& start = outline.points[i];
					const Vec2& end = outline.points[(i + 1) % outline.points.size()];
					Vec2 direction = end - start;
					float edgeLength = CMath::length(direction);
					if (edgeLength <= 0.0f)
					{
						continue;
					}

					float angle = CMath::toDegrees(glm::atan(direction.y, direction.x));
					if (walked + edgeLength >= targetLength)
					{
						float t = (targetLength - walked) / edgeLength;
						return PathSample{ CMath::interpolate(t, start, end), angle };
					}

					walked += edgeLength;
					lastSample = PathSample{ end, angle };
				}
			}

			// Float error in the accumulated length can leave the target just past the end
			return lastSample;
		}

		// ----------------- Internal functions -----------------
		static Segment& pushSegment(PathBuilder* builder, SegmentType type)
		{
			g_logger_assert(builder->subpaths.size() > 0, "Cannot add a segment when no subpath exists.");
			SubPath& subpath = builder->subpaths.back();

			Segment segment = {};
			segment.type = type;
			segment.p0 = builder->_cursor;
			subpath.segments.emplace_back(segment);
			return subpath.segments.back();
		}

		static void beginImplicitSubpathIfClosed(PathBuilder* builder)
		{
			g_logger_assert(builder->subpaths.size() > 0, "Path segments must follow a move to command.");
			if (builder->subpaths.back().isClosed)
			{
				// Drawing after a close path continues from the start of the closed subpath
				moveTo(builder, builder->_subpathStart, true);
			}
		}

		static void appendNumber(std::string& str, float value)
		{
			char buffer[32];
			snprintf(buffer, sizeof(buffer), " %.9g", (double)value);
			str += buffer;
		}

		static float arcApproximationError(float radius, float sliceAngle)
		{
			// Max radial distance between a unit circle slice and its cubic approximation
			float sinQuarter = glm::sin(sliceAngle / 4.0f);
			float cosQuarter = glm::cos(sliceAngle / 4.0f);
			return radius * (4.0f / 27.0f) * glm::pow(sinQuarter, 6.0f) / (cosQuarter * cosQuarter);
		}
	}

	Vec2 Segment::endpoint() const
	{
		switch (type)
		{
		case SegmentType::MoveTo:
		case SegmentType::LineTo:
		case SegmentType::ClosePath:
			return as.line.p1;
		case SegmentType::QuadraticCurveTo:
			return as.bezier2.p2;
		case SegmentType::CubicCurveTo:
			return as.bezier3.p3;
		case SegmentType::ArcTo:
			return as.arc.p1;
		case SegmentType::None:
		case SegmentType::Length:
			break;
		}

		return p0;
	}

	int PathModel::numDrawableSegments() const
	{
		int count = 0;
		for (const SubPath& subpath : subpaths)
		{
			for (const Segment& segment : subpath.segments)
			{
				if (segment.type != SegmentType::MoveTo)
				{
					count++;
				}
			}
		}

		return count;
	}

	std::optional<size_t> SvgDocument::findPath(const std::string& id) const
	{
		for (size_t i = 0; i < paths.size(); i++)
		{
			if (paths[i].id == id)
			{
				return i;
			}
		}

		return std::nullopt;
	}
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::Segment& segment)
{
	ostream << Kivg::segmentTypeNames[(size_t)segment.type] << "{p0: " << segment.p0;
	switch (segment.type)
	{
	case Kivg::SegmentType::MoveTo:
	case Kivg::SegmentType::LineTo:
	case Kivg::SegmentType::ClosePath:
		ostream << ", p1: " << segment.as.line.p1;
		break;
	case Kivg::SegmentType::QuadraticCurveTo:
		ostream << ", p1: " << segment.as.bezier2.p1 << ", p2: " << segment.as.bezier2.p2;
		break;
	case Kivg::SegmentType::CubicCurveTo:
		ostream << ", p1: " << segment.as.bezier3.p1 << ", p2: " << segment.as.bezier3.p2 << ", p3: " << segment.as.bezier3.p3;
		break;
	case Kivg::SegmentType::ArcTo:
		ostream << ", radius: " << segment.as.arc.radius
			<< ", rotation: " << segment.as.arc.xAxisRotation
			<< ", largeArc: " << (segment.as.arc.largeArcFlag ? "true" : "false")
			<< ", sweep: " << (segment.as.arc.sweepFlag ? "true" : "false")
			<< ", p1: " << segment.as.arc.p1;
		break;
	case Kivg::SegmentType::None:
	case Kivg::SegmentType::Length:
		break;
	}
	ostream << "}";
	return ostream;
}

CppUtils::Stream& operator<<(CppUtils::Stream& ostream, const Kivg::SubPath& subpath)
{
	ostream << "SubPath{closed: " << (subpath.isClosed ? "true" : "false") << ", segments: [";
	for (size_t i = 0; i < subpath.segments.size(); i++)
	{
		ostream << subpath.segments[i];
		if (i + 1 < subpath.segments.size())
		{
			ostream << ", ";
		}
	}
	ostream << "]}";
	return ostream;
}
