#include "svg/Tessellator.h"
#include "math/CMath.h"

#include <algorithm>
#include <map>
#include <set>

namespace Kivg
{
	namespace Tessellator
	{
		enum class ContourType : uint8
		{
			Outer = 0,
			Hole
		};

		struct Contour
		{
			std::vector<Vec2> points;
			// Index of this contour's first vertex in the mesh
			uint32 firstVertex;
			float area;
			ContourType type;
		};

		// Input edge together with the points where other edges cross or touch it
		struct ArrangementEdge
		{
			Vec2 p0;
			Vec2 p1;
			std::vector<std::pair<float, Vec2>> splits;
		};

		// Piece of the fill boundary, the filled side is on its left
		struct BoundaryEdge
		{
			uint32 from;
			uint32 to;
			bool used;
		};

		// ----------------- Internal functions -----------------
		static void pushUniquePoint(std::vector<Vec2>& points, const Vec2& point);
		static void flattenSegment(const Segment& segment, int resolution, std::vector<Vec2>& points);
		static int windingNumber(const std::vector<Vec2>& points, const Vec2& point);
		static int totalWinding(const std::vector<std::vector<Vec2>>& rings, const Vec2& point);
		static bool isFilled(int winding, FillType fillType);
		static float sideOffset(float edgeLength);
		static void splitAtIntersections(std::vector<ArrangementEdge>& edges);
		static void addCollinearSplit(ArrangementEdge& edge, const Vec2& point);
		static void extractBoundary(std::vector<ArrangementEdge>& edges, const std::vector<std::vector<Vec2>>& rings, FillType fillType, std::vector<Vec2>& vertices, std::vector<BoundaryEdge>& boundary);
		static void traceLoops(const std::vector<Vec2>& vertices, std::vector<BoundaryEdge>& boundary, std::vector<Contour>& contours);
		static Vec2 pointInsideHole(const Contour& hole);
		static bool bridgeHole(std::vector<uint32>& polygon, const Contour& hole, const std::vector<Vec2>& vertices, const std::vector<const Contour*>& unbridgedHoles);
		static bool segmentsIntersect(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d);
		static bool pointInTriangle(const Vec2& p, const Vec2& a, const Vec2& b, const Vec2& c);
		static void earClip(std::vector<uint32> polygon, const std::vector<Vec2>& vertices, std::vector<uint32>& indices);

		void flatten(const SubPath& subpath, int resolution, float arcTolerance, Polyline& out)
		{
			out.points.clear();
			out.isClosed = subpath.isClosed;
			resolution = glm::max(resolution, 1);

			std::vector<Segment> arcCubics;
			for (const Segment& segment : subpath.segments)
			{
				switch (segment.type)
				{
				case SegmentType::MoveTo:
					pushUniquePoint(out.points, segment.as.line.p1);
					break;
				case SegmentType::ArcTo:
					arcCubics.clear();
					Svg::arcToCubics(segment, arcTolerance, arcCubics);
					for (const Segment& cubic : arcCubics)
					{
						flattenSegment(cubic, resolution, out.points);
					}
					break;
				default:
					flattenSegment(segment, resolution, out.points);
					break;
				}
			}

			if (out.isClosed && out.points.size() > 1 && out.points.front() == out.points.back())
			{
				out.points.pop_back();
			}

			// Two points can't enclose anything, stroke them as a line
			if (out.points.size() < 3)
			{
				out.isClosed = false;
			}
		}

		Mesh tessellate(const SubPath& subpath, int resolution)
		{
			Polyline polyline;
			flatten(subpath, resolution, defaultArcTolerance, polyline);
			return triangulate({ polyline }, FillType::NonZeroFillType);
		}

		Mesh tessellate(const std::vector<SubPath>& subpaths, FillType fillType, int resolution, float arcTolerance)
		{
			std::vector<Polyline> contours;
			for (const SubPath& subpath : subpaths)
			{
				Polyline polyline;
				flatten(subpath, resolution, arcTolerance, polyline);
				contours.emplace_back(std::move(polyline));
			}

			return triangulate(contours, fillType);
		}

		Mesh triangulate(const std::vector<Polyline>& polylines, FillType fillType)
		{
			// Open subpaths are filled as if they were closed
			std::vector<std::vector<Vec2>> rings;
			for (const Polyline& polyline : polylines)
			{
				if (polyline.points.size() < 3)
				{
					continue;
				}

				std::vector<Vec2> ring = polyline.points;
				if (ring.front() == ring.back())
				{
					ring.pop_back();
				}

				if (ring.size() >= 3)
				{
					rings.emplace_back(std::move(ring));
				}
			}

			// Once every crossing is a vertex, the fill state is constant along each side
			// of every edge and the boundary between filled and empty regions is a set
			// of simple loops
			std::vector<ArrangementEdge> edges;
			for (const std::vector<Vec2>& ring : rings)
			{
				for (size_t i = 0; i < ring.size(); i++)
				{
					const Vec2& a = ring[i];
					const Vec2& b = ring[(i + 1) % ring.size()];
					if (a != b)
					{
						edges.push_back({ a, b, {} });
					}
				}
			}
			splitAtIntersections(edges);

			std::vector<Vec2> arrangementVertices;
			std::vector<BoundaryEdge> boundary;
			extractBoundary(edges, rings, fillType, arrangementVertices, boundary);

			// Outer boundaries wind counter-clockwise and holes clockwise
			std::vector<Contour> contours;
			traceLoops(arrangementVertices, boundary, contours);

			// Every hole belongs to the smallest outer boundary that contains it
			Mesh res = {};
			std::vector<std::vector<size_t>> holesByOuter(contours.size());
			for (size_t h = 0; h < contours.size(); h++)
			{
				if (contours[h].type != ContourType::Hole)
				{
					continue;
				}

				Vec2 insideHole = pointInsideHole(contours[h]);
				int bestOuter = -1;
				for (size_t i = 0; i < contours.size(); i++)
				{
					if (contours[i].type != ContourType::Outer || windingNumber(contours[i].points, insideHole) == 0)
					{
						continue;
					}

					if (bestOuter == -1 || glm::abs(contours[i].area) < glm::abs(contours[bestOuter].area))
					{
						bestOuter = (int)i;
					}
				}

				if (bestOuter != -1)
				{
					holesByOuter[bestOuter].emplace_back(h);
				}
			}

			for (size_t i = 0; i < contours.size(); i++)
			{
				if (contours[i].type != ContourType::Outer)
				{
					continue;
				}

				// Only add vertices of contours that end up in the mesh
				std::vector<const Contour*> holes;
				contours[i].firstVertex = (uint32)res.vertices.size();
				res.vertices.insert(res.vertices.end(), contours[i].points.begin(), contours[i].points.end());
				for (size_t h : holesByOuter[i])
				{
					contours[h].firstVertex = (uint32)res.vertices.size();
					res.vertices.insert(res.vertices.end(), contours[h].points.begin(), contours[h].points.end());
					holes.emplace_back(&contours[h]);
				}

				std::vector<uint32> polygon;
				for (uint32 v = 0; v < (uint32)contours[i].points.size(); v++)
				{
					polygon.emplace_back(contours[i].firstVertex + v);
				}

				// Bridge the holes from right to left so each bridge only has to avoid
				// the holes that haven't been merged yet
				std::sort(holes.begin(), holes.end(), [](const Contour* a, const Contour* b) {
					float maxA = -FLT_MAX;
					float maxB = -FLT_MAX;
					for (const Vec2& p : a->points) maxA = glm::max(maxA, p.x);
					for (const Vec2& p : b->points) maxB = glm::max(maxB, p.x);
					return maxA > maxB;
				});

				for (size_t h = 0; h < holes.size(); h++)
				{
					std::vector<const Contour*> unbridged(holes.begin() + h + 1, holes.end());
					if (!bridgeHole(polygon, *holes[h], res.vertices, unbridged))
					{
						g_logger_warning("Could not find a bridge for a hole with {} points. The hole will be filled.", holes[h]->points.size());
					}
				}

				earClip(polygon, res.vertices, res.indices);
			}

			if (res.indices.empty())
			{
				res.clear();
			}

			return res;
		}

		Mesh strokePolyline(const std::vector<Vec2>& inPoints, float width, bool closed)
		{
			Mesh res = {};
			if (width <= 0.0f)
			{
				return res;
			}

			std::vector<Vec2> points;
			for (const Vec2& point : inPoints)
			{
				pushUniquePoint(points, point);
			}
			if (closed && points.size() > 2 && points.front() == points.back())
			{
				points.pop_back();
			}
			closed = closed && points.size() > 2;

			if (points.size() < 2)
			{
				return res;
			}

			float halfWidth = width / 2.0f;
			size_t numEdges = closed ? points.size() : points.size() - 1;
			auto edgeNormal = [&](size_t edge) {
				Vec2 direction = CMath::normalize(points[(edge + 1) % points.size()] - points[edge]);
				return Vec2{ -direction.y, direction.x } * halfWidth;
			};

			for (size_t edge = 0; edge < numEdges; edge++)
			{
				const Vec2& start = points[edge];
				const Vec2& end = points[(edge + 1) % points.size()];
				Vec2 normal = edgeNormal(edge);

				uint32 first = (uint32)res.vertices.size();
				res.vertices.emplace_back(start + normal);
				res.vertices.emplace_back(start - normal);
				res.vertices.emplace_back(end - normal);
				res.vertices.emplace_back(end + normal);
				res.indices.insert(res.indices.end(), { first, first + 1, first + 2, first, first + 2, first + 3 });
			}

			// Bevel joins fill the wedge on the outside of every turn
			size_t firstJoin = closed ? 0 : 1;
			for (size_t joint = firstJoin; joint < numEdges; joint++)
			{
				size_t prevEdge = (joint + numEdges - 1) % numEdges;
				size_t nextEdge = joint % numEdges;
				const Vec2& corner = points[joint % points.size()];
				Vec2 prevDirection = points[joint % points.size()] - points[prevEdge];
				Vec2 nextDirection = points[(nextEdge + 1) % points.size()] - corner;
				float turn = CMath::cross(prevDirection, nextDirection);
				if (CMath::compare(turn, 0.0f, 1e-9f))
				{
					continue;
				}

				float side = turn > 0.0f ? -1.0f : 1.0f;
				uint32 first = (uint32)res.vertices.size();
				res.vertices.emplace_back(corner);
				res.vertices.emplace_back(corner + edgeNormal(prevEdge) * side);
				res.vertices.emplace_back(corner + edgeNormal(nextEdge) * side);
				res.indices.insert(res.indices.end(), { first, first + 1, first + 2 });
			}

			return res;
		}

		std::vector<Vec2> truncatePolyline(const std::vector<Vec2>& points, bool closed, float fraction)
		{
			std::vector<Vec2> res;
			if (points.empty())
			{
				return res;
			}

			std::vector<Vec2> path = points;
			if (closed && points.size() > 2)
			{
				path.emplace_back(points.front());
			}

			fraction = glm::clamp(fraction, 0.0f, 1.0f);
			if (fraction >= 1.0f)
			{
				return path;
			}

			float targetLength = fraction * polylineLength(points, closed);
			float walked = 0.0f;
			res.emplace_back(path[0]);
			for (size_t i = 1; i < path.size(); i++)
			{
				float edgeLength = CMath::length(path[i] - path[i - 1]);
				if (walked + edgeLength >= targetLength)
				{
					if (edgeLength > 0.0f)
					{
						float t = (targetLength - walked) / edgeLength;
						res.emplace_back(CMath::interpolate(t, path[i - 1], path[i]));
					}
					break;
				}

				walked += edgeLength;
				res.emplace_back(path[i]);
			}

			return res;
		}

		float polylineLength(const std::vector<Vec2>& points, bool closed)
		{
			float length = 0.0f;
			for (size_t i = 1; i < points.size(); i++)
			{
				length += CMath::length(points[i] - points[i - 1]);
			}

			if (closed && points.size() > 2)
			{
				length += CMath::length(points.front() - points.back());
			}

			return length;
		}

		float meshArea(const Mesh& mesh)
		{
			float area = 0.0f;
			for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3)
			{
				const Vec2& a = mesh.vertices[mesh.indices[i + 0]];
				const Vec2& b = mesh.vertices[mesh.indices[i + 1]];
				const Vec2& c = mesh.vertices[mesh.indices[i + 2]];
				area += glm::abs(CMath::cross(b - a, c - a)) / 2.0f;
			}

			return area;
		}

		void tessellatePath(PathModel& path, int resolution, float arcTolerance)
		{
			path.outlines.clear();
			for (const SubPath& subpath : path.subpaths)
			{
				Polyline polyline;
				flatten(subpath, resolution, arcTolerance, polyline);
				if (polyline.points.size() >= 2)
				{
					path.outlines.emplace_back(std::move(polyline));
				}
			}

			path.fillMesh = triangulate(path.outlines, path.fillType);
			path.visibleMesh.clear();
			path.bbox = Svg::calculateBBox(path.subpaths);
			path.approximatePerimeter = Svg::calculateApproximatePerimeter(path.outlines);
		}

		// ----------------- Internal functions -----------------
		static void pushUniquePoint(std::vector<Vec2>& points, const Vec2& point)
		{
			if (points.empty() || points.back() != point)
			{
				points.emplace_back(point);
			}
		}

		static void flattenSegment(const Segment& segment, int resolution, std::vector<Vec2>& points)
		{
			switch (segment.type)
			{
			case SegmentType::LineTo:
			case SegmentType::ClosePath:
				pushUniquePoint(points, segment.as.line.p1);
				break;
			case SegmentType::QuadraticCurveTo:
				for (int i = 1; i <= resolution; i++)
				{
					float t = (float)i / (float)resolution;
					pushUniquePoint(points, CMath::bezier2(segment.p0, segment.as.bezier2.p1, segment.as.bezier2.p2, t));
				}
				break;
			case SegmentType::CubicCurveTo:
				for (int i = 1; i <= resolution; i++)
				{
					float t = (float)i / (float)resolution;
					pushUniquePoint(points, CMath::bezier3(segment.p0, segment.as.bezier3.p1, segment.as.bezier3.p2, segment.as.bezier3.p3, t));
				}
				break;
			case SegmentType::MoveTo:
			case SegmentType::ArcTo:
			case SegmentType::None:
			case SegmentType::Length:
				break;
			}
		}

		static int windingNumber(const std::vector<Vec2>& points, const Vec2& point)
		{
			int winding = 0;
			for (size_t i = 0; i < points.size(); i++)
			{
				const Vec2& a = points[i];
				const Vec2& b = points[(i + 1) % points.size()];
				float side = CMath::cross(b - a, point - a);
				if (a.y <= point.y)
				{
					if (b.y > point.y && side > 0.0f)
					{
						winding++;
					}
				}
				else if (b.y <= point.y && side < 0.0f)
				{
					winding--;
				}
			}

			return winding;
		}

		static bool isFilled(int winding, FillType fillType)
		{
			return fillType == FillType::EvenOddFillType
				? (winding % 2) != 0
				: winding != 0;
		}

		static int totalWinding(const std::vector<std::vector<Vec2>>& rings, const Vec2& point)
		{
			int winding = 0;
			for (const std::vector<Vec2>& ring : rings)
			{
				winding += windingNumber(ring, point);
			}

			return winding;
		}

		static float sideOffset(float edgeLength)
		{
			return glm::clamp(edgeLength * 1e-3f, 1e-4f, 1e-2f);
		}

		static void splitAtIntersections(std::vector<ArrangementEdge>& edges)
		{
			constexpr float endpointEpsilon = 1e-5f;

			for (size_t i = 0; i < edges.size(); i++)
			{
				for (size_t j = i + 1; j < edges.size(); j++)
				{
					ArrangementEdge& e = edges[i];
					ArrangementEdge& f = edges[j];
					if (glm::max(e.p0.x, e.p1.x) < glm::min(f.p0.x, f.p1.x) || glm::max(f.p0.x, f.p1.x) < glm::min(e.p0.x, e.p1.x) ||
						glm::max(e.p0.y, e.p1.y) < glm::min(f.p0.y, f.p1.y) || glm::max(f.p0.y, f.p1.y) < glm::min(e.p0.y, e.p1.y))
					{
						continue;
					}

					Vec2 r = e.p1 - e.p0;
					Vec2 s = f.p1 - f.p0;
					Vec2 offset = f.p0 - e.p0;
					float denominator = CMath::cross(r, s);
					if (CMath::abs(denominator) > 1e-7f * CMath::length(r) * CMath::length(s))
					{
						float t = CMath::cross(offset, s) / denominator;
						float u = CMath::cross(offset, r) / denominator;
						if (t < -endpointEpsilon || t > 1.0f + endpointEpsilon || u < -endpointEpsilon || u > 1.0f + endpointEpsilon)
						{
							continue;
						}

						bool insideE = t > endpointEpsilon && t < 1.0f - endpointEpsilon;
						bool insideF = u > endpointEpsilon && u < 1.0f - endpointEpsilon;
						if (!insideE && !insideF)
						{
							// Edges meeting at an endpoint
							continue;
						}

						// Reuse the endpoint when one edge only touches the other so both
						// edges end up sharing the exact same vertex
						Vec2 point = !insideE
							? (t < 0.5f ? e.p0 : e.p1)
							: !insideF
								? (u < 0.5f ? f.p0 : f.p1)
								: e.p0 + r * t;
						if (insideE)
						{
							e.splits.emplace_back(t, point);
						}
						if (insideF)
						{
							f.splits.emplace_back(u, point);
						}
						continue;
					}

					// Parallel edges only split each other when they overlap on the same line
					if (CMath::abs(CMath::cross(r, offset)) > 1e-5f * CMath::lengthSquared(r))
					{
						continue;
					}

					addCollinearSplit(e, f.p0);
					addCollinearSplit(e, f.p1);
					addCollinearSplit(f, e.p0);
					addCollinearSplit(f, e.p1);
				}
			}
		}

		static void addCollinearSplit(ArrangementEdge& edge, const Vec2& point)
		{
			constexpr float endpointEpsilon = 1e-5f;

			Vec2 direction = edge.p1 - edge.p0;
			float t = CMath::dot(point - edge.p0, direction) / CMath::lengthSquared(direction);
			if (t > endpointEpsilon && t < 1.0f - endpointEpsilon)
			{
				edge.splits.emplace_back(t, point);
			}
		}

		static void extractBoundary(std::vector<ArrangementEdge>& edges, const std::vector<std::vector<Vec2>>& rings, FillType fillType, std::vector<Vec2>& vertices, std::vector<BoundaryEdge>& boundary)
		{
			std::map<std::pair<float, float>, uint32> vertexIds;
			std::set<std::pair<uint32, uint32>> visitedEdges;

			auto vertexId = [&](const Vec2& point) {
				std::pair<float, float> key = { point.x, point.y };
				auto iter = vertexIds.find(key);
				if (iter != vertexIds.end())
				{
					return iter->second;
				}

				uint32 id = (uint32)vertices.size();
				vertexIds[key] = id;
				vertices.emplace_back(point);
				return id;
			};

			auto addPiece = [&](const Vec2& a, const Vec2& b) {
				uint32 from = vertexId(a);
				uint32 to = vertexId(b);
				if (from == to)
				{
					return;
				}

				// Overlapping edges are only looked at once
				if (!visitedEdges.insert({ std::min(from, to), std::max(from, to) }).second)
				{
					return;
				}

				float length = CMath::length(b - a);
				Vec2 direction = (b - a) / length;
				Vec2 normal = Vec2{ -direction.y, direction.x } * sideOffset(length);
				Vec2 midpoint = (a + b) / 2.0f;
				bool leftFilled = isFilled(totalWinding(rings, midpoint + normal), fillType);
				bool rightFilled = isFilled(totalWinding(rings, midpoint - normal), fillType);
				if (leftFilled == rightFilled)
				{
					return;
				}

				boundary.push_back(leftFilled ? BoundaryEdge{ from, to, false } : BoundaryEdge{ to, from, false });
			};

			for (ArrangementEdge& edge : edges)
			{
				std::sort(edge.splits.begin(), edge.splits.end(), [](const std::pair<float, Vec2>& a, const std::pair<float, Vec2>& b) {
					return a.first < b.first;
				});

				Vec2 previous = edge.p0;
				for (const std::pair<float, Vec2>& split : edge.splits)
				{
					if (split.second != previous)
					{
						addPiece(previous, split.second);
						previous = split.second;
					}
				}

				if (edge.p1 != previous)
				{
					addPiece(previous, edge.p1);
				}
			}
		}

		static void traceLoops(const std::vector<Vec2>& vertices, std::vector<BoundaryEdge>& boundary, std::vector<Contour>& contours)
		{
			std::vector<std::vector<size_t>> outgoing(vertices.size());
			for (size_t i = 0; i < boundary.size(); i++)
			{
				outgoing[boundary[i].from].emplace_back(i);
			}

			for (size_t start = 0; start < boundary.size(); start++)
			{
				if (boundary[start].used)
				{
					continue;
				}

				std::vector<Vec2> loop;
				size_t current = start;
				bool closed = false;
				for (size_t step = 0; step < boundary.size(); step++)
				{
					boundary[current].used = true;
					loop.emplace_back(vertices[boundary[current].from]);

					// The sharpest left turn keeps loops that touch at a vertex apart
					uint32 corner = boundary[current].to;
					Vec2 back = vertices[boundary[current].from] - vertices[corner];
					float backAngle = glm::atan(back.y, back.x);
					bool found = false;
					size_t next = 0;
					float smallestTurn = FLT_MAX;
					for (size_t candidate : outgoing[corner])
					{
						if (boundary[candidate].used && candidate != start)
						{
							continue;
						}

						Vec2 direction = vertices[boundary[candidate].to] - vertices[corner];
						float turn = backAngle - glm::atan(direction.y, direction.x);
						while (turn <= 0.0f)
						{
							turn += 2.0f * CMath::PI;
						}
						while (turn > 2.0f * CMath::PI)
						{
							turn -= 2.0f * CMath::PI;
						}

						if (turn < smallestTurn)
						{
							smallestTurn = turn;
							next = candidate;
							found = true;
						}
					}

					if (!found)
					{
						break;
					}

					if (next == start)
					{
						closed = true;
						break;
					}

					current = next;
				}

				if (!closed)
				{
					g_logger_warning("Dropping a fill boundary with {} points that does not close.", loop.size());
					continue;
				}

				Contour contour = {};
				contour.points = std::move(loop);
				contour.area = CMath::signedArea(contour.points);
				contour.firstVertex = 0;
				if (contour.points.size() < 3 || CMath::compare(contour.area, 0.0f, 1e-6f))
				{
					continue;
				}

				contour.type = contour.area > 0.0f ? ContourType::Outer : ContourType::Hole;
				contours.emplace_back(std::move(contour));
			}
		}

		static Vec2 pointInsideHole(const Contour& hole)
		{
			// Holes wind clockwise, so their empty side is right of the longest edge
			size_t longestEdge = 0;
			float longestLength = -1.0f;
			for (size_t i = 0; i < hole.points.size(); i++)
			{
				float edgeLength = CMath::lengthSquared(hole.points[(i + 1) % hole.points.size()] - hole.points[i]);
				if (edgeLength > longestLength)
				{
					longestLength = edgeLength;
					longestEdge = i;
				}
			}

			const Vec2& a = hole.points[longestEdge];
			const Vec2& b = hole.points[(longestEdge + 1) % hole.points.size()];
			Vec2 direction = CMath::normalize(b - a);
			Vec2 leftNormal = Vec2{ -direction.y, direction.x } * sideOffset(glm::sqrt(longestLength));
			return (a + b) / 2.0f - leftNormal;
		}

		static bool bridgeHole(std::vector<uint32>& polygon, const Contour& hole, const std::vector<Vec2>& vertices, const std::vector<const Contour*>& unbridgedHoles)
		{
			// Start from the hole's rightmost point
			uint32 holeStart = 0;
			for (uint32 i = 1; i < (uint32)hole.points.size(); i++)
			{
				if (hole.points[i].x > hole.points[holeStart].x)
				{
					holeStart = i;
				}
			}
			const Vec2& m = hole.points[holeStart];

			// Closest polygon vertex whose bridge crosses no edge
			int best = -1;
			float bestDistance = FLT_MAX;
			for (size_t i = 0; i < polygon.size(); i++)
			{
				const Vec2& v = vertices[polygon[i]];
				float distance = CMath::lengthSquared(v - m);
				if (distance >= bestDistance)
				{
					continue;
				}

				bool blocked = false;
				for (size_t e = 0; e < polygon.size() && !blocked; e++)
				{
					blocked = segmentsIntersect(m, v, vertices[polygon[e]], vertices[polygon[(e + 1) % polygon.size()]]);
				}

				for (size_t e = 0; e < hole.points.size() && !blocked; e++)
				{
					blocked = segmentsIntersect(m, v, hole.points[e], hole.points[(e + 1) % hole.points.size()]);
				}

				for (size_t h = 0; h < unbridgedHoles.size() && !blocked; h++)
				{
					const std::vector<Vec2>& other = unbridgedHoles[h]->points;
					for (size_t e = 0; e < other.size() && !blocked; e++)
					{
						blocked = segmentsIntersect(m, v, other[e], other[(e + 1) % other.size()]);
					}
				}

				if (!blocked)
				{
					best = (int)i;
					bestDistance = distance;
				}
			}

			if (best == -1)
			{
				return false;
			}

			// ..., v, m, hole..., m, v, ...
			std::vector<uint32> bridged;
			bridged.reserve(polygon.size() + hole.points.size() + 2);
			bridged.insert(bridged.end(), polygon.begin(), polygon.begin() + best + 1);
			for (size_t i = 0; i <= hole.points.size(); i++)
			{
				bridged.emplace_back(hole.firstVertex + (uint32)((holeStart + i) % hole.points.size()));
			}
			bridged.emplace_back(polygon[best]);
			bridged.insert(bridged.end(), polygon.begin() + best + 1, polygon.end());
			polygon = std::move(bridged);
			return true;
		}

		static bool segmentsIntersect(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d)
		{
			// Edges that share an endpoint with the bridge don't block it
			if (a == c || a == d || b == c || b == d)
			{
				return false;
			}

			float d1 = CMath::cross(d - c, a - c);
			float d2 = CMath::cross(d - c, b - c);
			float d3 = CMath::cross(b - a, c - a);
			float d4 = CMath::cross(b - a, d - a);
			if (((d1 > 0.0f && d2 < 0.0f) || (d1 < 0.0f && d2 > 0.0f)) &&
				((d3 > 0.0f && d4 < 0.0f) || (d3 < 0.0f && d4 > 0.0f)))
			{
				return true;
			}

			// Touching counts as blocked
			auto onSegment = [](const Vec2& p, const Vec2& q, const Vec2& r) {
				return glm::min(p.x, q.x) <= r.x && r.x <= glm::max(p.x, q.x) &&
					glm::min(p.y, q.y) <= r.y && r.y <= glm::max(p.y, q.y);
			};
			return (d1 == 0.0f && onSegment(c, d, a)) ||
				(d2 == 0.0f && onSegment(c, d, b)) ||
				(d3 == 0.0f && onSegment(a, b, c)) ||
				(d4 == 0.0f && onSegment(a, b, d));
		}

		static bool pointInTriangle(const Vec2& p, const Vec2& a, const Vec2& b, const Vec2& c)
		{
			// Points on an edge count as inside
			float c1 = CMath::cross(b - a, p - a);
			float c2 = CMath::cross(c - b, p - b);
			float c3 = CMath::cross(a - c, p - c);
			bool hasNeg = c1 < 0.0f || c2 < 0.0f || c3 < 0.0f;
			bool hasPos = c1 > 0.0f || c2 > 0.0f || c3 > 0.0f;
			return !(hasNeg && hasPos);
		}

		static void earClip(std::vector<uint32> polygon, const std::vector<Vec2>& vertices, std::vector<uint32>& indices)
		{
			// The polygon winds counter-clockwise, an ear is a convex corner with no other
			// vertex inside its triangle
			size_t guard = 0;
			size_t maxIterations = polygon.size() * polygon.size() + 16;
			while (polygon.size() > 3 && guard++ < maxIterations)
			{
				bool earFound = false;
				for (size_t i = 0; i < polygon.size(); i++)
				{
					size_t i0 = (i + polygon.size() - 1) % polygon.size();
					size_t i2 = (i + 1) % polygon.size();
					const Vec2& a = vertices[polygon[i0]];
					const Vec2& b = vertices[polygon[i]];
					const Vec2& c = vertices[polygon[i2]];

					float turn = CMath::cross(b - a, c - b);
					if (turn == 0.0f)
					{
						// Collinear or duplicate corners add no area
						polygon.erase(polygon.begin() + i);
						earFound = true;
						break;
					}

					if (turn < 0.0f)
					{
						continue;
					}

					bool contains = false;
					for (size_t j = 0; j < polygon.size() && !contains; j++)
					{
						if (j == i0 || j == i || j == i2)
						{
							continue;
						}

						const Vec2& p = vertices[polygon[j]];
						// Bridge duplicates sit exactly on a corner
						if (p == a || p == b || p == c)
						{
							continue;
						}
						contains = pointInTriangle(p, a, b, c);
					}

					if (contains)
					{
						continue;
					}

					indices.insert(indices.end(), { polygon[i0], polygon[i], polygon[i2] });
					polygon.erase(polygon.begin() + i);
					earFound = true;
					break;
				}

				if (!earFound)
				{
					g_logger_warning("Ear clipping stalled with {} vertices left, the polygon may self intersect.", polygon.size());
					break;
				}
			}

			if (polygon.size() == 3)
			{
				const Vec2& a = vertices[polygon[0]];
				const Vec2& b = vertices[polygon[1]];
				const Vec2& c = vertices[polygon[2]];
				if (CMath::cross(b - a, c - b) != 0.0f)
				{
					indices.insert(indices.end(), { polygon[0], polygon[1], polygon[2] });
				}
			}
		}
	}
}
