#ifndef KIVG_TESSELLATOR_H
#define KIVG_TESSELLATOR_H
#include "core.h"
#include "svg/Svg.h"

namespace Kivg
{
	namespace Tessellator
	{
		/**
		 * @brief Flattens a subpath into a polyline. Curves contribute `resolution` points,
		 *        lines contribute their endpoint and coincident consecutive points are merged.
		 *        A closed subpath does not repeat its first point at the end.
		 * @param subpath The subpath to flatten
		 * @param resolution Number of line segments used for each curve
		 * @param arcTolerance Tolerance used to split arcs into cubics before flattening
		 * @param out Receives the points
		*/
		void flatten(const SubPath& subpath, int resolution, float arcTolerance, Polyline& out);

		// Fill mesh of a single subpath under the nonzero rule
		Mesh tessellate(const SubPath& subpath, int resolution = defaultResolution);

		/**
		 * @brief Fill mesh of a shape made from several subpaths. Edges are split where
		 *        they cross, the edges separating filled from empty regions under the fill
		 *        rule are traced into outer boundaries and holes, holes are bridged into
		 *        their smallest enclosing boundary and the result is ear clipped.
		 *        Self intersecting and overlapping subpaths are covered exactly once.
		 * @return The mesh, empty when nothing encloses any area
		*/
		Mesh tessellate(const std::vector<SubPath>& subpaths, FillType fillType, int resolution = defaultResolution, float arcTolerance = defaultArcTolerance);

		Mesh triangulate(const std::vector<Polyline>& contours, FillType fillType);

		// One quad per segment plus bevel joins between consecutive segments
		Mesh strokePolyline(const std::vector<Vec2>& points, float width, bool closed);

		// The leading fraction of the polyline measured by arc length
		std::vector<Vec2> truncatePolyline(const std::vector<Vec2>& points, bool closed, float fraction);

		float polylineLength(const std::vector<Vec2>& points, bool closed);
		float meshArea(const Mesh& mesh);

		// Rebuilds the outlines, fill mesh, bounding box and perimeter of the path
		void tessellatePath(PathModel& path, int resolution, float arcTolerance);
	}
}

#endif
