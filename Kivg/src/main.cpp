#ifndef _KIVG_TESTS
#include "core.h"
#include "core/SvgAnimator.h"
#include "renderer/LoggingSurface.h"
#include "svg/Svg.h"

#include <nlohmann/json.hpp>

#include <fstream>

using namespace Kivg;

struct CliArgs
{
	std::string svgFile = "";
	std::string animationsFile = "";
	std::string trackPathId = "";
	bool rotate = false;
	bool animate = false;
	bool parallel = false;
	bool fill = true;
	bool verbose = false;
	float fps = 60.0f;
};

static void printUsage()
{
	g_logger_info("Usage: kivgCli <file.svg> [animations.json] [--animate] [--parallel] [--no-fill] [--track <pathId> [--rotate]] [--fps N] [--verbose]");
}

static bool parseArgs(int argc, char* argv[], CliArgs& out)
{
	for (int i = 1; i < argc; i++)
	{
		std::string arg = argv[i];
		if (arg == "--animate")
		{
			out.animate = true;
		}
		else if (arg == "--parallel")
		{
			out.parallel = true;
		}
		else if (arg == "--no-fill")
		{
			out.fill = false;
		}
		else if (arg == "--rotate")
		{
			out.rotate = true;
		}
		else if (arg == "--track")
		{
			if (i + 1 >= argc)
			{
				g_logger_error("Missing path id after --track.");
				return false;
			}

			out.trackPathId = argv[++i];
		}
		else if (arg == "--verbose")
		{
			out.verbose = true;
		}
		else if (arg == "--fps")
		{
			if (i + 1 >= argc)
			{
				g_logger_error("Missing value after --fps.");
				return false;
			}

			out.fps = std::strtof(argv[++i], nullptr);
			if (!(out.fps > 0.0f))
			{
				g_logger_error("Invalid frame rate '{}'.", argv[i]);
				return false;
			}
		}
		else if (arg.length() > 1 && arg[0] == '-')
		{
			g_logger_error("Unknown option '{}'.", arg);
			return false;
		}
		else if (out.svgFile.empty())
		{
			out.svgFile = arg;
		}
		else if (out.animationsFile.empty())
		{
			out.animationsFile = arg;
		}
		else
		{
			g_logger_error("Unexpected argument '{}'.", arg);
			return false;
		}
	}

	return !out.svgFile.empty();
}

static KivgError loadAnimationsFile(const std::string& filepath, std::vector<AnimationSpec>& out)
{
	std::ifstream file(filepath);
	if (!file.is_open())
	{
		g_logger_error("Could not open animation config '{}'.", filepath);
		return KivgError::InvalidConfiguration;
	}

	try
	{
		nlohmann::json j = nlohmann::json::parse(file, nullptr, true, true);
		return Animation::loadAnimationSpecs(j, out);
	}
	catch (nlohmann::json::parse_error& ex)
	{
		g_logger_error("Could not load animation config '{}' as Json.\n\tJson Error: '{}'", filepath, ex.what());
	}

	return KivgError::InvalidConfiguration;
}

int main(int argc, char* argv[])
{
	g_logger_init();
	g_memory_init_padding(true, 5);

	CliArgs args = {};
	if (!parseArgs(argc, argv, args))
	{
		printUsage();
		return 1;
	}

	std::vector<AnimationSpec> specs;
	if (!args.animationsFile.empty())
	{
		KivgError error = loadAnimationsFile(args.animationsFile, specs);
		if (error != KivgError::None)
		{
			return 1;
		}
	}

	LoggingSurface surface = LoggingSurface(Vec2{ 0.0f, 0.0f }, Vec2{ 512.0f, 512.0f }, args.verbose);
	FixedStepScheduler scheduler = FixedStepScheduler(args.fps);

	SvgAnimatorData* animator = SvgAnimator::create(&surface);
	SvgAnimator::bindScheduler(animator, &scheduler);

	int exitCode = 0;
	KivgError error = SvgAnimator::loadDocumentFile(animator, args.svgFile.c_str());
	if (error != KivgError::None)
	{
		g_logger_error("Failed to load '{}': {}", args.svgFile, error);
		exitCode = 1;
	}
	else
	{
		for (const PathLoadError& loadError : SvgAnimator::getDocument(animator)->errors)
		{
			g_logger_warning("Path {} ('{}'): {} {}", loadError.pathIndex, loadError.id, loadError.error, loadError.message);
		}

		bool finished = false;
		if (!args.trackPathId.empty())
		{
			TrackOptions options = {};
			options.rotate = args.rotate;
			error = SvgAnimator::animateAlongPath(animator, args.trackPathId, options, [&finished]() { finished = true; });
		}
		else if (args.animationsFile.empty())
		{
			DrawOptions options = {};
			options.animate = args.animate;
			options.fill = args.fill;
			options.animType = args.parallel ? RevealMode::Parallel : RevealMode::Sequential;
			error = SvgAnimator::draw(animator, options, [&finished]() { finished = true; });
		}
		else
		{
			error = SvgAnimator::shapeAnimate(animator, specs, [&finished]() { finished = true; });
		}

		if (error != KivgError::None)
		{
			g_logger_error("Failed to start the animation: {}", error);
			exitCode = 1;
		}
		else
		{
			// Keeps a broken document from spinning forever
			constexpr uint32 maxFrames = 60 * 60 * 10;
			while (SvgAnimator::isAnimating(animator) && surface.getFrameCount() < maxFrames)
			{
				scheduler.step();
			}

			g_logger_info("Finished after {} frames, {} seconds ({} mesh submissions), completion callback {}.",
				surface.getFrameCount(), (float)surface.getFrameCount() * scheduler.getFrameTime(), surface.getTotalSubmissions(),
				finished ? "fired" : "did not fire");
			g_logger_info("Last frame: {} meshes, {} triangles.", surface.getLastFrameSubmissions(), surface.getLastFrameTriangles());
		}
	}

	SvgAnimator::free(animator);
	g_memory_dumpMemoryLeaks();
	return exitCode;
}

#endif
