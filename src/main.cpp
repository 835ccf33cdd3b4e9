#include "spray/Config.h" // This should always be first
#include "scene.hpp"
#include "image.hpp"
#include "path_tracer.hpp"
#include "random.hpp"
#include "sampler.hpp"

#include "logging.hpp" // This should always be last

static void traceScene(const Scene &scene, Image &image, const RenderOptions &opts) {
	RandomSource rng(opts.seed);
	const Camera camera = opts.makeCamera();
	const PathTracer tracer(rng);
	monte_carlo_sampler::render(scene, camera, image, tracer, opts.path_opts, rng);
}

using namespace std;
int main(int argc, char *argv[])
{
	if (argc > 3) {
		cerr << "usage: " << argv[0] << " [<input.json> [<output.ppm|bmp|png|tga>]]\n";
		return 1;
	}
	RenderOptions opts;
	if (argc >= 2) opts.filename = argv[1];
	StageLogger logger(opts);
	logger.dump_config();
	logger.start();
	if (argc >= 2 && !LoadJob(argv[1], &opts)) return 1;
	if (argc == 3) opts.output = argv[2];

	Scene scene;
	if (!LoadScene(opts, &scene)) return 1;
	if (scene.empty()) cout << "scene is empty\n";

	Image image(opts.resolution);
#ifdef WITH_PROGRESS
	logger.image = &image;
#endif
	logger.startPreprocessing(scene);
	logger.startRendering();
	traceScene(scene, image, opts);

	logger.startOutput();
	if (!image.save(opts.output)) return 1;

	logger.finish();
	logger.log();
	return 0;
}
