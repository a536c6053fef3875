/// System/STL
#include <cstdio>
#include <map>
#include <string>
/// gflags / glog
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "textsynth/Config.h"
#include "textsynth/EffectPipeline.h"
#include "textsynth/Errors.h"
#include "textsynth/Generator.h"
#include "textsynth/Image.h"
#include "textsynth/PerspectiveWarp.h"

using namespace TextSynth;

DEFINE_string(config, "",
    "Text-format GeneratorParameter file; built-in defaults if empty.");
DEFINE_string(input, "",
    "Rendered text raster (PNG or JPEG).");
DEFINE_string(output, "",
    "Output image. compose with --count > 1 inserts _%04d before the "
    "extension.");
DEFINE_int32(seed, -1,
    "Random seed; overrides the configuration when >= 0.");
DEFINE_int32(count, 1,
    "compose: number of samples to generate from the input.");
DEFINE_bool(noeffect, false,
    "compose: skip effects and blending, only convert the input.");
DEFINE_double(rx, 0., "warp: rotation around the x axis (degrees).");
DEFINE_double(ry, 0., "warp: rotation around the y axis (degrees).");
DEFINE_double(rz, 0., "warp: rotation around the z axis (degrees).");

typedef int (*CommandFunction)();
typedef std::map<std::string, CommandFunction> CommandMap;


namespace {

  textsynth::GeneratorParameter loadParameter()
  {
    textsynth::GeneratorParameter param;
    if (not FLAGS_config.empty())
      param = LoadGeneratorParameter(FLAGS_config);
    if (FLAGS_seed >= 0)
      param.set_seed(FLAGS_seed);
    return param;
  }

  ImageU8 loadInput()
  {
    CHECK(not FLAGS_input.empty()) << "Need an --input image.";
    CHECK(not FLAGS_output.empty()) << "Need an --output path.";
    ImageU8 image;
    image.load(FLAGS_input.c_str());
    return image;
  }

  std::string numberedPath(const std::string& path, int index)
  {
    const std::string::size_type dot = path.rfind('.');
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "_%04d", index);
    if (dot == std::string::npos or path.find('/', dot) != std::string::npos)
      return path + suffix;
    return path.substr(0, dot) + suffix + path.substr(dot);
  }

}  // namespace


/// Effects, random background and blending
int compose()
{
  const textsynth::GeneratorParameter param(loadParameter());
  const ImageU8 raster(loadInput());
  CHECK_GT(FLAGS_count, 0) << "--count must be positive.";

  Generator generator(param);
  for (int i = 0; i < FLAGS_count; ++i) {
    const ImageU8 sample(generator.generate(raster, not FLAGS_noeffect));
    const std::string path(FLAGS_count == 1 ? FLAGS_output
                                            : numberedPath(FLAGS_output, i));
    sample.save(path.c_str());
    LOG(INFO) << "Wrote " << path;
  }
  return 0;
}

/// Effect pipeline only
int effect()
{
  const textsynth::GeneratorParameter param(loadParameter());
  const ImageU8 raster(toGrayscale(loadInput()));

  RNG::RandomSource rng(param.seed());
  const ImageU8 result(applyEffect(raster, param.effect(), rng));
  result.save(FLAGS_output.c_str());
  LOG(INFO) << "Wrote " << FLAGS_output;
  return 0;
}

/// Perspective warp with explicit angles
int warp()
{
  const ImageU8 raster(toGrayscale(loadInput()));
  const ImageU8 result(warpPerspective(
        raster, Geometry::Rotation(FLAGS_rx, FLAGS_ry, FLAGS_rz)));
  result.save(FLAGS_output.c_str());
  LOG(INFO) << "Wrote " << FLAGS_output << " (" << result.width() << "x"
            << result.height() << ")";
  return 0;
}


int main(int argc, char** argv)
{
  FLAGS_alsologtostderr = 1;
  gflags::SetUsageMessage(
      "synthesizes OCR training samples from rendered text images\n"
      "usage: textsynth <command> <args>\n\n"
      "commands:\n"
      "  compose         effects + background blending\n"
      "  effect          effect pipeline only\n"
      "  warp            perspective warp with --rx --ry --rz");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (argc != 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "tools/textsynth");
    return 1;
  }
  CommandMap commands;
  commands["compose"] = &compose;
  commands["effect"] = &effect;
  commands["warp"] = &warp;
  const CommandMap::const_iterator command = commands.find(argv[1]);
  if (command == commands.end()) {
    LOG(ERROR) << "Unknown command: " << argv[1];
    gflags::ShowUsageWithFlagsRestrict(argv[0], "tools/textsynth");
    return 1;
  }

  try {
    return command->second();
  } catch (const TextSynth::Error& e) {
    LOG(ERROR) << e.what();
  } catch (const cimg_library::CImgException& e) {
    LOG(ERROR) << "Image I/O failed: " << e.what();
  }
  return 1;
}
