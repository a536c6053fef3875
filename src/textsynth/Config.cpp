/// System/STL
#include <fcntl.h>
#include <unistd.h>
#include <sstream>
#include <string>
/// Protobuf
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>
/// glog
#include <glog/logging.h>

#include "textsynth/Config.h"
#include "textsynth/Errors.h"

using google::protobuf::io::FileInputStream;
using google::protobuf::Message;

namespace TextSynth {

  bool ReadProtoFromTextFile(const std::string& filename, Message* proto)
  {
    const int fd = open(filename.c_str(), O_RDONLY);
    if (fd == -1) {
      LOG(ERROR) << "File not found: " << filename;
      return false;
    }
    FileInputStream* input = new FileInputStream(fd);
    const bool success = google::protobuf::TextFormat::Parse(input, proto);
    delete input;
    close(fd);
    return success;
  }


  namespace {

    void CheckRandomParameter(bool has_param,
                              const textsynth::RandomParameter& param,
                              const char* name)
    {
      if (not has_param)
        return;
      if (not (param.min() <= param.max())) {
        std::ostringstream oss;
        oss << name << " has min " << param.min() << " > max "
            << param.max();
        throw InvalidConfiguration(oss.str());
      }
    }

    void ValidateGeneratorParameter(const textsynth::GeneratorParameter& param)
    {
      const textsynth::EffectParameter& effect = param.effect();
      CheckProbability(effect.box_prob(),         "effect.box_prob");
      CheckProbability(effect.perspective_prob(), "effect.perspective_prob");
      CheckProbability(effect.blur_prob(),        "effect.blur_prob");
      CheckProbability(effect.filter_prob(),      "effect.filter_prob");
      CheckProbability(effect.emboss_prob(),      "effect.emboss_prob");
      CheckProbability(effect.sharp_prob(),       "effect.sharp_prob");
      CheckRandomParameter(effect.has_perspective_x(), effect.perspective_x(),
                           "effect.perspective_x");
      CheckRandomParameter(effect.has_perspective_y(), effect.perspective_y(),
                           "effect.perspective_y");
      CheckRandomParameter(effect.has_perspective_z(), effect.perspective_z(),
                           "effect.perspective_z");
      CheckRandomParameter(effect.has_blur_sigma(), effect.blur_sigma(),
                           "effect.blur_sigma");

      const textsynth::MergeParameter& merge = param.merge();
      CheckProbability(merge.reverse_prob(), "merge.reverse_prob");
      CheckRandomParameter(merge.has_height_diff(), merge.height_diff(),
                           "merge.height_diff");
      CheckRandomParameter(merge.has_bg_alpha(), merge.bg_alpha(),
                           "merge.bg_alpha");
      CheckRandomParameter(merge.has_bg_beta(), merge.bg_beta(),
                           "merge.bg_beta");
      CheckRandomParameter(merge.has_font_alpha(), merge.font_alpha(),
                           "merge.font_alpha");
      if (merge.iterations() <= 0)
        throw InvalidConfiguration("merge.iterations must be positive");

      const textsynth::BackgroundParameter& background = param.background();
      if (background.height() < 2 or background.width() < 1) {
        std::ostringstream oss;
        oss << "background size " << background.width() << "x"
            << background.height() << " is too small";
        throw InvalidConfiguration(oss.str());
      }
    }

  }  // namespace


  textsynth::GeneratorParameter LoadGeneratorParameter(
        const std::string& filename)
  {
    textsynth::GeneratorParameter param;
    if (not ReadProtoFromTextFile(filename, &param))
      throw InvalidConfiguration("could not read config file "+filename);
    ValidateGeneratorParameter(param);
    LOG(INFO) << "Loaded configuration from " << filename;
    return param;
  }

  textsynth::GeneratorParameter ParseGeneratorParameter(
        const std::string& text)
  {
    textsynth::GeneratorParameter param;
    if (not google::protobuf::TextFormat::ParseFromString(text, &param))
      throw InvalidConfiguration("could not parse config text");
    ValidateGeneratorParameter(param);
    return param;
  }

  RNG::RandomVariable RandomVariableFromParameter(
        const textsynth::RandomParameter& param)
  {
    switch (param.type()) {
      case textsynth::RandomParameter::GAUSSIAN:
        return RNG::RandomVariable::gaussian(param.min(), param.max());
      case textsynth::RandomParameter::UNIFORM:
      default:
        return RNG::RandomVariable::uniform(param.min(), param.max());
    }
  }

  RNG::RandomVariable RandomVariableOrDefault(
        bool has_param,
        const textsynth::RandomParameter& param,
        const RNG::RandomVariable& fallback)
  {
    return (has_param ? RandomVariableFromParameter(param) : fallback);
  }

  void CheckProbability(double value, const char* name)
  {
    if (not (0. <= value and value <= 1.)) {
      std::ostringstream oss;
      oss << name << " = " << value << " is not a probability";
      throw InvalidConfiguration(oss.str());
    }
  }

}  /// namespace TextSynth
