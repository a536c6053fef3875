#ifndef TEXTSYNTH_CONFIG_H__
#define TEXTSYNTH_CONFIG_H__

/// System/STL
#include <string>

/// Protobuf
#include <google/protobuf/message.h>

#include "textsynth/proto/textsynth.pb.h"
#include "textsynth/SimpleRandom.h"

namespace TextSynth {

  /**
   * Parse a text-format protobuf file into proto. Returns false if the file
   * cannot be opened or does not parse.
   */
  bool ReadProtoFromTextFile(const std::string& filename,
                             google::protobuf::Message* proto);

  /// Load and validate a generator configuration (throws InvalidConfiguration)
  textsynth::GeneratorParameter LoadGeneratorParameter(
        const std::string& filename);

  /// Parse and validate a configuration held in a string
  textsynth::GeneratorParameter ParseGeneratorParameter(
        const std::string& text);

  /// Distribution described by a RandomParameter message
  RNG::RandomVariable RandomVariableFromParameter(
        const textsynth::RandomParameter& param);

  /// RandomVariableFromParameter, or fallback if the field is not set
  RNG::RandomVariable RandomVariableOrDefault(
        bool has_param,
        const textsynth::RandomParameter& param,
        const RNG::RandomVariable& fallback);

  /// Throws InvalidConfiguration unless 0 <= value <= 1
  void CheckProbability(double value, const char* name);

}  /// namespace TextSynth

#endif  // TEXTSYNTH_CONFIG_H__
