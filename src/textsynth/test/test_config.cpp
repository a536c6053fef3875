#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include <boost/filesystem.hpp>

#include "textsynth/Config.h"
#include "textsynth/Errors.h"

using namespace TextSynth;
namespace fs = boost::filesystem;

TEST(ConfigTest, EmptyTextYieldsDefaults) {
  const textsynth::GeneratorParameter param = ParseGeneratorParameter("");
  EXPECT_DOUBLE_EQ(param.effect().box_prob(), 0.1);
  EXPECT_DOUBLE_EQ(param.effect().box_padding(), 1.3);
  EXPECT_DOUBLE_EQ(param.effect().perspective_prob(), 0.2);
  EXPECT_DOUBLE_EQ(param.effect().blur_prob(), 0.1);
  EXPECT_DOUBLE_EQ(param.effect().filter_prob(), 0.01);
  EXPECT_DOUBLE_EQ(param.effect().emboss_prob(), 0.4);
  EXPECT_DOUBLE_EQ(param.effect().sharp_prob(), 0.6);
  EXPECT_DOUBLE_EQ(param.merge().reverse_prob(), 0.5);
  EXPECT_EQ(param.merge().iterations(), 500);
  EXPECT_EQ(param.merge().mask_threshold(), 128);
  EXPECT_EQ(param.background().height(), 64);
  EXPECT_EQ(param.background().width(), 1000);
  EXPECT_EQ(param.seed(), -1);
}

TEST(ConfigTest, ParsesDistributions) {
  const textsynth::GeneratorParameter param = ParseGeneratorParameter(
        "effect { perspective_x { type: GAUSSIAN min: -20 max: 20 } }\n"
        "merge { font_alpha { min: 0.5 max: 0.9 } }\n"
        "seed: 3\n");
  ASSERT_TRUE(param.effect().has_perspective_x());
  const RNG::RandomVariable x =
        RandomVariableFromParameter(param.effect().perspective_x());
  EXPECT_EQ(x.kind(), RNG::RandomVariable::Kind::Gaussian);
  EXPECT_DOUBLE_EQ(x.min(), -20.);
  EXPECT_DOUBLE_EQ(x.max(), 20.);

  const RNG::RandomVariable font_alpha =
        RandomVariableFromParameter(param.merge().font_alpha());
  EXPECT_EQ(font_alpha.kind(), RNG::RandomVariable::Kind::Uniform);
  EXPECT_EQ(param.seed(), 3);
}

TEST(ConfigTest, AbsentDistributionFallsBack) {
  const textsynth::GeneratorParameter param = ParseGeneratorParameter("");
  const RNG::RandomVariable sigma = RandomVariableOrDefault(
        param.effect().has_blur_sigma(), param.effect().blur_sigma(),
        RNG::RandomVariable::uniform(0., 1.5));
  EXPECT_DOUBLE_EQ(sigma.max(), 1.5);
}

TEST(ConfigTest, InvalidValuesAreRejected) {
  EXPECT_THROW(ParseGeneratorParameter("effect { box_prob: 1.5 }"),
               InvalidConfiguration);
  EXPECT_THROW(ParseGeneratorParameter("merge { bg_beta { min: 5 max: 1 } }"),
               InvalidConfiguration);
  EXPECT_THROW(ParseGeneratorParameter("merge { iterations: 0 }"),
               InvalidConfiguration);
  EXPECT_THROW(ParseGeneratorParameter("background { height: 1 }"),
               InvalidConfiguration);
  EXPECT_THROW(ParseGeneratorParameter("effect { no_such_field: 1 }"),
               InvalidConfiguration);
}

TEST(ConfigTest, LoadsFromFile) {
  const fs::path file = fs::temp_directory_path() /
                        fs::unique_path("textsynth-%%%%-%%%%.prototxt");
  {
    std::ofstream out(file.string().c_str());
    out << "# test configuration\n"
        << "background { source: \"/tmp/bg\" height: 32 width: 320 }\n";
  }
  const textsynth::GeneratorParameter param =
        LoadGeneratorParameter(file.string());
  fs::remove(file);
  EXPECT_EQ(param.background().source(), "/tmp/bg");
  EXPECT_EQ(param.background().height(), 32);
  EXPECT_EQ(param.background().width(), 320);
}

TEST(ConfigTest, MissingFileIsRejected) {
  EXPECT_THROW(LoadGeneratorParameter("/nonexistent/textsynth.prototxt"),
               InvalidConfiguration);
}
